/*
 * Depth limited filesystem walker (c)
 * by CGI Estonia AS
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "dwalk_log.h"

#include <iostream>
#include <map>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>  // Might be falsely flagged by CLion as unnecessary.
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace {
// Violating non-trivially destructible property. This is an exception.
const std::map<dwalk::log::Level, boost::log::trivial::severity_level> boost_level_map{
    {dwalk::log::Level::VERBOSE, boost::log::trivial::severity_level::trace},
    {dwalk::log::Level::DEBUG, boost::log::trivial::severity_level::debug},
    {dwalk::log::Level::INFO, boost::log::trivial::severity_level::info},
    {dwalk::log::Level::WARNING, boost::log::trivial::severity_level::warning},
    {dwalk::log::Level::ERROR, boost::log::trivial::severity_level::error}};

}  // namespace

namespace dwalk::log {

namespace expr = boost::log::expressions;

void Initialize(Format f) {
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    if (f == Format::PLAIN) {
        boost::log::add_console_log(std::cerr, boost::log::keywords::format = expr::stream << expr::smessage);
    } else {
        boost::log::add_console_log(
            std::cerr, boost::log::keywords::format =
                           expr::stream << "["
                                        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                                            "%Y-%m-%d %H:%M:%S.%f")
                                        << "] [" << boost::log::trivial::severity << "] " << expr::smessage);
    }

    SetLevel(Level::WARNING);
}

void SetLevel(Level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost_level_map.at(level));
}
}  // namespace dwalk::log
