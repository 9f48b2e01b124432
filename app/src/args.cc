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

#include "args.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>

namespace dwalk {

namespace po = boost::program_options;

void Args::Construct() {
    visible_args_.add_options()("help,h", po::bool_switch()->default_value(false), "Print help");

    // clang-format off
    visible_args_.add_options()
    ("path,p", po::value<std::vector<std::string>>(&paths_)->composing(),
        "Root path, wildcards (*, ? and [...]) are expanded and every match is walked. "
        "Can be given multiple times or as a positional argument.")
    ("literal_path,l", po::value<std::vector<std::string>>(&literal_paths_)->composing(),
        "Root path used exactly as typed, no wildcard expansion. Can be given multiple times. "
        "Exclusive with \"path\".")
    ("filter,f", po::value<std::string>(&filter_)->default_value("*"),
        "Entry name filter, glob style e.g. '*.dll'")
    ("depth,d", po::value<int>(&depth_arg_)->required(),
        "Maximum number of directory levels below the root that are listed, 0..255. "
        "0 lists only the immediate children of the root.")
    ("file", po::bool_switch(&files_only_)->default_value(false), "List only non-directory entries")
    ("ignore_case,i", po::bool_switch(&ignore_case_)->default_value(false),
        "Match the name filter case insensitively")
    ("follow_symlinks", po::bool_switch(&follow_symlinks_)->default_value(false),
        "Descend into symbolic links that point to directories. There is no cycle detection.")
    ("verbose,v", po::bool_switch(&verbose_)->default_value(false),
        "Same as \"--log verbose\", reports skipped subtrees")
    ("log", po::value<std::string>(&log_level_arg_)->default_value("warning"),
        "Log level, one of the following - verbose|debug|info|warning|error");

    hidden_args_.add_options()
        ("plain_log", po::bool_switch(&plain_log_)->default_value(false));

    args_.add(visible_args_).add(hidden_args_);
    positional_args_.add("path", -1);
    // clang-format on
}

void Args::Check() {
    boost::program_options::notify(vm_);

    if (paths_.empty() && literal_paths_.empty()) {
        throw std::invalid_argument("One of the arguments 'path' or 'literal_path' is required.");
    }
    if (!paths_.empty() && !literal_paths_.empty()) {
        throw std::invalid_argument("The arguments 'path' and 'literal_path' can not be used together.");
    }

    if (depth_arg_ < 0 || depth_arg_ > MAX_DEPTH) {
        throw std::invalid_argument("The argument 'depth' value " + std::to_string(depth_arg_) +
                                    " is out of range, valid values are 0.." + std::to_string(MAX_DEPTH));
    }
    depth_ = static_cast<uint8_t>(depth_arg_);

    log_level_ = verbose_ ? log::Level::VERBOSE : TryFetchLogLevelFrom(log_level_arg_);
}

log::Level Args::TryFetchLogLevelFrom(std::string_view level_arg) {
    constexpr std::array<std::string_view, 5> ALLOWED_LEVELS{"verbose", "debug", "info", "warning", "error"};
    constexpr std::array<log::Level, 5> LOG_LEVELS{log::Level::VERBOSE, log::Level::DEBUG, log::Level::INFO,
                                                   log::Level::WARNING, log::Level::ERROR};

    size_t level_index{0};
    for (const auto level_str : ALLOWED_LEVELS) {
        if (boost::iequals(level_arg, level_str)) {
            return LOG_LEVELS.at(level_index);
        }
        level_index++;
    }

    throw std::invalid_argument("'" + std::string(level_arg) +
                                "' is not a valid log level. Valid ones are - verbose|debug|info|warning|error");
}

Args::Args(const std::vector<char*>& args) {
    if (args.size() == 0) {
        throw std::logic_error("Programming error when supplying arguments to parser - arg array length is 0.");
    }
    Construct();
    po::store(po::command_line_parser(static_cast<int>(args.size()), args.data())
                  .options(args_)
                  .positional(positional_args_)
                  .run(),
              vm_);
    const auto argc = args.size();
    const auto check_help = [](const char* a) { return strcmp(a, "--help") == 0 || strcmp(a, "-h") == 0; };
    const auto has_help = std::find_if(args.cbegin(), args.cend(), check_help) != args.end();
    if (argc > 1 && !has_help) {
        Check();
    } else {
        precheck_help = true;
    }
}

bool Args::IsHelpRequested() const { return precheck_help; }

std::string Args::GetHelp() const {
    std::stringstream help;
    help << "Usage: depth_walk [--path] <pattern>... | --literal_path <path>... --depth <0..255> [options]"
         << std::endl;
    help << visible_args_;
    return help.str();
}

std::vector<walk::RootSpecification> Args::GetRootSpecifications() const {
    std::vector<walk::RootSpecification> specs;
    for (const auto& p : paths_) {
        specs.emplace_back(walk::PatternRoot{p});
    }
    for (const auto& p : literal_paths_) {
        specs.emplace_back(walk::LiteralRoot{p});
    }

    return specs;
}

walk::FilterCriteria Args::GetFilterCriteria() const {
    walk::FilterCriteria criteria{};
    criteria.name_pattern = filter_;
    criteria.entries_only = files_only_;
    criteria.ignore_case = ignore_case_;
    return criteria;
}

}  // namespace dwalk
