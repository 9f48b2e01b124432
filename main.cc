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

#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "VERSION"
#include "args.h"
#include "dwalk_log.h"
#include "status_assembly.h"
#include "walk_flow.h"

namespace {

template <typename T>
void ExceptionMessagePrint(const T& e) {
    LOGE << "Caught an exception";
    LOGE << e.what();
    LOGE << "Exiting.";
}

std::string GetSoftwareVersion() { return "depth_walk/" + std::string(VERSION_STRING); }

}  // namespace

int main(int argc, char* argv[]) {
    dwalk::log::Initialize();
    std::string args_help{};
    try {
        const std::vector<char*> args_raw(argv, argv + argc);
        dwalk::Args args(args_raw);
        args_help = args.GetHelp();
        if (args.IsHelpRequested()) {
            std::cout << GetSoftwareVersion() << std::endl;
            std::cout << args.GetHelp() << std::endl;
            return dwalk::status::SUCCESS;
        }

        if (args.IsPlainLog()) {
            dwalk::log::Initialize(dwalk::log::Format::PLAIN);
        }
        dwalk::log::SetLevel(args.GetLogLevel());
        LOGI << GetSoftwareVersion();

        return dwalk::mainflow::Run(args, std::cout);
    } catch (const boost::program_options::error& e) {
        ExceptionMessagePrint(e);
        std::cout << args_help << std::endl;
        return dwalk::status::INVALID_ARGUMENT;
    } catch (const std::invalid_argument& e) {
        ExceptionMessagePrint(e);
        std::cout << args_help << std::endl;
        return dwalk::status::INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        ExceptionMessagePrint(e);
        return dwalk::status::UNKNOWN_FAILURE;
    } catch (...) {
        LOGE << "Unknown exception occured";
        LOGE << "Exiting";
        return dwalk::status::UNKNOWN_FAILURE;
    }
}
