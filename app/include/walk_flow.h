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
#pragma once

#include <filesystem>
#include <ostream>
#include <vector>

#include "args.h"
#include "root_resolver.h"
#include "status_assembly.h"

namespace dwalk::mainflow {

// All of the specifications are resolved, the first one without any existing location throws.
std::vector<std::filesystem::path> ResolveRoots(const std::vector<walk::RootSpecification>& specs);

/*
 * Resolves the roots and writes the path of every walked entry to out, one per line. Filesystem failures are
 * mapped to the exit code, resolution failures happen before anything is written. Entries written before a listing
 * failure stay in out.
 */
status::EXIT_CODE Run(const Args& args, std::ostream& out);

}  // namespace dwalk::mainflow
