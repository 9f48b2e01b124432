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
#include <string>
#include <string_view>
#include <vector>

namespace dwalk::util::filesystem {

// Expands *, ? and [...] against the filesystem. No matches results in an empty listing.
std::vector<std::filesystem::path> ExpandPattern(const std::string& pattern);

// False only when the location does not exist, any other failure to query it is thrown.
bool Exists(const std::filesystem::path& loc);

bool MatchesPattern(const std::string& pattern, const std::string& name, bool ignore_case = false);

}  // namespace dwalk::util::filesystem
