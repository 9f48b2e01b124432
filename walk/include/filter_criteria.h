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

#include <string>

namespace dwalk::walk {

struct FilterCriteria {
    // Glob style, * and ? and [...]. Empty is the same as "*".
    std::string name_pattern{"*"};
    // Directories are left out of the results, they are still descended into.
    bool entries_only{false};
    bool ignore_case{false};
};

}  // namespace dwalk::walk
