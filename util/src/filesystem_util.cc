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

#include "filesystem_util.h"

#include <fnmatch.h>
#include <glob.h>

#include <stdexcept>
#include <system_error>

namespace {

class GlobCleanup {
public:
    explicit GlobCleanup(glob_t& result) : result_(result) {}

    GlobCleanup(const GlobCleanup&) = delete;

    GlobCleanup& operator=(const GlobCleanup&) = delete;

    ~GlobCleanup() { globfree(&result_); }

private:
    glob_t& result_;
};

}  // namespace

namespace dwalk::util::filesystem {

std::vector<std::filesystem::path> ExpandPattern(const std::string& pattern) {
    glob_t glob_result{};
    GlobCleanup cleanup(glob_result);
    const auto res = glob(pattern.c_str(), 0, nullptr, &glob_result);
    if (res == GLOB_NOMATCH) {
        return {};
    }
    if (res == GLOB_NOSPACE) {
        throw std::runtime_error("Out of memory while expanding pattern '" + pattern + "'");
    }
    if (res != 0) {
        throw std::runtime_error("Expanding pattern '" + pattern + "' failed with glob error " + std::to_string(res));
    }

    std::vector<std::filesystem::path> listings;
    listings.reserve(glob_result.gl_pathc);
    for (size_t i{}; i < glob_result.gl_pathc; i++) {
        listings.emplace_back(glob_result.gl_pathv[i]);
    }

    return listings;
}

bool Exists(const std::filesystem::path& loc) {
    std::error_code ec;
    const auto st = std::filesystem::status(loc, ec);
    if (ec && st.type() != std::filesystem::file_type::not_found) {
        throw std::filesystem::filesystem_error("Failed to query", loc, ec);
    }

    return std::filesystem::exists(st);
}

bool MatchesPattern(const std::string& pattern, const std::string& name, bool ignore_case) {
    const auto res = fnmatch(pattern.c_str(), name.c_str(), ignore_case ? FNM_CASEFOLD : 0);
    if (res == 0) {
        return true;
    }
    if (res == FNM_NOMATCH) {
        return false;
    }

    throw std::runtime_error("Matching '" + name + "' against pattern '" + pattern + "' failed with error " +
                             std::to_string(res));
}

}  // namespace dwalk::util::filesystem
