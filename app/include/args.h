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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include "dwalk_log.h"
#include "filter_criteria.h"
#include "root_resolver.h"

namespace dwalk {

class Args final {
public:
    Args() = delete;
    Args(const std::vector<char*>& args);

    [[nodiscard]] bool IsHelpRequested() const;
    [[nodiscard]] std::string GetHelp() const;
    [[nodiscard]] std::vector<walk::RootSpecification> GetRootSpecifications() const;
    [[nodiscard]] walk::FilterCriteria GetFilterCriteria() const;
    [[nodiscard]] uint8_t GetDepth() const { return depth_; }
    [[nodiscard]] bool FollowSymlinks() const { return follow_symlinks_; }
    [[nodiscard]] log::Level GetLogLevel() const { return log_level_; }
    [[nodiscard]] bool IsPlainLog() const { return plain_log_; }

    static constexpr int MAX_DEPTH{255};

private:
    void Construct();
    void Check();
    static log::Level TryFetchLogLevelFrom(std::string_view level_arg);

    boost::program_options::variables_map vm_;
    boost::program_options::options_description args_{""};
    boost::program_options::options_description visible_args_{""};
    boost::program_options::options_description hidden_args_{""};
    boost::program_options::positional_options_description positional_args_;

    bool precheck_help{false};
    std::vector<std::string> paths_{};
    std::vector<std::string> literal_paths_{};
    std::string filter_{};
    int depth_arg_{};
    uint8_t depth_{};
    bool files_only_{};
    bool ignore_case_{};
    bool follow_symlinks_{};
    bool verbose_{};
    std::string log_level_arg_{};
    log::Level log_level_{log::Level::WARNING};
    bool plain_log_{};
};

}  // namespace dwalk
