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

namespace dwalk::walk {

class DirectoryLister {
public:
    DirectoryLister() = default;
    DirectoryLister(const DirectoryLister&) = delete;
    DirectoryLister& operator=(const DirectoryLister&) = delete;
    virtual ~DirectoryLister() = default;

    // Immediate children of dir in the order the host enumerates them. Failures are thrown as filesystem_error.
    virtual std::filesystem::directory_iterator List(const std::filesystem::path& dir) = 0;
};

class FilesystemLister final : public DirectoryLister {
public:
    std::filesystem::directory_iterator List(const std::filesystem::path& dir) override;
};

}  // namespace dwalk::walk
