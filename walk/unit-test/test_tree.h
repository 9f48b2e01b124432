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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "depth_walker.h"
#include "directory_lister.h"

namespace dwalk::walk::test {

inline std::string MakeUniqueToken(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

// Scratch directory under the system temp location, removed with everything in it at the end of the scope.
class TempDir final {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / MakeUniqueToken("dwalk-test-")) {
        std::filesystem::create_directories(path_);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] const std::filesystem::path& Path() const { return path_; }

    std::filesystem::path AddFile(const std::filesystem::path& relative) const {
        const auto p = path_ / relative;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p);
        out << "data";
        return p;
    }

    std::filesystem::path AddDir(const std::filesystem::path& relative) const {
        const auto p = path_ / relative;
        std::filesystem::create_directories(p);
        return p;
    }

private:
    std::filesystem::path path_;
};

// Records every listing request, optionally failing the one made for fail_at.
class CountingLister final : public DirectoryLister {
public:
    CountingLister() = default;
    explicit CountingLister(std::filesystem::path fail_at) : fail_at_(std::move(fail_at)) {}

    std::filesystem::directory_iterator List(const std::filesystem::path& dir) override {
        listed_.push_back(dir);
        if (fail_at_.has_value() && *fail_at_ == dir) {
            throw std::filesystem::filesystem_error("Listing denied", dir,
                                                    std::make_error_code(std::errc::permission_denied));
        }
        return std::filesystem::directory_iterator(dir);
    }

    [[nodiscard]] size_t Count() const { return listed_.size(); }
    [[nodiscard]] const std::vector<std::filesystem::path>& Listed() const { return listed_; }

private:
    std::optional<std::filesystem::path> fail_at_;
    std::vector<std::filesystem::path> listed_;
};

// Paths relative to root with '/' separators, in the order they were produced.
inline std::vector<std::string> RelativeNames(const std::vector<Entry>& entries, const std::filesystem::path& root) {
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& e : entries) {
        names.push_back(e.path().lexically_relative(root).generic_string());
    }
    return names;
}

}  // namespace dwalk::walk::test
