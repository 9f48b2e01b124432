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

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <vector>

#include "directory_lister.h"
#include "filter_criteria.h"

namespace dwalk::walk {

using Entry = std::filesystem::directory_entry;

struct WalkOptions {
    // No cycle detection is done, a link pointing to its own ancestor is walked until the depth limit.
    bool follow_symlinks{false};
};

/**
 * Lazily walks the entries under the root, depth first. A directory is produced before its contents. Contents of
 * the directories which lie deeper than depth_limit levels below the root are never listed, the directories
 * themselves are still produced when they pass the filter. depth_limit 0 lists only the children of the root.
 *
 * Listing of a directory happens on the Next() call following the one that produced it, a consumer stopping earlier
 * does not pay for the subtree. Listing failures are thrown from Next() as std::filesystem::filesystem_error.
 *
 * A root which exists but is not a directory is not listed, it is produced itself when it passes the filter.
 */
class DepthWalker final {
public:
    class Iterator;

    DepthWalker() = delete;
    DepthWalker(std::filesystem::path root, uint8_t depth_limit, FilterCriteria filter, DirectoryLister& lister,
                WalkOptions options = {});

    DepthWalker(const DepthWalker&) = delete;
    DepthWalker& operator=(const DepthWalker&) = delete;

    std::optional<Entry> Next();

    Iterator begin();
    Iterator end();

private:
    struct Frame {
        std::filesystem::directory_iterator listing;
        // Depth of the entries in listing, the children of the root are at 1.
        unsigned working_depth;
        bool advance;
    };

    void Descend(const std::filesystem::path& dir, unsigned working_depth);
    [[nodiscard]] bool PassesFilter(const Entry& entry, bool is_container) const;

    std::filesystem::path root_;
    uint8_t depth_limit_;
    FilterCriteria filter_;
    DirectoryLister& lister_;
    WalkOptions options_;

    bool started_{false};
    std::vector<Frame> frames_;
    std::optional<std::filesystem::path> pending_dir_;
    unsigned pending_depth_{};
};

class DepthWalker::Iterator final {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = const Entry*;
    using reference = const Entry&;

    Iterator() = default;
    explicit Iterator(DepthWalker* walker);

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    Iterator& operator++();

    bool operator==(const Iterator& other) const { return walker_ == other.walker_; }
    bool operator!=(const Iterator& other) const { return !(*this == other); }

private:
    DepthWalker* walker_{nullptr};
    std::optional<Entry> current_;
};

// Drains the walk into a listing.
std::vector<Entry> Walk(const std::filesystem::path& root, uint8_t depth_limit, const FilterCriteria& filter,
                        DirectoryLister& lister, WalkOptions options = {});
std::vector<Entry> Walk(const std::filesystem::path& root, uint8_t depth_limit, const FilterCriteria& filter = {},
                        WalkOptions options = {});

}  // namespace dwalk::walk
