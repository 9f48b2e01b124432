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

#include "depth_walker.h"

#include <utility>

#include "dwalk_log.h"
#include "filesystem_util.h"

namespace dwalk::walk {

DepthWalker::DepthWalker(std::filesystem::path root, uint8_t depth_limit, FilterCriteria filter,
                         DirectoryLister& lister, WalkOptions options)
    : root_(std::move(root)),
      depth_limit_{depth_limit},
      filter_(std::move(filter)),
      lister_(lister),
      options_{options} {
    if (filter_.name_pattern.empty()) {
        filter_.name_pattern = "*";
    }
    // Root, and one frame for every level up to the limit.
    frames_.reserve(static_cast<size_t>(depth_limit_) + 1);
}

void DepthWalker::Descend(const std::filesystem::path& dir, unsigned working_depth) {
    LOGV << "Listing '" << dir.string() << "' at depth " << working_depth;
    frames_.push_back({lister_.List(dir), working_depth, false});
}

bool DepthWalker::PassesFilter(const Entry& entry, bool is_container) const {
    if (filter_.entries_only && is_container) {
        return false;
    }

    return util::filesystem::MatchesPattern(filter_.name_pattern, entry.path().filename().string(),
                                            filter_.ignore_case);
}

std::optional<Entry> DepthWalker::Next() {
    if (!started_) {
        started_ = true;
        // A file root is its own single result, the same way as listing a file on a shell.
        Entry root_entry(root_);
        if (root_entry.exists() && !root_entry.is_directory()) {
            LOGD << "Root '" << root_.string() << "' is not a directory, not listing it";
            if (PassesFilter(root_entry, false)) {
                return root_entry;
            }
            return std::nullopt;
        }
        Descend(root_, 1);
    }

    while (true) {
        if (pending_dir_.has_value()) {
            const auto dir = std::move(*pending_dir_);
            pending_dir_.reset();
            Descend(dir, pending_depth_);
        }

        if (frames_.empty()) {
            return std::nullopt;
        }

        auto& frame = frames_.back();
        if (frame.advance) {
            frame.advance = false;
            ++frame.listing;
        }
        if (frame.listing == std::filesystem::directory_iterator{}) {
            frames_.pop_back();
            continue;
        }

        Entry child = *frame.listing;
        frame.advance = true;
        const auto working_depth = frame.working_depth;

        const bool is_container = child.is_directory();
        if (is_container) {
            if (child.is_symlink() && !options_.follow_symlinks) {
                LOGV << "Not following symbolic link '" << child.path().string() << "'";
            } else if (working_depth <= depth_limit_) {
                pending_dir_ = child.path();
                pending_depth_ = working_depth + 1;
            } else {
                LOGD << "Skipping '" << child.path().string() << "', current depth " << working_depth << " limit "
                     << static_cast<unsigned>(depth_limit_);
            }
        }

        if (PassesFilter(child, is_container)) {
            return child;
        }
    }
}

DepthWalker::Iterator DepthWalker::begin() { return Iterator(this); }

DepthWalker::Iterator DepthWalker::end() { return Iterator(); }

DepthWalker::Iterator::Iterator(DepthWalker* walker) : walker_(walker) { ++*this; }

DepthWalker::Iterator& DepthWalker::Iterator::operator++() {
    current_ = walker_->Next();
    if (!current_.has_value()) {
        walker_ = nullptr;
    }
    return *this;
}

std::vector<Entry> Walk(const std::filesystem::path& root, uint8_t depth_limit, const FilterCriteria& filter,
                        DirectoryLister& lister, WalkOptions options) {
    std::vector<Entry> entries;
    DepthWalker walker(root, depth_limit, filter, lister, options);
    for (auto entry = walker.Next(); entry.has_value(); entry = walker.Next()) {
        entries.push_back(std::move(*entry));
    }

    return entries;
}

std::vector<Entry> Walk(const std::filesystem::path& root, uint8_t depth_limit, const FilterCriteria& filter,
                        WalkOptions options) {
    FilesystemLister lister;
    return Walk(root, depth_limit, filter, lister, options);
}

}  // namespace dwalk::walk
