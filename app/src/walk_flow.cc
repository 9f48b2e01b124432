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

#include "walk_flow.h"

#include "depth_walker.h"
#include "directory_lister.h"
#include "dwalk_log.h"

namespace dwalk::mainflow {

std::vector<std::filesystem::path> ResolveRoots(const std::vector<walk::RootSpecification>& specs) {
    std::vector<std::filesystem::path> roots;
    for (const auto& spec : specs) {
        const auto resolved = walk::TryResolve(spec);
        roots.insert(roots.end(), resolved.cbegin(), resolved.cend());
    }

    return roots;
}

status::EXIT_CODE Run(const Args& args, std::ostream& out) {
    std::vector<std::filesystem::path> roots;
    try {
        roots = ResolveRoots(args.GetRootSpecifications());
    } catch (const walk::RootNotFoundException& e) {
        LOGE << e.what();
        return status::ROOT_NOT_FOUND;
    } catch (const std::filesystem::filesystem_error& e) {
        LOGE << "Resolving roots failed - " << e.what();
        return status::ROOT_RESOLUTION_FAILURE;
    }

    const auto filter = args.GetFilterCriteria();
    walk::WalkOptions options{};
    options.follow_symlinks = args.FollowSymlinks();
    walk::FilesystemLister lister;
    try {
        for (const auto& root : roots) {
            LOGD << "Walking '" << root.string() << "' until depth " << static_cast<unsigned>(args.GetDepth());
            walk::DepthWalker walker(root, args.GetDepth(), filter, lister, options);
            for (const auto& entry : walker) {
                out << entry.path().string() << "\n";
            }
            out.flush();
        }
    } catch (const std::filesystem::filesystem_error& e) {
        out.flush();
        LOGE << "Listing failed - " << e.what();
        return status::LISTING_FAILURE;
    }

    return status::SUCCESS;
}

}  // namespace dwalk::mainflow
