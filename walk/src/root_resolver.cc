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

#include "root_resolver.h"

#include "dwalk_log.h"
#include "filesystem_util.h"

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

namespace dwalk::walk {

std::string_view ModeName(const RootSpecification& spec) {
    return std::visit(Overloaded{[](const PatternRoot&) { return std::string_view{"Path"}; },
                                 [](const LiteralRoot&) { return std::string_view{"LiteralPath"}; }},
                      spec);
}

std::string_view SpecificationText(const RootSpecification& spec) {
    return std::visit([](const auto& s) { return std::string_view{s.text}; }, spec);
}

std::vector<std::filesystem::path> Resolve(const RootSpecification& spec) {
    return std::visit(Overloaded{[](const PatternRoot& p) { return util::filesystem::ExpandPattern(p.text); },
                                 [](const LiteralRoot& l) {
                                     std::vector<std::filesystem::path> roots;
                                     if (util::filesystem::Exists(l.text)) {
                                         roots.emplace_back(l.text);
                                     }
                                     return roots;
                                 }},
                      spec);
}

std::vector<std::filesystem::path> TryResolve(const RootSpecification& spec) {
    auto roots = Resolve(spec);
    if (roots.empty()) {
        throw RootNotFoundException(ModeName(spec), SpecificationText(spec));
    }

    LOGD << ModeName(spec) << " '" << SpecificationText(spec) << "' resolved to " << roots.size() << " root(s)";
    return roots;
}

}  // namespace dwalk::walk
