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
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dwalk::walk {

struct PatternRoot {
    std::string text;
};

struct LiteralRoot {
    std::string text;
};

using RootSpecification = std::variant<PatternRoot, LiteralRoot>;

class RootNotFoundException final : public std::runtime_error {
public:
    RootNotFoundException(std::string_view mode, std::string_view text)
        : std::runtime_error(std::string{mode} + " not found: '" + std::string{text} + "'"),
          mode_{mode},
          text_{text} {}

    [[nodiscard]] std::string_view GetMode() const { return mode_; }
    [[nodiscard]] std::string_view GetText() const { return text_; }

private:
    std::string mode_;
    std::string text_;
};

// "Path" or "LiteralPath", the name of the argument the specification came from.
std::string_view ModeName(const RootSpecification& spec);
std::string_view SpecificationText(const RootSpecification& spec);

/**
 * Resolves the specification to the existing locations. Non existing locations result in empty listing, other
 * failures are thrown.
 */
std::vector<std::filesystem::path> Resolve(const RootSpecification& spec);

// Same as Resolve() but throws RootNotFoundException when nothing exists.
std::vector<std::filesystem::path> TryResolve(const RootSpecification& spec);

}  // namespace dwalk::walk
