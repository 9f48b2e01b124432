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

#include <filesystem>
#include <string>
#include <vector>

#include "gmock/gmock.h"

#include "depth_walker.h"
#include "test_tree.h"

namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::IsEmpty;
using ::testing::StrEq;
using ::testing::UnorderedElementsAre;

using dwalk::walk::LiteralRoot;
using dwalk::walk::PatternRoot;
using dwalk::walk::Resolve;
using dwalk::walk::RootNotFoundException;
using dwalk::walk::TryResolve;
using dwalk::walk::test::CountingLister;
using dwalk::walk::test::TempDir;

TEST(RootResolver, LiteralExistingPathResolvesToItself) {
    TempDir root;
    const auto dir = root.AddDir("logs");
    EXPECT_THAT(TryResolve(LiteralRoot{dir.string()}), ElementsAre(dir));
}

TEST(RootResolver, LiteralDoesNotExpandWildcards) {
    TempDir root;
    const auto odd = root.AddDir("data*");
    root.AddDir("data1");
    root.AddDir("data2");

    EXPECT_THAT(Resolve(LiteralRoot{odd.string()}), ElementsAre(odd));
    EXPECT_THAT(Resolve(LiteralRoot{(root.Path() / "dat?").string()}), IsEmpty());
}

TEST(RootResolver, PatternExpandsToAllMatches) {
    TempDir root;
    const auto first = root.AddDir("data1");
    const auto second = root.AddDir("data2");
    root.AddDir("other");

    EXPECT_THAT(TryResolve(PatternRoot{(root.Path() / "data?").string()}), ElementsAre(first, second));
    EXPECT_THAT(Resolve(PatternRoot{(root.Path() / "data[2]").string()}), ElementsAre(second));
}

TEST(RootResolver, PatternWithoutWildcardsActsAsExistenceCheck) {
    TempDir root;
    const auto dir = root.AddDir("plain");
    EXPECT_THAT(Resolve(PatternRoot{dir.string()}), ElementsAre(dir));
    EXPECT_THAT(Resolve(PatternRoot{(root.Path() / "absent").string()}), IsEmpty());
}

TEST(RootResolver, PatternMatchingFileAndDirectoryWalksEveryMatch) {
    TempDir root;
    const auto file = root.AddFile("a.txt");
    const auto dir = root.AddDir("adir");
    root.AddFile("adir/x.txt");
    root.AddFile("b.txt");

    const auto roots = TryResolve(PatternRoot{(root.Path() / "a*").string()});
    ASSERT_THAT(roots, UnorderedElementsAre(file, dir));

    CountingLister lister;
    std::vector<std::filesystem::path> produced;
    for (const auto& r : roots) {
        for (const auto& e : dwalk::walk::Walk(r, 0, dwalk::walk::FilterCriteria{}, lister)) {
            produced.push_back(e.path());
        }
    }

    EXPECT_THAT(produced, UnorderedElementsAre(file, dir / "x.txt"));
    EXPECT_THAT(lister.Listed(), ElementsAre(dir));
}

TEST(RootResolver, OverlongLiteralNameIsErrorNotMissing) {
    TempDir root;
    const auto overlong = root.Path() / std::string(300, 'x');
    EXPECT_THROW(Resolve(LiteralRoot{overlong.string()}), std::filesystem::filesystem_error);
    EXPECT_THROW(TryResolve(LiteralRoot{overlong.string()}), std::filesystem::filesystem_error);
}

TEST(RootResolver, MissingLiteralReportsModeAndText) {
    try {
        TryResolve(LiteralRoot{"no/such/path"});
        FAIL() << "RootNotFoundException expected";
    } catch (const RootNotFoundException& e) {
        EXPECT_THAT(std::string(e.GetMode()), StrEq("LiteralPath"));
        EXPECT_THAT(std::string(e.GetText()), StrEq("no/such/path"));
        EXPECT_THAT(e.what(), StrEq("LiteralPath not found: 'no/such/path'"));
    }
}

TEST(RootResolver, UnmatchedPatternReportsModeAndText) {
    TempDir root;
    const auto pattern = (root.Path() / "NoSuchDir*").string();
    try {
        TryResolve(PatternRoot{pattern});
        FAIL() << "RootNotFoundException expected";
    } catch (const RootNotFoundException& e) {
        EXPECT_THAT(std::string(e.GetMode()), StrEq("Path"));
        EXPECT_THAT(e.what(), StrEq("Path not found: '" + pattern + "'"));
    }
}

TEST(RootResolver, MissingRootFailsBeforeAnyListing) {
    CountingLister lister;
    const auto resolve_and_walk = [&lister]() {
        for (const auto& root : TryResolve(LiteralRoot{"no/such/path"})) {
            dwalk::walk::Walk(root, 3, dwalk::walk::FilterCriteria{}, lister);
        }
    };

    EXPECT_THROW(resolve_and_walk(), RootNotFoundException);
    EXPECT_THAT(lister.Count(), Eq(0));
}

TEST(RootResolver, ModeNames) {
    EXPECT_THAT(std::string(dwalk::walk::ModeName(PatternRoot{"x"})), StrEq("Path"));
    EXPECT_THAT(std::string(dwalk::walk::ModeName(LiteralRoot{"x"})), StrEq("LiteralPath"));
    EXPECT_THAT(std::string(dwalk::walk::SpecificationText(LiteralRoot{"C:\\NoSuchDir"})), StrEq("C:\\NoSuchDir"));
}

}  // namespace
