// ==============================================================================
// test_discovery_gtest.cpp - Тесты поиска исходных файлов (GoogleTest)
// ==============================================================================
//
// io::discovery: обход дерева, .gitignore, VCS-каталоги, группировка
// по грамматикам, соответствие расширений и грамматик.
//
// ==============================================================================

#include "moss/discovery.hpp"
#include "moss/language.hpp"
#include "moss/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

// Platform-specific includes для PID (уникальные temp директории при параллельных тестах)
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace moss::io::test {

// ==============================================================================
// Test Fixture: создаёт временную структуру директорий для тестов
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        // Уникальная директория на тест: имя теста + PID (ctest -j)
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("moss_discovery_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    // Создаёт файл с содержимым
    void create_file(const std::string& rel, const std::string& content = "x") {
        auto path = test_dir_ / platform::path_from_utf8(rel);
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    std::vector<std::string> collect_rel(const DiscoveryOptions& opt = {}) {
        std::vector<std::string> rel;
        for (const auto& p : collect_source_files(test_dir_, opt)) {
            rel.push_back(platform::relative_utf8(p, test_dir_));
        }
        return rel;
    }
};

// ==============================================================================
// collect_source_files
// ==============================================================================

TEST_F(DiscoveryTest, Collect_OnlyKnownGrammarsSorted) {
    // Arrange
    create_file("src/main.rs");
    create_file("src/util.py");
    create_file("README.md");
    create_file("notes.txt");
    create_file("app/index.js");

    // Act
    auto files = collect_rel();

    // Assert
    EXPECT_EQ(files, (std::vector<std::string>{"app/index.js", "src/main.rs", "src/util.py"}));
}

TEST_F(DiscoveryTest, Collect_SkipsVcsDirectories) {
    create_file(".git/hooks/pre-commit.sh");
    create_file(".hg/store.py");
    create_file("lib.rs");

    EXPECT_EQ(collect_rel(), (std::vector<std::string>{"lib.rs"}));
}

TEST_F(DiscoveryTest, Collect_RespectsGitignore) {
    // Arrange
    create_file(".gitignore", "# build output\ntarget/\n*.gen.rs\n/vendor\n");
    create_file("target/debug/build.rs");
    create_file("src/api.gen.rs");
    create_file("src/lib.rs");
    create_file("vendor/dep.rs");
    create_file("nested/vendor/keep.rs");

    // Act
    auto files = collect_rel();

    // Assert
    EXPECT_EQ(files, (std::vector<std::string>{"nested/vendor/keep.rs", "src/lib.rs"}));
}

TEST_F(DiscoveryTest, Collect_GitignoreCanBeDisabled) {
    create_file(".gitignore", "*.rs\n");
    create_file("lib.rs");

    DiscoveryOptions opt;
    opt.respect_gitignore = false;

    EXPECT_TRUE(collect_rel().empty());
    EXPECT_EQ(collect_rel(opt), (std::vector<std::string>{"lib.rs"}));
}

TEST_F(DiscoveryTest, Collect_FileRoot) {
    create_file("single.go");
    create_file("plain.txt");

    auto go = collect_source_files(test_dir_ / "single.go");
    auto txt = collect_source_files(test_dir_ / "plain.txt");

    ASSERT_EQ(go.size(), 1u);
    EXPECT_EQ(go[0], test_dir_ / "single.go");
    EXPECT_TRUE(txt.empty());
}

TEST_F(DiscoveryTest, Collect_MissingRootThrows) {
    EXPECT_THROW(collect_source_files(test_dir_ / "does-not-exist"), std::runtime_error);
}

TEST_F(DiscoveryTest, Collect_SymlinkCycleIsNotFollowed) {
    // Arrange: src/loop -> корень
    create_file("src/main.rs");
    std::error_code ec;
    std::filesystem::create_directory_symlink(test_dir_, test_dir_ / "src" / "loop", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks are not supported here: " << ec.message();
    }

    // Act
    auto files = collect_rel();

    // Assert
    EXPECT_EQ(files, (std::vector<std::string>{"src/main.rs"}));
}

TEST_F(DiscoveryTest, Collect_SymlinkedFileIsCollected) {
    create_file("real/lib.rs");
    std::error_code ec;
    std::filesystem::create_symlink(test_dir_ / "real" / "lib.rs", test_dir_ / "alias.rs", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks are not supported here: " << ec.message();
    }

    EXPECT_EQ(collect_rel(), (std::vector<std::string>{"alias.rs", "real/lib.rs"}));
}

TEST_F(DiscoveryTest, Collect_SpecialFileNames) {
    create_file("Dockerfile");
    create_file("CMakeLists.txt");
    create_file("other.txt");

    EXPECT_EQ(collect_rel(), (std::vector<std::string>{"CMakeLists.txt", "Dockerfile"}));
}

// ==============================================================================
// IgnoreRules
// ==============================================================================

TEST(IgnoreRulesTest, Parse_SkipsCommentsBlanksAndNegation) {
    auto rules = IgnoreRules::parse("# comment\n\n!keep.rs\nbuild/\r\n*.log\n");
    EXPECT_EQ(rules.size(), 2u);
}

TEST(IgnoreRulesTest, UnanchoredMatchesBasenameAtAnyDepth) {
    auto rules = IgnoreRules::parse("*.log\n");

    EXPECT_TRUE(rules.is_ignored("a.log", false));
    EXPECT_TRUE(rules.is_ignored("deep/dir/b.log", false));
    EXPECT_FALSE(rules.is_ignored("deep/log.rs", false));
}

TEST(IgnoreRulesTest, AnchoredMatchesFromRoot) {
    auto rules = IgnoreRules::parse("/generated\ndocs/api\n");

    EXPECT_TRUE(rules.is_ignored("generated", true));
    EXPECT_FALSE(rules.is_ignored("src/generated", true));
    EXPECT_TRUE(rules.is_ignored("docs/api", true));
}

TEST(IgnoreRulesTest, DirOnlyPattern) {
    auto rules = IgnoreRules::parse("out/\n");

    EXPECT_TRUE(rules.is_ignored("out", true));
    EXPECT_FALSE(rules.is_ignored("out", false));
}

TEST(IgnoreRulesTest, EmptyRules) {
    IgnoreRules rules;
    EXPECT_TRUE(rules.empty());
    EXPECT_FALSE(rules.is_ignored("anything", false));
}

// ==============================================================================
// group_by_grammar / language
// ==============================================================================

TEST(GroupByGrammarTest, GroupsAndDropsUnknown) {
    std::vector<std::filesystem::path> files = {"b.rs", "a.py", "c.rs", "README.md", "x.tsx"};

    auto groups = group_by_grammar(files);

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups.begin()->first, "python");
    EXPECT_EQ(groups.at("rust"), (std::vector<std::filesystem::path>{"b.rs", "c.rs"}));
    EXPECT_EQ(groups.at("tsx").size(), 1u);
}

TEST(LanguageTest, GrammarForExtension) {
    EXPECT_EQ(grammar_for_extension("rs"), std::optional<std::string>("rust"));
    EXPECT_EQ(grammar_for_extension("hpp"), std::optional<std::string>("cpp"));
    EXPECT_EQ(grammar_for_extension("cs"), std::optional<std::string>("c_sharp"));
    EXPECT_EQ(grammar_for_extension("ts"), std::optional<std::string>("typescript"));
    EXPECT_FALSE(grammar_for_extension("md").has_value());
    EXPECT_FALSE(grammar_for_extension("").has_value());
}

TEST(LanguageTest, AmbiguousExtensionFirstEntryWins) {
    EXPECT_EQ(grammar_for_extension("pl"), std::optional<std::string>("perl"));
}

TEST(LanguageTest, GrammarForPath) {
    EXPECT_EQ(grammar_for_path("src/Dockerfile"), std::optional<std::string>("dockerfile"));
    EXPECT_EQ(grammar_for_path("/home/u/.zshrc"), std::optional<std::string>("zsh"));
    EXPECT_EQ(grammar_for_path("lib/mod.rs"), std::optional<std::string>("rust"));
    EXPECT_FALSE(grammar_for_path("Makefile").has_value());
}

TEST(LanguageTest, KnownGrammarsSortedUnique) {
    auto names = known_grammars();

    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_EQ(std::adjacent_find(names.begin(), names.end()), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "rust"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "caddy"), names.end());
}

}  // namespace moss::io::test
