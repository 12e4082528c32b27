// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// cli: разбор argv, help/version, диагностика ошибок (exit code 2)
//
// ==============================================================================

#include "moss/cli.hpp"
#include "moss/platform.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace moss::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }
    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// --help / --version
// ==============================================================================

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    // Arrange
    Args args{"moss-rules", "--help"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_HelpShortWinsOverOtherFlags) {
    Args args{"moss-rules", "--json", "-h", "--bogus"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"moss-rules", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
}

TEST(CliTest, RenderVersion) {
    EXPECT_EQ(render_version(), "moss-rules 0.1.0\n");
}

TEST(CliTest, RenderHelp_ListsOptions) {
    const std::string help = render_help();

    EXPECT_NE(help.find("Usage: moss-rules [OPTIONS] [ROOT]"), std::string::npos);
    for (const char* opt : {"--rule", "--fix", "--json", "--list", "--config", "--debug",
                            "--output", "--grammar-path", "MOSS_GRAMMAR_PATH", "moss-allow:"}) {
        EXPECT_NE(help.find(opt), std::string::npos) << opt;
    }
}

// ==============================================================================
// Запуск правил
// ==============================================================================

TEST(CliTest, Parse_NoArgs_DefaultRun) {
    Args args{"moss-rules"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* run = std::get_if<RunCommand>(&result.command);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(run->root, std::filesystem::path("."));
    EXPECT_FALSE(run->rule.has_value());
    EXPECT_FALSE(run->fix);
    EXPECT_FALSE(run->json);
    EXPECT_TRUE(run->debug.empty());
    EXPECT_EQ(result.global.verbose, 0);
    EXPECT_FALSE(result.global.quiet);
}

TEST(CliTest, Parse_AllRunOptions) {
    // Arrange
    Args args{"moss-rules", "project", "-r",        "rust/unwrap", "--fix",
              "--json",     "--config=cfg.yml",      "--debug",     "timing",
              "--debug",    "all",                   "-o",          "out.json",
              "--grammar-path", "/g1",               "--grammar-path=/g2",
              "-vv",        "-q"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto* run = std::get_if<RunCommand>(&result.command);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(platform::path_to_utf8(run->root), "project");
    EXPECT_EQ(run->rule, std::optional<std::string>("rust/unwrap"));
    EXPECT_TRUE(run->fix);
    EXPECT_TRUE(run->json);
    ASSERT_TRUE(run->config.has_value());
    EXPECT_EQ(platform::path_to_utf8(*run->config), "cfg.yml");
    EXPECT_EQ(run->debug, (std::vector<std::string>{"timing", "all"}));
    ASSERT_TRUE(run->output.has_value());
    EXPECT_EQ(platform::path_to_utf8(*run->output), "out.json");
    ASSERT_EQ(run->grammar_paths.size(), 2u);
    EXPECT_EQ(platform::path_to_utf8(run->grammar_paths[1]), "/g2");
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_RepeatedVerbose) {
    Args args{"moss-rules", "-v", "-v", "-vv"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 4);
}

TEST(CliTest, Parse_List_ReturnsListCommand) {
    Args args{"moss-rules", "--list", "--json", "src"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* list = std::get_if<ListCommand>(&result.command);
    ASSERT_NE(list, nullptr);
    EXPECT_TRUE(list->json);
    EXPECT_EQ(platform::path_to_utf8(list->root), "src");
}

// ==============================================================================
// Ошибки разбора
// ==============================================================================

TEST(CliTest, Parse_UnknownOption_Exit2) {
    Args args{"moss-rules", "--frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unexpected argument '--frobnicate' found\n\n"
              "Usage: moss-rules [OPTIONS] [ROOT]\n\n"
              "For more information, try '--help'.\n");
}

TEST(CliTest, Parse_MissingValue_Exit2) {
    Args args{"moss-rules", "--rule"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: a value is required for '--rule <ID>' but none was supplied", 0),
              0u);
}

TEST(CliTest, Parse_SecondPositional_Exit2) {
    Args args{"moss-rules", "a", "b"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("'b'"), std::string::npos);
}

TEST(CliTest, Parse_ListWithFix_Exit2) {
    Args args{"moss-rules", "--list", "--fix"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("cannot be used with"), std::string::npos);
}

TEST(CliTest, Parse_DashIsPositional) {
    Args args{"moss-rules", "-"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* run = std::get_if<RunCommand>(&result.command);
    ASSERT_NE(run, nullptr);
    EXPECT_EQ(platform::path_to_utf8(run->root), "-");
}

}  // namespace moss::cli::test
