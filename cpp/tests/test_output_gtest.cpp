// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// output: префиксы, quiet/verbose, JSON (RapidJSON), вывод в файл
//
// ==============================================================================

#include "moss/output.hpp"
#include "moss/platform.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

// Platform-specific includes для PID (уникальные имена временных файлов)
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace moss::output::test {

namespace {

std::filesystem::path temp_output_path() {
    auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
    return std::filesystem::temp_directory_path() /
           (std::string("moss_output_") + test_info->name() + "_" +
            std::to_string(
#ifdef _WIN32
                GetCurrentProcessId()
#else
                getpid()
#endif
                    ) +
            ".txt");
}

}  // namespace

// ==============================================================================
// Writer: уровни сообщений
// ==============================================================================

TEST(OutputTest, Writer_DefaultConfig_NoOutputFile) {
    OutputConfig config;
    Writer writer(config);

    EXPECT_FALSE(writer.has_output_file());
}

TEST(OutputTest, Writer_PrefixesWithoutTty) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.info("loaded");
    writer.warn("careful");
    writer.error("failed");
    writer.debug("detail");
    writer.trace("deep");
    writer.flush();
    std::string err = testing::internal::GetCapturedStderr();

    // Захваченный stderr не TTY: без ANSI кодов
    EXPECT_EQ(err, "[+] loaded\n[!] careful\n[x] failed\n[*] detail\n[~] deep\n");
}

TEST(OutputTest, Writer_QuietSuppressesInfo) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.info("hidden");
    writer.warn("hidden");
    writer.error("shown");
    writer.flush();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err.find("hidden"), std::string::npos);
    EXPECT_NE(err.find("[x] shown"), std::string::npos);
}

TEST(OutputTest, Writer_VerboseLevels) {
    OutputConfig config;
    config.verbose = 1;
    Writer writer(config);

    testing::internal::CaptureStderr();
    writer.debug("debug-line");
    writer.trace("trace-line");
    writer.flush();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[*] debug-line"), std::string::npos);
    EXPECT_EQ(err.find("trace-line"), std::string::npos);
}

// ==============================================================================
// Writer: вывод в файл
// ==============================================================================

TEST(OutputTest, Writer_OutputFile_ReceivesStdoutWithoutColor) {
    // Arrange
    const auto path = temp_output_path();
    OutputConfig config;
    config.output_path = path;

    // Act
    {
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());
        writer.write_line(Stream::Stdout, "first");
        writer.red_line("  a.rs:1:1: message [rule]");
    }

    // Assert
    auto content = platform::read_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "first\n  a.rs:1:1: message [rule]\n");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(OutputTest, Writer_OutputFile_UnwritablePath) {
    OutputConfig config;
    config.output_path = std::filesystem::temp_directory_path() / "moss-no-such-dir" / "x" / "out.txt";

    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

// ==============================================================================
// Writer: JSON
// ==============================================================================

TEST(OutputTest, WriteJsonPretty_TwoSpaceIndent) {
    // Arrange
    const auto path = temp_output_path();
    OutputConfig config;
    config.output_path = path;

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("fixed", 2, doc.GetAllocator());

    // Act
    {
        Writer writer(config);
        writer.write_json_pretty(doc);
    }

    // Assert
    auto content = platform::read_file(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "{\n  \"fixed\": 2\n}\n");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace moss::output::test
