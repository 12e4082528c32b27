// ==============================================================================
// moss/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Использование: moss-rules [OPTIONS] [ROOT]
//
// ==============================================================================

#ifndef MOSS_CLI_HPP
#define MOSS_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace moss::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Запуск правил по дереву проекта
struct RunCommand {
    std::filesystem::path root = ".";                  // [ROOT]
    std::optional<std::string> rule;                   // -r, --rule
    bool fix = false;                                  // --fix
    bool json = false;                                 // --json
    std::optional<std::filesystem::path> config;       // --config
    std::vector<std::string> debug;                    // --debug (repeatable)
    std::optional<std::filesystem::path> output;       // -o, --output
    std::vector<std::filesystem::path> grammar_paths;  // --grammar-path (repeatable)
};

/// Список правил (--list)
struct ListCommand {
    std::filesystem::path root = ".";
    std::optional<std::filesystem::path> config;
    bool json = false;
};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<RunCommand, ListCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM = "moss-rules";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Run structural lint rules over a source tree";

}  // namespace moss::cli

#endif  // MOSS_CLI_HPP
