// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: формат help/ошибок в стиле clap.
//
// ==============================================================================

#include "moss/cli.hpp"

#include "moss/platform.hpp"

#include <cstring>

namespace moss::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Ошибка разбора в стиле clap: сообщение, usage и подсказка
std::string render_usage_error(const std::string& error_msg) {
    return error_msg +
           "\n\n"
           "Usage: moss-rules [OPTIONS] [ROOT]\n\n"
           "For more information, try '--help'.\n";
}

/// Опция со значением: "--name value" или "--name=value".
/// true если arg - эта опция; value пуст при отсутствии значения.
bool take_value(int argc, char** argv, int& i, const char* short_name, const char* long_name,
                std::optional<std::string>& value) {
    const char* arg = argv[i];
    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        if (i + 1 < argc) {
            ++i;
            value = argv[i];
        } else {
            value.reset();
        }
        return true;
    }

    const std::string eq_prefix = std::string(long_name) + "=";
    if (starts_with(arg, eq_prefix.c_str())) {
        value = std::string(arg + eq_prefix.size());
        return true;
    }
    return false;
}

std::string missing_value(const char* option, const char* value_name) {
    return render_usage_error(std::string("error: a value is required for '") + option + " <" +
                              value_name + ">' but none was supplied");
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: moss-rules [OPTIONS] [ROOT]\n"
           "\n"
           "Arguments:\n"
           "  [ROOT]  Project root to analyse [default: .]\n"
           "\n"
           "Options:\n"
           "  -r, --rule <ID>            Run only the rule with this id\n"
           "      --fix                  Apply auto-fixes in place\n"
           "      --json                 Output as JSON\n"
           "      --list                 List available rules\n"
           "      --config <PATH>        Config file [default: <ROOT>/.moss/config.yml]\n"
           "      --grammar-path <DIR>   Additional grammar search directory\n"
           "      --debug <CATEGORY>     Debug output: timing, all\n"
           "  -o, --output <OUTPUT>      Save output to a file\n"
           "  -v...                      Print verbose output\n"
           "  -q                         Suppress informational output\n"
           "  -h, --help                 Print help\n"
           "  -V, --version              Print version\n"
           "\n"
           "Environment:\n"
           "  MOSS_GRAMMAR_PATH  Colon-separated directories with tree-sitter grammars\n"
           "\n"
           "Suppress a finding with a comment on the same or previous line:\n"
           "    // moss-allow: <rule-id> - reason\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;

    RunCommand run;
    bool list = false;
    bool root_set = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::optional<std::string> value;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (arg[0] == '-' && arg[1] == 'v' && std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
            // -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg + 1));
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--fix")) {
            run.fix = true;
        } else if (str_eq(arg, "--json")) {
            run.json = true;
        } else if (str_eq(arg, "--list")) {
            list = true;
        } else if (take_value(argc, argv, i, "-r", "--rule", value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--rule", "ID");
                return result;
            }
            run.rule = *value;
        } else if (take_value(argc, argv, i, nullptr, "--config", value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--config", "PATH");
                return result;
            }
            run.config = platform::path_from_utf8(*value);
        } else if (take_value(argc, argv, i, nullptr, "--grammar-path", value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--grammar-path", "DIR");
                return result;
            }
            run.grammar_paths.push_back(platform::path_from_utf8(*value));
        } else if (take_value(argc, argv, i, nullptr, "--debug", value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--debug", "CATEGORY");
                return result;
            }
            run.debug.push_back(*value);
        } else if (take_value(argc, argv, i, "-o", "--output", value)) {
            if (!value) {
                result.diagnostic.stderr_message = missing_value("--output", "OUTPUT");
                return result;
            }
            run.output = platform::path_from_utf8(*value);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        } else {
            if (root_set) {
                result.diagnostic.stderr_message = render_usage_error(
                    std::string("error: unexpected argument '") + arg + "' found");
                return result;
            }
            run.root = platform::path_from_utf8(arg);
            root_set = true;
        }
    }

    if (list) {
        if (run.fix) {
            result.diagnostic.stderr_message = render_usage_error(
                "error: the argument '--list' cannot be used with '--fix'");
            return result;
        }
        ListCommand list_cmd;
        list_cmd.root = run.root;
        list_cmd.config = run.config;
        list_cmd.json = run.json;
        result.ok = true;
        result.command = list_cmd;
        return result;
    }

    result.ok = true;
    result.command = run;
    return result;
}

}  // namespace moss::cli
