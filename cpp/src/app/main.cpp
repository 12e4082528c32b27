// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv
// 2. Создание Writer
// 3. Загрузка правил (встроенные + .moss/config.yml)
// 4. Dispatch команды
// 5. Возврат exit code
//
// ==============================================================================

#include "moss/cli.hpp"
#include "moss/fix.hpp"
#include "moss/grammar.hpp"
#include "moss/output.hpp"
#include "moss/platform.hpp"
#include "moss/rule.hpp"
#include "moss/runner.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <rapidjson/document.h>
#include <variant>

namespace {

using namespace moss;

// ----------------------------------------------------------------------------
// Загрузка правил
// ----------------------------------------------------------------------------

/// Встроенные правила с переопределениями из конфигурации.
/// nullopt при ошибке конфигурации (уже выведена).
std::optional<std::vector<rule::Rule>> load_rules(const std::filesystem::path& root,
                                                  const std::optional<std::filesystem::path>& config,
                                                  output::Writer& writer) {
    auto rules = rule::builtin_rules();

    const auto config_path = config.value_or(rule::default_config_path(root));
    if (config.has_value() && !std::filesystem::exists(config_path)) {
        writer.error("Specified config file does not exist - " + platform::path_to_utf8(config_path));
        return std::nullopt;
    }

    auto loaded = rule::load_config(config_path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return std::nullopt;
    }
    if (!loaded.config.rules.empty()) {
        writer.debug("loaded " + std::to_string(loaded.config.rules.size()) +
                     " rule override(s) from " + platform::path_to_utf8(config_path));
    }

    rule::apply_overrides(rules, loaded.config);
    return rules;
}

// ----------------------------------------------------------------------------
// Вывод находок
// ----------------------------------------------------------------------------

rapidjson::Value position_json(std::size_t line, std::size_t column,
                               rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value pos(rapidjson::kObjectType);
    pos.AddMember("line", static_cast<uint64_t>(line), alloc);
    pos.AddMember("column", static_cast<uint64_t>(column), alloc);
    return pos;
}

/// Путь находки для вывода; для ROOT-файла (пустой относительный путь) - имя файла
std::string display_path(const std::filesystem::path& file, const std::filesystem::path& root) {
    std::string rel = platform::relative_utf8(file, root);
    return rel.empty() ? platform::path_to_utf8(file.filename()) : rel;
}

void print_findings_json(const std::vector<runner::Finding>& findings,
                         const std::filesystem::path& root, output::Writer& writer) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    for (const auto& f : findings) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("rule", rapidjson::Value(f.rule_id.c_str(), alloc), alloc);
        const std::string rel = display_path(f.file, root);
        obj.AddMember("file", rapidjson::Value(rel.c_str(), alloc), alloc);
        obj.AddMember("start", position_json(f.start_line, f.start_col, alloc), alloc);
        obj.AddMember("end", position_json(f.end_line, f.end_col, alloc), alloc);
        const std::string severity = rule::to_string(f.severity);
        obj.AddMember("severity", rapidjson::Value(severity.c_str(), alloc), alloc);
        obj.AddMember("message", rapidjson::Value(f.message.c_str(), alloc), alloc);
        obj.AddMember("text", rapidjson::Value(f.matched_text.c_str(), alloc), alloc);
        doc.PushBack(obj, alloc);
    }

    writer.write_json_pretty(doc);
}

void print_findings_text(const std::vector<runner::Finding>& findings,
                         const std::filesystem::path& root, output::Writer& writer) {
    if (findings.empty()) {
        writer.write_line(output::Stream::Stdout, "No issues found.");
        return;
    }

    writer.write_line(output::Stream::Stdout,
                      std::to_string(findings.size()) + " issues found:");
    for (const auto& f : findings) {
        const std::string location = display_path(f.file, root) + ":" +
                                     std::to_string(f.start_line) + ":" +
                                     std::to_string(f.start_col);
        const std::string line = "  " + location + ": " + f.message + " [" + f.rule_id + "]";
        switch (f.severity) {
        case rule::Severity::Error:
            writer.red_line(line);
            break;
        case rule::Severity::Warning:
            writer.yellow_line(line);
            break;
        case rule::Severity::Info:
            writer.write_line(output::Stream::Stdout, line);
            break;
        }
        writer.write_line(output::Stream::Stdout, "    " + f.matched_text);
    }
}

// ----------------------------------------------------------------------------
// --list
// ----------------------------------------------------------------------------

int run_list(const cli::ListCommand& cmd, output::Writer& writer) {
    auto rules = load_rules(cmd.root, cmd.config, writer);
    if (!rules.has_value()) {
        return 1;
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& alloc = doc.GetAllocator();
        for (const auto& r : *rules) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("id", rapidjson::Value(r.id.c_str(), alloc), alloc);
            const std::string severity = rule::to_string(r.severity);
            obj.AddMember("severity", rapidjson::Value(severity.c_str(), alloc), alloc);
            rapidjson::Value langs(rapidjson::kArrayType);
            for (const auto& lang : r.languages) {
                langs.PushBack(rapidjson::Value(lang.c_str(), alloc), alloc);
            }
            obj.AddMember("languages", langs, alloc);
            obj.AddMember("message", rapidjson::Value(r.message.c_str(), alloc), alloc);
            obj.AddMember("fixable", r.fix.has_value(), alloc);
            obj.AddMember("builtin", r.builtin, alloc);
            doc.PushBack(obj, alloc);
        }
        writer.write_json_pretty(doc);
        return 0;
    }

    for (const auto& r : *rules) {
        std::string line = r.id + " (" + rule::to_string(r.severity) + ", " +
                           (r.builtin ? "builtin" : "project") + ")";
        if (r.fix.has_value()) {
            line += " [fixable]";
        }
        writer.write_line(output::Stream::Stdout, line);
        writer.write_line(output::Stream::Stdout, "    " + r.message);
    }
    writer.info("Loaded " + std::to_string(rules->size()) + " rules");
    return 0;
}

// ----------------------------------------------------------------------------
// Запуск правил
// ----------------------------------------------------------------------------

int run_check(const cli::RunCommand& cmd, output::Writer& writer) {
    if (cmd.output.has_value() && !writer.has_output_file()) {
        writer.error("Unable to write to specified output file - " +
                     platform::path_to_utf8(*cmd.output));
        return 1;
    }

    auto rules = load_rules(cmd.root, cmd.config, writer);
    if (!rules.has_value()) {
        return 1;
    }

    if (cmd.rule.has_value()) {
        const bool known = std::any_of(rules->begin(), rules->end(),
                                       [&cmd](const rule::Rule& r) { return r.id == *cmd.rule; });
        if (!known) {
            writer.error("Unknown rule - " + *cmd.rule);
            return 1;
        }
    }

    // --grammar-path имеет приоритет над путями по умолчанию
    std::vector<std::filesystem::path> search_paths = cmd.grammar_paths;
    for (auto& p : io::default_grammar_paths()) {
        search_paths.push_back(std::move(p));
    }
    io::GrammarLoader loader(std::move(search_paths));

    runner::RunOptions options;
    options.filter_rule = cmd.rule;
    options.debug = runner::DebugFlags::from_args(cmd.debug);
    options.writer = &writer;

    writer.info("Running " + std::to_string(cmd.rule.has_value() ? 1 : rules->size()) +
                " rules over " + platform::path_to_utf8(cmd.root));

    auto findings = runner::run_rules(*rules, cmd.root, loader, options);

    if (cmd.fix) {
        const std::size_t candidates = fix::fixable(findings);
        if (candidates > 0) {
            auto applied = fix::apply_fixes(findings);
            if (!applied) {
                writer.error(applied.error);
                return 1;
            }

            if (cmd.json) {
                rapidjson::Document doc;
                doc.SetObject();
                auto& alloc = doc.GetAllocator();
                doc.AddMember("fixed", static_cast<uint64_t>(applied.fixes_applied), alloc);
                doc.AddMember("files_modified", static_cast<uint64_t>(applied.files_modified),
                              alloc);
                writer.write_json_pretty(doc);
                return 0;
            }

            writer.write_line(output::Stream::Stdout,
                              "Fixed " + std::to_string(applied.fixes_applied) + " issue(s) in " +
                                  std::to_string(applied.files_modified) + " file(s).");

            // Повторный прогон: оставшиеся находки после исправлений
            findings = runner::run_rules(*rules, cmd.root, loader, options);
        } else {
            writer.info("No fixable issues found");
        }
    }

    if (cmd.json) {
        print_findings_json(findings, cmd.root, writer);
    } else {
        print_findings_text(findings, cmd.root, writer);
    }

    return runner::has_errors(findings) ? 1 : 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    if (const auto* run_cmd = std::get_if<cli::RunCommand>(&parse_result.command)) {
        out_cfg.output_path = run_cmd->output;
        // [timing] выводится через debug
        if (!run_cmd->debug.empty() && out_cfg.verbose < 1) {
            out_cfg.verbose = 1;
        }
    }
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ListCommand>) {
                return run_list(cmd, writer);
            } else {
                return run_check(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки: "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
