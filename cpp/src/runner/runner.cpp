// ==============================================================================
// runner.cpp - Выполнение правил
// ==============================================================================

#include "moss/runner.hpp"

#include "moss/discovery.hpp"
#include "moss/output.hpp"
#include "moss/platform.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace moss::runner {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kAllowMarker = "moss-allow:";

std::string elapsed_ms(Clock::time_point start) {
    const double ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3fms", ms);
    return buf;
}

void log_timing(const RunOptions& options, const std::string& message) {
    if (options.debug.timing && options.writer != nullptr) {
        options.writer->debug("[timing] " + message);
    }
}

/// Строка с индексом idx (0-based); '\r' в конце отбрасывается
std::optional<std::string_view> nth_line(std::string_view content, std::size_t idx) {
    std::size_t start = 0;
    for (std::size_t i = 0; i < idx; ++i) {
        auto nl = content.find('\n', start);
        if (nl == std::string_view::npos) {
            return std::nullopt;
        }
        start = nl + 1;
    }
    if (start >= content.size()) {
        return std::nullopt;
    }
    auto end = content.find('\n', start);
    std::string_view line =
        content.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

std::string_view first_line(std::string_view text) {
    auto nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

/// Находки одного файла
void process_file(const std::filesystem::path& file, const std::filesystem::path& root,
                  const CombinedQuery& combined, query::Parser& parser,
                  const sources::SourceRegistry& registry, const RunOptions& options,
                  std::vector<Finding>& findings) {
    auto content = platform::read_file(file);
    if (!content.has_value()) {
        if (options.writer != nullptr) {
            options.writer->trace("skipping unreadable file - " + platform::path_to_utf8(file));
        }
        return;
    }

    auto tree = parser.parse(*content);
    if (!tree.has_value()) {
        if (options.writer != nullptr) {
            options.writer->trace("skipping unparsable file - " + platform::path_to_utf8(file));
        }
        return;
    }

    sources::SourceContext ctx;
    ctx.file_path = file;
    ctx.rel_path = platform::relative_utf8(file, root);
    ctx.project_root = root;

    const std::string_view source(*content);
    const auto& names = combined.query->capture_names();

    query::Cursor cursor;
    cursor.exec(*combined.query, *tree);

    query::Match m;
    while (cursor.next(m)) {
        if (m.pattern_index >= combined.pattern_to_rule.size()) {
            continue;
        }
        const PatternOwner& owner = combined.pattern_to_rule[m.pattern_index];
        const rule::Rule& r = *owner.rule;

        if (rule::is_allowed_path(r, ctx.rel_path)) {
            continue;
        }
        if (!rule::check_requires(r, registry, ctx)) {
            continue;
        }
        if (!query::evaluate_predicates(*combined.query, m, source)) {
            continue;
        }

        auto node = m.node_for(owner.match_capture);
        if (!node.has_value()) {
            continue;
        }

        const auto start = query::start_position(*node);
        const auto end = query::end_position(*node);
        const std::size_t start_line = start.row + 1;

        if (is_allowed_by_comment(source, start_line, r.id)) {
            continue;
        }

        Finding f;
        f.rule_id = r.id;
        f.file = file;
        f.start_line = start_line;
        f.start_col = start.column + 1;
        f.end_line = end.row + 1;
        f.end_col = end.column + 1;
        f.start_byte = query::start_byte(*node);
        f.end_byte = query::end_byte(*node);
        f.message = r.message;
        f.severity = r.severity;
        f.matched_text = std::string(first_line(query::node_text(*node, source)));
        f.fix = r.fix;
        for (const auto& cap : m.captures) {
            if (cap.index < names.size()) {
                f.captures[names[cap.index]] = std::string(query::node_text(cap.node, source));
            }
        }
        findings.push_back(std::move(f));
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Finding / DebugFlags
// ----------------------------------------------------------------------------

bool has_errors(const std::vector<Finding>& findings) {
    return std::any_of(findings.begin(), findings.end(),
                       [](const Finding& f) { return f.severity == rule::Severity::Error; });
}

DebugFlags DebugFlags::from_args(const std::vector<std::string>& args) {
    auto has = [&args](std::string_view name) {
        return std::find(args.begin(), args.end(), name) != args.end();
    };
    DebugFlags flags;
    flags.timing = has("all") || has("timing");
    return flags;
}

// ----------------------------------------------------------------------------
// CombinedQuery
// ----------------------------------------------------------------------------

std::vector<PatternOwner> build_pattern_to_rule(
    const std::vector<std::pair<const rule::Rule*, uint32_t>>& pattern_counts,
    uint32_t match_capture) {
    std::vector<PatternOwner> result;
    for (const auto& [r, count] : pattern_counts) {
        for (uint32_t i = 0; i < count; ++i) {
            result.push_back(PatternOwner{r, match_capture});
        }
    }
    return result;
}

std::vector<const rule::Rule*> candidate_rules(const std::vector<const rule::Rule*>& active,
                                               const std::string& grammar) {
    std::vector<const rule::Rule*> result;
    for (const auto* r : active) {
        if (!r->is_global() &&
            std::find(r->languages.begin(), r->languages.end(), grammar) != r->languages.end()) {
            result.push_back(r);
        }
    }
    for (const auto* r : active) {
        if (r->is_global()) {
            result.push_back(r);
        }
    }
    return result;
}

std::string combine_query_text(const std::vector<const rule::Rule*>& rules) {
    std::string text;
    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (i > 0) {
            text += "\n\n";
        }
        text += rules[i]->query_str;
    }
    return text;
}

std::optional<CombinedQuery> compile_combined(const query::Grammar& grammar,
                                              const std::vector<const rule::Rule*>& active,
                                              output::Writer* log) {
    std::vector<std::pair<const rule::Rule*, uint32_t>> compiled;

    for (const auto* r : candidate_rules(active, grammar.name)) {
        auto single = query::Query::compile(grammar, r->query_str);
        if (!single) {
            // Глобальное правило может ссылаться на узлы, которых нет в этой грамматике
            if (log != nullptr) {
                const std::string msg = "rule " + r->id + " does not compile for " +
                                        grammar.name + ": " + single.error.format();
                if (r->is_global()) {
                    log->trace(msg);
                } else {
                    log->warn(msg);
                }
            }
            continue;
        }
        compiled.emplace_back(r, single.query->pattern_count());
    }

    if (compiled.empty()) {
        return std::nullopt;
    }

    CombinedQuery combined;
    for (const auto& entry : compiled) {
        combined.rules.push_back(entry.first);
    }

    auto result = query::Query::compile(grammar, combine_query_text(combined.rules));
    if (!result) {
        if (log != nullptr) {
            log->warn("combined query failed for " + grammar.name + ": " + result.error.format());
        }
        return std::nullopt;
    }

    const uint32_t match_capture = result.query->capture_index("match").value_or(0);
    combined.pattern_to_rule = build_pattern_to_rule(compiled, match_capture);
    combined.query = std::move(result.query);
    return combined;
}

// ----------------------------------------------------------------------------
// Подавление комментариями moss-allow
// ----------------------------------------------------------------------------

bool line_has_allow_comment(std::string_view line, std::string_view rule_id) {
    auto pos = line.find(kAllowMarker);
    if (pos == std::string_view::npos) {
        return false;
    }

    std::string_view after = line.substr(pos + kAllowMarker.size());
    while (!after.empty() && std::isspace(static_cast<unsigned char>(after.front())) != 0) {
        after.remove_prefix(1);
    }
    if (after.substr(0, rule_id.size()) != rule_id) {
        return false;
    }

    std::string_view rest = after.substr(rule_id.size());
    return rest.empty() || std::isspace(static_cast<unsigned char>(rest.front())) != 0 ||
           rest.front() == '-' || rest.substr(0, 2) == "*/";
}

bool is_allowed_by_comment(std::string_view content, std::size_t start_line,
                           std::string_view rule_id) {
    const std::size_t idx = start_line > 0 ? start_line - 1 : 0;

    if (auto line = nth_line(content, idx); line && line_has_allow_comment(*line, rule_id)) {
        return true;
    }
    if (idx > 0) {
        if (auto line = nth_line(content, idx - 1); line && line_has_allow_comment(*line, rule_id)) {
            return true;
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// run_rules
// ----------------------------------------------------------------------------

std::vector<Finding> run_rules(const std::vector<rule::Rule>& rules,
                               const std::filesystem::path& root,
                               const io::GrammarLoader& loader, const RunOptions& options) {
    const auto start = Clock::now();

    io::DiscoveryOptions discovery;
    discovery.writer = options.writer;
    auto files = io::collect_source_files(root, discovery);

    log_timing(options, "file collection: " + elapsed_ms(start) + " (" +
                            std::to_string(files.size()) + " files)");

    auto findings = run_rules_on_files(rules, root, files, loader, options);

    log_timing(options, "total: " + elapsed_ms(start));
    return findings;
}

std::vector<Finding> run_rules_on_files(const std::vector<rule::Rule>& rules,
                                        const std::filesystem::path& root,
                                        const std::vector<std::filesystem::path>& files,
                                        const io::GrammarLoader& loader,
                                        const RunOptions& options) {
    std::vector<Finding> findings;

    std::vector<const rule::Rule*> active;
    for (const auto& r : rules) {
        if (!options.filter_rule.has_value() || r.id == *options.filter_rule) {
            active.push_back(&r);
        }
    }
    if (active.empty()) {
        return findings;
    }

    std::optional<sources::SourceRegistry> owned_registry;
    const sources::SourceRegistry* registry = options.sources;
    if (registry == nullptr) {
        owned_registry = sources::builtin_registry();
        registry = &*owned_registry;
    }

    const auto files_by_grammar = io::group_by_grammar(files);

    // Один объединённый запрос на грамматику
    const auto compile_start = Clock::now();
    std::map<std::string, CombinedQuery> combined_by_grammar;
    std::map<std::string, query::Grammar> grammars;

    for (const auto& [grammar_name, grammar_files] : files_by_grammar) {
        auto grammar = loader.get(grammar_name);
        if (!grammar.has_value()) {
            if (options.writer != nullptr) {
                options.writer->debug("grammar not available: " + grammar_name + " (" +
                                      std::to_string(grammar_files.size()) + " files skipped)");
            }
            continue;
        }

        auto combined = compile_combined(*grammar, active, options.writer);
        if (!combined.has_value()) {
            continue;
        }
        grammars.emplace(grammar_name, *grammar);
        combined_by_grammar.emplace(grammar_name, std::move(*combined));
    }

    log_timing(options, "query compilation: " + elapsed_ms(compile_start) + " (" +
                            std::to_string(combined_by_grammar.size()) + " grammars)");

    // Один разбор и один обход на файл
    const auto process_start = Clock::now();
    for (const auto& [grammar_name, grammar_files] : files_by_grammar) {
        auto it = combined_by_grammar.find(grammar_name);
        if (it == combined_by_grammar.end()) {
            continue;
        }

        query::Parser parser;
        if (!parser.set_language(grammars.at(grammar_name))) {
            if (options.writer != nullptr) {
                options.writer->warn("incompatible grammar: " + grammar_name);
            }
            continue;
        }

        for (const auto& file : grammar_files) {
            process_file(file, root, it->second, parser, *registry, options, findings);
        }
    }

    log_timing(options, "file processing: " + elapsed_ms(process_start) + " (" +
                            std::to_string(findings.size()) + " findings)");
    return findings;
}

}  // namespace moss::runner
