// ==============================================================================
// rule.cpp - Модель правил, встроенные правила, конфигурация
// ==============================================================================
//
// Конфигурация .moss/config.yml читается через yaml-cpp.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <moss/platform.hpp>
#include <moss/rule.hpp>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace moss::rule {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_digits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string_view> split_dots(std::string_view s) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto dot = s.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

bool is_dotted_number(std::string_view s) {
    auto parts = split_dots(s);
    return std::all_of(parts.begin(), parts.end(), is_digits);
}

/// Сравнить неотрицательные целые любой длины, записанные строками
int compare_numeric(std::string_view a, std::string_view b) {
    auto strip = [](std::string_view s) {
        while (s.size() > 1 && s.front() == '0') {
            s.remove_prefix(1);
        }
        return s;
    };
    a = strip(a);
    b = strip(b);
    if (a.size() != b.size()) {
        return a.size() < b.size() ? -1 : 1;
    }
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

bool strip_prefix(std::string_view& s, std::string_view prefix) {
    if (s.substr(0, prefix.size()) != prefix) {
        return false;
    }
    s.remove_prefix(prefix.size());
    return true;
}

Rule make_builtin(std::string id, std::vector<std::string> languages, Severity severity,
                  std::string message, std::string query) {
    Rule r;
    r.id = std::move(id);
    r.languages = std::move(languages);
    r.severity = severity;
    r.message = std::move(message);
    r.query_str = std::move(query);
    r.builtin = true;
    return r;
}

}  // namespace

// ============================================================================
// Severity
// ============================================================================

Severity parse_severity(std::string_view s) {
    const std::string lower = to_lower(s);
    if (lower == "error")
        return Severity::Error;
    if (lower == "warning" || lower == "warn")
        return Severity::Warning;
    if (lower == "info")
        return Severity::Info;
    throw std::invalid_argument("unknown severity, must be: error, warning or info");
}

std::string to_string(Severity s) {
    switch (s) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    }
    return "unknown";
}

// ============================================================================
// Rule
// ============================================================================

bool is_allowed_path(const Rule& rule, std::string_view rel_path) {
    return std::any_of(rule.allow.begin(), rule.allow.end(),
                       [rel_path](const GlobPattern& p) { return p.matches(rel_path); });
}

std::vector<GlobPattern> compile_globs(const std::vector<std::string>& patterns) {
    std::vector<GlobPattern> result;
    for (const auto& text : patterns) {
        if (auto p = GlobPattern::compile(text)) {
            result.push_back(std::move(*p));
        }
    }
    return result;
}

std::vector<Rule> builtin_rules() {
    std::vector<Rule> rules;

    // Rust
    rules.push_back(make_builtin("rust/dbg-macro", {"rust"}, Severity::Warning,
                                 "dbg! macro left in code",
                                 "((macro_invocation\n"
                                 "  macro: (identifier) @_macro) @match\n"
                                 " (#eq? @_macro \"dbg\"))"));

    rules.push_back(make_builtin("rust/todo-macro", {"rust"}, Severity::Warning,
                                 "todo!/unimplemented! left in code",
                                 "((macro_invocation\n"
                                 "  macro: (identifier) @_macro) @match\n"
                                 " (#any-of? @_macro \"todo\" \"unimplemented\"))"));

    Rule unwrap = make_builtin("rust/unwrap", {"rust"}, Severity::Info,
                               "unwrap() panics on None/Err; prefer expect() or propagation",
                               "((call_expression\n"
                               "  function: (field_expression\n"
                               "    value: (_) @call\n"
                               "    field: (field_identifier) @_method)\n"
                               "  arguments: (arguments)) @match\n"
                               " (#eq? @_method \"unwrap\"))");
    unwrap.fix = "$call.expect(\"TODO\")";
    unwrap.allow = compile_globs({"tests/**", "**/tests/**", "benches/**", "examples/**"});
    rules.push_back(std::move(unwrap));

    // Python
    rules.push_back(make_builtin("python/breakpoint", {"python"}, Severity::Warning,
                                 "breakpoint() left in code",
                                 "((call\n"
                                 "  function: (identifier) @_fn) @match\n"
                                 " (#eq? @_fn \"breakpoint\"))"));

    Rule print = make_builtin("python/print-debug", {"python"}, Severity::Info,
                              "print() call; use logging instead",
                              "((call\n"
                              "  function: (identifier) @_fn) @match\n"
                              " (#eq? @_fn \"print\"))");
    print.enabled = false;
    rules.push_back(std::move(print));

    // JavaScript / TypeScript
    rules.push_back(make_builtin("js/console-log", {"javascript", "typescript", "tsx"},
                                 Severity::Warning, "console logging left in code",
                                 "((call_expression\n"
                                 "  function: (member_expression\n"
                                 "    object: (identifier) @_obj\n"
                                 "    property: (property_identifier) @_prop)) @match\n"
                                 " (#eq? @_obj \"console\")\n"
                                 " (#any-of? @_prop \"log\" \"debug\" \"trace\"))"));

    rules.push_back(make_builtin("js/debugger", {"javascript", "typescript", "tsx"},
                                 Severity::Error, "debugger statement left in code",
                                 "(debugger_statement) @match"));

    // Go
    rules.push_back(make_builtin("go/fmt-print", {"go"}, Severity::Info,
                                 "fmt.Print* call; use a logger instead",
                                 "((call_expression\n"
                                 "  function: (selector_expression\n"
                                 "    operand: (identifier) @_pkg\n"
                                 "    field: (field_identifier) @_fn)) @match\n"
                                 " (#eq? @_pkg \"fmt\")\n"
                                 " (#match? @_fn \"^Print\"))"));

    return rules;
}

// ============================================================================
// Requires
// ============================================================================

int compare_values(std::string_view a, std::string_view b) {
    if (is_dotted_number(a) && is_dotted_number(b)) {
        auto pa = split_dots(a);
        auto pb = split_dots(b);
        const std::size_t n = std::max(pa.size(), pb.size());
        for (std::size_t i = 0; i < n; ++i) {
            std::string_view ca = i < pa.size() ? pa[i] : std::string_view("0");
            std::string_view cb = i < pb.size() ? pb[i] : std::string_view("0");
            if (int c = compare_numeric(ca, cb); c != 0) {
                return c;
            }
        }
        return 0;
    }

    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

bool requirement_matches(std::string_view actual, std::string_view expected) {
    std::string_view rest = expected;
    if (strip_prefix(rest, ">=")) {
        return compare_values(actual, rest) >= 0;
    }
    if (strip_prefix(rest, "<=")) {
        return compare_values(actual, rest) <= 0;
    }
    if (strip_prefix(rest, "!")) {
        return actual != rest;
    }
    return actual == expected;
}

bool check_requires(const Rule& rule, const sources::SourceRegistry& registry,
                    const sources::SourceContext& ctx) {
    for (const auto& [key, expected] : rule.requirements) {
        auto actual = registry.get(ctx, key);
        if (!actual.has_value()) {
            return false;
        }
        if (!requirement_matches(*actual, expected)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Конфигурация
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::filesystem::path default_config_path(const std::filesystem::path& root) {
    return root / ".moss" / "config.yml";
}

ConfigResult parse_config(std::string_view yaml, const std::string& origin) {
    ConfigResult result;

    try {
        const YAML::Node root = YAML::Load(std::string(yaml));
        if (!root || root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = Error{"config must be a mapping", origin};
            return result;
        }

        const YAML::Node rules = root["rules"];
        if (rules && !rules.IsNull()) {
            if (!rules.IsMap()) {
                result.error = Error{"'rules' must be a mapping of rule id to overrides", origin};
                return result;
            }

            for (const auto& kv : rules) {
                const std::string id = kv.first.as<std::string>();
                const YAML::Node& node = kv.second;
                RuleOverride ov;

                if (node.IsNull()) {
                    result.config.rules[id] = ov;
                    continue;
                }
                if (!node.IsMap()) {
                    result.error = Error{"override for '" + id + "' must be a mapping", origin};
                    return result;
                }

                if (node["severity"]) {
                    ov.severity = node["severity"].as<std::string>();
                }
                if (node["enabled"]) {
                    ov.enabled = node["enabled"].as<bool>();
                }
                if (const YAML::Node allow = node["allow"]) {
                    if (allow.IsSequence()) {
                        for (const auto& item : allow) {
                            ov.allow.push_back(item.as<std::string>());
                        }
                    } else if (allow.IsScalar()) {
                        ov.allow.push_back(allow.as<std::string>());
                    }
                }

                result.config.rules[id] = std::move(ov);
            }
        }

        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    }

    return result;
}

ConfigResult load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        ConfigResult result;
        result.ok = true;
        return result;
    }

    auto content = platform::read_file(path);
    if (!content.has_value()) {
        ConfigResult result;
        result.error = Error{"failed to read config file", platform::path_to_utf8(path)};
        return result;
    }
    return parse_config(*content, platform::path_to_utf8(path));
}

void apply_overrides(std::vector<Rule>& rules, const Config& config) {
    for (auto& rule : rules) {
        auto it = config.rules.find(rule.id);
        if (it == config.rules.end()) {
            continue;
        }
        const RuleOverride& ov = it->second;

        if (ov.severity.has_value()) {
            try {
                rule.severity = parse_severity(*ov.severity);
            } catch (const std::invalid_argument&) {
                // Неизвестный уровень: оставляем прежний
            }
        }
        if (ov.enabled.has_value()) {
            rule.enabled = *ov.enabled;
        }
        for (auto& p : compile_globs(ov.allow)) {
            rule.allow.push_back(std::move(p));
        }
    }

    rules.erase(std::remove_if(rules.begin(), rules.end(), [](const Rule& r) { return !r.enabled; }),
                rules.end());
}

}  // namespace moss::rule
