// ==============================================================================
// predicate.cpp - Предикаты запросов
// ==============================================================================
//
// Регулярные выражения: Boost.Regex (perl), поиск подстроки (regex_search).
// Нерекурсивный сопоставитель Boost при слишком сложном поиске бросает
// regex_error (error_complexity/error_stack) вместо переполнения стека.
//
// ==============================================================================

#include "moss/predicate.hpp"

#include <algorithm>

namespace moss::query {

namespace {

/// Текст захвата по индексу (первый узел); пустая строка если захвата нет
std::string_view capture_text(const std::vector<CapturedText>& captures, uint32_t index) {
    auto it = std::find_if(captures.begin(), captures.end(),
                           [index](const CapturedText& c) { return c.index == index; });
    if (it == captures.end()) {
        return {};
    }
    return it->text;
}

/// Разрешить аргумент: захват -> его текст, литерал -> сам литерал
std::string_view resolve_arg(const PredicateArg& arg, const std::vector<CapturedText>& captures) {
    if (const auto* cap = std::get_if<CaptureArg>(&arg)) {
        return capture_text(captures, cap->index);
    }
    return std::get<std::string>(arg);
}

bool eval_eq(const Predicate& p, const std::vector<CapturedText>& captures) {
    if (p.args.size() < 2) {
        return true;
    }
    bool equal = resolve_arg(p.args[0], captures) == resolve_arg(p.args[1], captures);
    return p.op == PredicateOp::Eq ? equal : !equal;
}

bool eval_match(const Predicate& p, const std::vector<CapturedText>& captures) {
    if (p.args.size() < 2) {
        return true;
    }
    const auto* cap = std::get_if<CaptureArg>(&p.args[0]);
    if (cap == nullptr || !p.regex.has_value()) {
        return true;
    }

    std::string_view text = capture_text(captures, cap->index);
    bool matches = false;
    try {
        matches = boost::regex_search(text.data(), text.data() + text.size(), *p.regex);
    } catch (const boost::regex_error&) {
        // Лимит сложности или стека: предикат проходит, как некорректный regex
        return true;
    }
    return p.op == PredicateOp::Match ? matches : !matches;
}

/// Именованные группы в стиле Python/Rust: "(?P<name>" -> "(?<name>"
std::string normalize_named_groups(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size());
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\' && i + 1 < pattern.size()) {
            out += pattern[i];
            out += pattern[++i];
            continue;
        }
        if (pattern.compare(i, 4, "(?P<") == 0) {
            out += "(?<";
            i += 3;
            continue;
        }
        out += pattern[i];
    }
    return out;
}

bool eval_any_of(const Predicate& p, const std::vector<CapturedText>& captures) {
    if (p.args.size() < 2) {
        return true;
    }
    const auto* cap = std::get_if<CaptureArg>(&p.args[0]);
    if (cap == nullptr) {
        return true;
    }

    std::string_view text = capture_text(captures, cap->index);
    return std::any_of(p.args.begin() + 1, p.args.end(), [text](const PredicateArg& arg) {
        const auto* lit = std::get_if<std::string>(&arg);
        return lit != nullptr && *lit == text;
    });
}

}  // namespace

// ----------------------------------------------------------------------------
// Операторы
// ----------------------------------------------------------------------------

PredicateOp parse_predicate_op(std::string_view name) {
    if (!name.empty() && name.front() == '#') {
        name.remove_prefix(1);
    }
    if (name == "eq?")
        return PredicateOp::Eq;
    if (name == "not-eq?")
        return PredicateOp::NotEq;
    if (name == "match?")
        return PredicateOp::Match;
    if (name == "not-match?")
        return PredicateOp::NotMatch;
    if (name == "any-of?")
        return PredicateOp::AnyOf;
    return PredicateOp::Unknown;
}

std::string to_string(PredicateOp op) {
    switch (op) {
    case PredicateOp::Eq:
        return "eq?";
    case PredicateOp::NotEq:
        return "not-eq?";
    case PredicateOp::Match:
        return "match?";
    case PredicateOp::NotMatch:
        return "not-match?";
    case PredicateOp::AnyOf:
        return "any-of?";
    case PredicateOp::Unknown:
        break;
    }
    return "unknown";
}

Predicate make_predicate(std::string name, std::vector<PredicateArg> args) {
    Predicate p;
    p.op = parse_predicate_op(name);
    p.name = std::move(name);
    p.args = std::move(args);

    if ((p.op == PredicateOp::Match || p.op == PredicateOp::NotMatch) && p.args.size() >= 2) {
        if (const auto* pattern = std::get_if<std::string>(&p.args[1])) {
            try {
                // ^/$ только на границах текста, '.' не захватывает '\n'
                p.regex = boost::regex(normalize_named_groups(*pattern),
                                       boost::regex::perl | boost::regex::no_mod_m |
                                           boost::regex::no_mod_s);
            } catch (const boost::regex_error&) {
                // Некорректный regex: предикат всегда проходит
                p.regex = std::nullopt;
            }
        }
    }
    return p;
}

// ----------------------------------------------------------------------------
// Вычисление
// ----------------------------------------------------------------------------

bool evaluate_predicates(const std::vector<Predicate>& predicates,
                         const std::vector<CapturedText>& captures) {
    for (const auto& p : predicates) {
        bool ok = true;
        switch (p.op) {
        case PredicateOp::Eq:
        case PredicateOp::NotEq:
            ok = eval_eq(p, captures);
            break;
        case PredicateOp::Match:
        case PredicateOp::NotMatch:
            ok = eval_match(p, captures);
            break;
        case PredicateOp::AnyOf:
            ok = eval_any_of(p, captures);
            break;
        case PredicateOp::Unknown:
            break;
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

}  // namespace moss::query
