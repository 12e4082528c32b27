// ==============================================================================
// glob.cpp - Glob-шаблоны путей
// ==============================================================================

#include "moss/glob.hpp"

namespace moss::glob {

namespace {

bool is_regex_special(char c) {
    switch (c) {
    case '.':
    case '^':
    case '$':
    case '|':
    case '(':
    case ')':
    case '+':
    case '{':
    case '}':
    case '\\':
    case ']':
        return true;
    default:
        return false;
    }
}

/// Класс символов "[...]" начиная с позиции open ('[').
/// Возвращает позицию после ']' или npos для незакрытого класса.
std::size_t translate_class(std::string_view glob, std::size_t open, std::string& out) {
    std::size_t i = open + 1;
    bool negate = false;
    if (i < glob.size() && (glob[i] == '!' || glob[i] == '^')) {
        negate = true;
        ++i;
    }

    std::string body;
    bool first = true;
    for (; i < glob.size(); ++i) {
        char c = glob[i];
        if (c == ']' && !first) {
            break;
        }
        first = false;
        if (c == '\\' || c == '[' || c == ']' || c == '^') {
            body += '\\';
        }
        body += c;
    }

    if (i >= glob.size() || body.empty()) {
        return std::string_view::npos;
    }

    out += '[';
    if (negate) {
        out += '^';
    }
    out += body;
    out += ']';
    return i + 1;
}

}  // namespace

std::optional<std::string> glob_to_regex(std::string_view glob) {
    std::string out;
    out.reserve(glob.size() * 2);

    std::size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i];
        switch (c) {
        case '*': {
            std::size_t stars = 0;
            while (i < glob.size() && glob[i] == '*') {
                ++stars;
                ++i;
            }
            if (stars >= 2 && i < glob.size() && glob[i] == '/') {
                // "**/" - ноль или больше каталогов
                out += "(?:.*/)?";
                ++i;
            } else {
                out += ".*";
            }
            break;
        }
        case '?':
            out += '.';
            ++i;
            break;
        case '[': {
            std::size_t next = translate_class(glob, i, out);
            if (next == std::string_view::npos) {
                return std::nullopt;
            }
            i = next;
            break;
        }
        default:
            if (is_regex_special(c)) {
                out += '\\';
            }
            out += c;
            ++i;
            break;
        }
    }

    return out;
}

std::optional<Pattern> Pattern::compile(std::string_view text) {
    auto re = glob_to_regex(text);
    if (!re.has_value()) {
        return std::nullopt;
    }
    try {
        return Pattern(std::string(text), std::regex(*re, std::regex::ECMAScript));
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

bool Pattern::matches(std::string_view path) const {
    return std::regex_match(path.begin(), path.end(), regex_);
}

}  // namespace moss::glob
