// ==============================================================================
// query.cpp - Обёртки над tree-sitter C API
// ==============================================================================

#include "moss/query.hpp"

#include <algorithm>

namespace moss::query {

namespace {

std::string query_error_kind(TSQueryError error) {
    switch (error) {
    case TSQueryErrorNone:
        return "none";
    case TSQueryErrorSyntax:
        return "syntax";
    case TSQueryErrorNodeType:
        return "node type";
    case TSQueryErrorField:
        return "field";
    case TSQueryErrorCapture:
        return "capture";
    case TSQueryErrorStructure:
        return "structure";
    case TSQueryErrorLanguage:
        return "language";
    }
    return "unknown";
}

const std::vector<Predicate>& empty_predicates() {
    static const std::vector<Predicate> empty;
    return empty;
}

}  // namespace

// ----------------------------------------------------------------------------
// Parser
// ----------------------------------------------------------------------------

Parser::Parser() : parser_(ts_parser_new(), &ts_parser_delete) {}

bool Parser::set_language(const Grammar& grammar) {
    if (!grammar.valid()) {
        return false;
    }
    return ts_parser_set_language(parser_.get(), grammar.language);
}

std::optional<Tree> Parser::parse(std::string_view content) {
    if (ts_parser_language(parser_.get()) == nullptr) {
        return std::nullopt;
    }
    TSTree* tree = ts_parser_parse_string(parser_.get(), nullptr, content.data(),
                                          static_cast<uint32_t>(content.size()));
    if (tree == nullptr) {
        return std::nullopt;
    }
    return Tree(tree);
}

// ----------------------------------------------------------------------------
// Query
// ----------------------------------------------------------------------------

std::string CompileError::format() const {
    return kind + " error at offset " + std::to_string(offset);
}

Query::Query(TSQuery* query) : query_(query, &ts_query_delete) {
    extract_captures();
    extract_predicates();
}

CompileResult Query::compile(const Grammar& grammar, std::string_view source) {
    CompileResult result;

    if (!grammar.valid()) {
        result.error = CompileError{"language", 0};
        return result;
    }

    uint32_t error_offset = 0;
    TSQueryError error_type = TSQueryErrorNone;
    TSQuery* raw = ts_query_new(grammar.language, source.data(),
                                static_cast<uint32_t>(source.size()), &error_offset, &error_type);
    if (raw == nullptr) {
        result.error = CompileError{query_error_kind(error_type), error_offset};
        return result;
    }

    result.query = std::unique_ptr<Query>(new Query(raw));
    result.ok = true;
    return result;
}

uint32_t Query::pattern_count() const {
    return ts_query_pattern_count(query_.get());
}

std::optional<uint32_t> Query::capture_index(std::string_view name) const {
    auto it = std::find(capture_names_.begin(), capture_names_.end(), name);
    if (it == capture_names_.end()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(it - capture_names_.begin());
}

const std::vector<Predicate>& Query::predicates(uint32_t pattern_index) const {
    if (pattern_index >= predicates_.size()) {
        return empty_predicates();
    }
    return predicates_[pattern_index];
}

void Query::extract_captures() {
    uint32_t count = ts_query_capture_count(query_.get());
    capture_names_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t len = 0;
        const char* name = ts_query_capture_name_for_id(query_.get(), i, &len);
        capture_names_.emplace_back(name, len);
    }
}

void Query::extract_predicates() {
    // Шаги предиката: String(оператор), аргументы (Capture | String), Done
    uint32_t patterns = pattern_count();
    predicates_.resize(patterns);

    for (uint32_t pattern = 0; pattern < patterns; ++pattern) {
        uint32_t step_count = 0;
        const TSQueryPredicateStep* steps =
            ts_query_predicates_for_pattern(query_.get(), pattern, &step_count);

        std::optional<std::string> op;
        std::vector<PredicateArg> args;

        for (uint32_t i = 0; i < step_count; ++i) {
            const TSQueryPredicateStep& step = steps[i];
            switch (step.type) {
            case TSQueryPredicateStepTypeDone:
                if (op.has_value()) {
                    predicates_[pattern].push_back(make_predicate(std::move(*op), std::move(args)));
                }
                op.reset();
                args.clear();
                break;
            case TSQueryPredicateStepTypeCapture:
                args.emplace_back(CaptureArg{step.value_id});
                break;
            case TSQueryPredicateStepTypeString: {
                uint32_t len = 0;
                const char* value = ts_query_string_value_for_id(query_.get(), step.value_id, &len);
                if (!op.has_value()) {
                    op = std::string(value, len);
                } else {
                    args.emplace_back(std::string(value, len));
                }
                break;
            }
            }
        }
    }
}

// ----------------------------------------------------------------------------
// Match / Cursor
// ----------------------------------------------------------------------------

std::optional<TSNode> Match::node_for(uint32_t capture_index) const {
    for (const auto& c : captures) {
        if (c.index == capture_index) {
            return c.node;
        }
    }
    return std::nullopt;
}

Cursor::Cursor() : cursor_(ts_query_cursor_new(), &ts_query_cursor_delete) {}

void Cursor::exec(const Query& query, const Tree& tree) {
    ts_query_cursor_exec(cursor_.get(), query.raw(), tree.root_node());
}

bool Cursor::next(Match& out) {
    TSQueryMatch raw;
    if (!ts_query_cursor_next_match(cursor_.get(), &raw)) {
        return false;
    }

    out.pattern_index = raw.pattern_index;
    out.captures.clear();
    out.captures.reserve(raw.capture_count);
    for (uint16_t i = 0; i < raw.capture_count; ++i) {
        out.captures.push_back(Capture{raw.captures[i].index, raw.captures[i].node});
    }
    return true;
}

// ----------------------------------------------------------------------------
// Узлы
// ----------------------------------------------------------------------------

Position start_position(TSNode node) {
    TSPoint p = ts_node_start_point(node);
    return Position{p.row, p.column};
}

Position end_position(TSNode node) {
    TSPoint p = ts_node_end_point(node);
    return Position{p.row, p.column};
}

uint32_t start_byte(TSNode node) {
    return ts_node_start_byte(node);
}

uint32_t end_byte(TSNode node) {
    return ts_node_end_byte(node);
}

std::string_view node_text(TSNode node, std::string_view source) {
    uint32_t begin = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (begin > end || end > source.size()) {
        return {};
    }
    return source.substr(begin, end - begin);
}

bool evaluate_predicates(const Query& query, const Match& match, std::string_view source) {
    const auto& predicates = query.predicates(match.pattern_index);
    if (predicates.empty()) {
        return true;
    }

    std::vector<CapturedText> captures;
    captures.reserve(match.captures.size());
    for (const auto& c : match.captures) {
        captures.push_back(CapturedText{c.index, node_text(c.node, source)});
    }
    return evaluate_predicates(predicates, captures);
}

}  // namespace moss::query
