// ==============================================================================
// moss/query.hpp - Обёртки над tree-sitter C API
// ==============================================================================
//
// Назначение:
// - Grammar: невладеющий дескриптор TSLanguage + имя грамматики
// - Parser / Tree / Query / Cursor: RAII-владельцы объектов tree-sitter
// - Компиляция запросов с диагностикой (CompileResult)
// - Предикаты паттернов извлекаются один раз при компиляции
// - Вспомогательные функции для узлов (позиции, байты, текст)
//
// tree-sitter сам предикаты не применяет: это делает evaluate_predicates().
//
// ==============================================================================

#ifndef MOSS_QUERY_HPP
#define MOSS_QUERY_HPP

#include <moss/predicate.hpp>
#include <tree_sitter/api.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moss::query {

// ----------------------------------------------------------------------------
// Grammar
// ----------------------------------------------------------------------------

/// Грамматика языка. Владеет ей GrammarLoader (io::grammar).
struct Grammar {
    const TSLanguage* language = nullptr;
    std::string name;

    bool valid() const { return language != nullptr; }
};

// ----------------------------------------------------------------------------
// Tree
// ----------------------------------------------------------------------------

class Tree {
public:
    explicit Tree(TSTree* tree) : tree_(tree, &ts_tree_delete) {}

    TSNode root_node() const { return ts_tree_root_node(tree_.get()); }
    const TSTree* raw() const { return tree_.get(); }

private:
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree_;
};

// ----------------------------------------------------------------------------
// Parser
// ----------------------------------------------------------------------------

/// Парсер, привязанный к одной грамматике. Переиспользуется для всех файлов
/// этой грамматики последовательно.
class Parser {
public:
    Parser();

    /// Установить грамматику. false если версия ABI несовместима.
    bool set_language(const Grammar& grammar);

    /// Разобрать исходный текст. nullopt если дерево не построено.
    std::optional<Tree> parse(std::string_view content);

private:
    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser_;
};

// ----------------------------------------------------------------------------
// Query
// ----------------------------------------------------------------------------

/// Ошибка компиляции запроса
struct CompileError {
    std::string kind;     // "syntax", "node type", "field", "capture", "structure", "language"
    uint32_t offset = 0;  // байтовое смещение в тексте запроса

    std::string format() const;
};

class Query;

/// Результат компиляции запроса
struct CompileResult {
    bool ok = false;
    std::unique_ptr<Query> query;
    CompileError error;

    explicit operator bool() const { return ok; }
};

/// Скомпилированный запрос tree-sitter
class Query {
public:
    /// Скомпилировать текст запроса для грамматики
    static CompileResult compile(const Grammar& grammar, std::string_view source);

    /// Количество паттернов в запросе
    uint32_t pattern_count() const;

    /// Имена захватов по индексу
    const std::vector<std::string>& capture_names() const { return capture_names_; }

    /// Индекс захвата по имени
    std::optional<uint32_t> capture_index(std::string_view name) const;

    /// Предикаты паттерна (пустой список для неизвестного индекса)
    const std::vector<Predicate>& predicates(uint32_t pattern_index) const;

    const TSQuery* raw() const { return query_.get(); }

private:
    explicit Query(TSQuery* query);

    void extract_captures();
    void extract_predicates();

    std::unique_ptr<TSQuery, decltype(&ts_query_delete)> query_;
    std::vector<std::string> capture_names_;
    std::vector<std::vector<Predicate>> predicates_;
};

// ----------------------------------------------------------------------------
// Match / Cursor
// ----------------------------------------------------------------------------

struct Capture {
    uint32_t index = 0;
    TSNode node{};
};

struct Match {
    uint32_t pattern_index = 0;
    std::vector<Capture> captures;

    /// Первый узел захвата с указанным индексом
    std::optional<TSNode> node_for(uint32_t capture_index) const;
};

/// Курсор запроса: один обход дерева на файл
class Cursor {
public:
    Cursor();

    /// Запустить запрос по дереву
    void exec(const Query& query, const Tree& tree);

    /// Следующее совпадение. false когда совпадений больше нет.
    bool next(Match& out);

private:
    std::unique_ptr<TSQueryCursor, decltype(&ts_query_cursor_delete)> cursor_;
};

// ----------------------------------------------------------------------------
// Узлы
// ----------------------------------------------------------------------------

/// Позиция (0-based строка и колонка в байтах)
struct Position {
    uint32_t row = 0;
    uint32_t column = 0;
};

Position start_position(TSNode node);
Position end_position(TSNode node);
uint32_t start_byte(TSNode node);
uint32_t end_byte(TSNode node);

/// Текст узла в исходнике (пустой если диапазон вне source)
std::string_view node_text(TSNode node, std::string_view source);

/// Вычислить предикаты паттерна совпадения по исходному тексту
bool evaluate_predicates(const Query& query, const Match& match, std::string_view source);

}  // namespace moss::query

#endif  // MOSS_QUERY_HPP
