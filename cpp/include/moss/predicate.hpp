// ==============================================================================
// moss/predicate.hpp - Предикаты запросов (#eq? #match? #any-of? ...)
// ==============================================================================
//
// Назначение:
// - Закрытый набор операторов предикатов (tagged enum, без строковых сравнений
//   в конвейере)
// - Аргументы предиката: индекс захвата или строковый литерал
// - Вычисление предикатов по тексту захватов совпадения
//
// Модуль не зависит от tree-sitter: предикаты извлекаются в query.cpp один раз
// при компиляции запроса и далее используются как обычные значения.
//
// ==============================================================================

#ifndef MOSS_PREDICATE_HPP
#define MOSS_PREDICATE_HPP

#include <boost/regex.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace moss::query {

// ----------------------------------------------------------------------------
// Операторы
// ----------------------------------------------------------------------------

/// Оператор предиката
/// Неизвестные операторы сохраняются как Unknown и никогда не отклоняют совпадение
enum class PredicateOp {
    Eq,        // eq?
    NotEq,     // not-eq?
    Match,     // match?
    NotMatch,  // not-match?
    AnyOf,     // any-of?
    Unknown
};

/// Разобрать имя оператора ("eq?" -> Eq). Имя может быть с ведущим '#'.
PredicateOp parse_predicate_op(std::string_view name);

/// Имя оператора для диагностики
std::string to_string(PredicateOp op);

// ----------------------------------------------------------------------------
// Аргументы
// ----------------------------------------------------------------------------

/// Ссылка на захват по индексу в запросе
struct CaptureArg {
    uint32_t index = 0;

    bool operator==(const CaptureArg& other) const { return index == other.index; }
};

/// Аргумент: захват или строковый литерал
using PredicateArg = std::variant<CaptureArg, std::string>;

// ----------------------------------------------------------------------------
// Predicate
// ----------------------------------------------------------------------------

struct Predicate {
    PredicateOp op = PredicateOp::Unknown;
    std::string name;  // исходное имя оператора
    std::vector<PredicateArg> args;

    /// Скомпилированное регулярное выражение для match?/not-match?
    /// (Boost.Regex, perl-синтаксис; (?P<name>...) принимается как (?<name>...)).
    /// nullopt если второй аргумент не литерал или выражение некорректно
    std::optional<boost::regex> regex;
};

/// Построить предикат: определить оператор и заранее скомпилировать regex
Predicate make_predicate(std::string name, std::vector<PredicateArg> args);

// ----------------------------------------------------------------------------
// Вычисление
// ----------------------------------------------------------------------------

/// Текст одного захвата совпадения
struct CapturedText {
    uint32_t index = 0;
    std::string_view text;
};

/// Вычислить предикаты паттерна для совпадения (логическое И).
///
/// Семантика операторов:
/// - eq? / not-eq?: минимум 2 аргумента, каждый захват или литерал;
///   отсутствующий захват даёт пустую строку
/// - match? / not-match?: первый аргумент захват, второй литерал regex;
///   некорректный regex или исчерпание лимита сложности/стека при поиске -
///   предикат пропускается
/// - any-of?: первый аргумент захват, остальные литералы
/// - неизвестные операторы игнорируются
///
/// Для захвата с несколькими узлами используется первый.
bool evaluate_predicates(const std::vector<Predicate>& predicates,
                         const std::vector<CapturedText>& captures);

}  // namespace moss::query

#endif  // MOSS_PREDICATE_HPP
