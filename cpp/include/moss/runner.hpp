// ==============================================================================
// moss/runner.hpp - Выполнение правил: один запрос на грамматику, один обход на файл
// ==============================================================================
//
// Назначение:
// - Сборка объединённого запроса (CombinedQuery) для каждой грамматики
// - pattern_to_rule: индекс паттерна -> правило-владелец (O(1) без строк)
// - Один разбор и один обход дерева на файл независимо от числа правил
// - Фильтры в фиксированном порядке: allow-list, requires, предикаты, moss-allow
// - Finding создаётся только после прохождения всех фильтров
//
// Порядок правил в объединённом запросе: сначала правила с явным списком языков
// (в исходном порядке), затем глобальные (в исходном порядке).
//
// ==============================================================================

#ifndef MOSS_RUNNER_HPP
#define MOSS_RUNNER_HPP

#include <moss/grammar.hpp>
#include <moss/query.hpp>
#include <moss/rule.hpp>
#include <moss/sources.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace moss::output {
class Writer;
}

namespace moss::runner {

// ----------------------------------------------------------------------------
// Finding
// ----------------------------------------------------------------------------

/// Найденное нарушение. Не изменяется после создания.
struct Finding {
    std::string rule_id;
    std::filesystem::path file;
    std::size_t start_line = 0;  // 1-based
    std::size_t start_col = 0;   // 1-based, в байтах
    std::size_t end_line = 0;
    std::size_t end_col = 0;
    std::size_t start_byte = 0;
    std::size_t end_byte = 0;
    std::string message;
    rule::Severity severity = rule::Severity::Warning;
    std::string matched_text;                     // первая строка совпавшего текста
    std::optional<std::string> fix;               // шаблон исправления правила
    std::map<std::string, std::string> captures;  // имя захвата -> текст
};

/// Есть ли среди находок уровень error
bool has_errors(const std::vector<Finding>& findings);

// ----------------------------------------------------------------------------
// DebugFlags
// ----------------------------------------------------------------------------

struct DebugFlags {
    bool timing = false;

    /// Категории из --debug: "timing", "all"
    static DebugFlags from_args(const std::vector<std::string>& args);
};

// ----------------------------------------------------------------------------
// CombinedQuery
// ----------------------------------------------------------------------------

/// Владелец паттерна объединённого запроса
struct PatternOwner {
    const rule::Rule* rule = nullptr;
    uint32_t match_capture = 0;  // индекс захвата "match" в объединённом запросе
};

/// Построить pattern_to_rule: каждое правило занимает столько подряд идущих
/// позиций, сколько паттернов даёт его собственный запрос.
std::vector<PatternOwner> build_pattern_to_rule(
    const std::vector<std::pair<const rule::Rule*, uint32_t>>& pattern_counts,
    uint32_t match_capture);

/// Правила-кандидаты для грамматики: специфичные с этой грамматикой в languages,
/// затем все глобальные. Порядок внутри групп сохраняется.
std::vector<const rule::Rule*> candidate_rules(const std::vector<const rule::Rule*>& active,
                                               const std::string& grammar);

/// Текст объединённого запроса: тексты правил через пустую строку
std::string combine_query_text(const std::vector<const rule::Rule*>& rules);

struct CombinedQuery {
    std::unique_ptr<query::Query> query;
    std::vector<PatternOwner> pattern_to_rule;
    std::vector<const rule::Rule*> rules;  // правила, вошедшие в запрос
};

/// Собрать объединённый запрос для грамматики.
///
/// Каждое правило-кандидат компилируется отдельно: ошибка специфичного правила
/// выводится предупреждением, глобальное правило молча отбрасывается.
/// nullopt если ни одно правило не скомпилировалось или не скомпилировался
/// объединённый запрос (предупреждение с именем грамматики и причиной).
std::optional<CombinedQuery> compile_combined(const query::Grammar& grammar,
                                              const std::vector<const rule::Rule*>& active,
                                              output::Writer* log = nullptr);

// ----------------------------------------------------------------------------
// Подавление комментариями moss-allow
// ----------------------------------------------------------------------------

/// Строка содержит "moss-allow: <rule_id>", за которым идёт конец строки,
/// пробел, '-' или "*/"
bool line_has_allow_comment(std::string_view line, std::string_view rule_id);

/// Маркер на строке находки или на строке над ней (start_line 1-based)
bool is_allowed_by_comment(std::string_view content, std::size_t start_line,
                           std::string_view rule_id);

// ----------------------------------------------------------------------------
// run_rules
// ----------------------------------------------------------------------------

struct RunOptions {
    /// Запускать только правило с этим id
    std::optional<std::string> filter_rule;

    DebugFlags debug;

    /// Реестр источников для requires (nullptr - встроенный реестр)
    const sources::SourceRegistry* sources = nullptr;

    /// Диагностика (nullptr - без вывода)
    output::Writer* writer = nullptr;
};

/// Выполнить правила по всем исходным файлам под root.
/// @throws std::runtime_error если root не существует
std::vector<Finding> run_rules(const std::vector<rule::Rule>& rules,
                               const std::filesystem::path& root,
                               const io::GrammarLoader& loader, const RunOptions& options = {});

/// То же по явному списку файлов (пути относительно root вычисляются лексически)
std::vector<Finding> run_rules_on_files(const std::vector<rule::Rule>& rules,
                                        const std::filesystem::path& root,
                                        const std::vector<std::filesystem::path>& files,
                                        const io::GrammarLoader& loader,
                                        const RunOptions& options = {});

}  // namespace moss::runner

#endif  // MOSS_RUNNER_HPP
