// ==============================================================================
// moss/rule.hpp - Модель правил, встроенные правила, конфигурация
// ==============================================================================
//
// Назначение:
// - Структура правила (Rule) и уровни критичности (Severity)
// - Встроенный набор правил
// - Конфигурация .moss/config.yml (yaml-cpp): переопределения правил
// - Условия requires (проверка по SourceRegistry)
// - Allow-list путей (glob)
//
// ==============================================================================

#ifndef MOSS_RULE_HPP
#define MOSS_RULE_HPP

#include <moss/glob.hpp>
#include <moss/sources.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace moss::rule {

// ============================================================================
// Severity
// ============================================================================

enum class Severity { Error, Warning, Info };

/// Разобрать уровень ("error", "warning"/"warn", "info"), без учёта регистра
/// @throw std::invalid_argument если строка не распознана
Severity parse_severity(std::string_view s);

std::string to_string(Severity s);

// ============================================================================
// Rule
// ============================================================================

using GlobPattern = glob::Pattern;

/// Условие requires: ключ источника и ожидаемое значение с необязательным
/// префиксом-оператором (">=", "<=", "!", иначе равенство)
using Requirement = std::pair<std::string, std::string>;

/// Правило. Неизменно в течение прогона.
struct Rule {
    std::string id;
    std::string query_str;               // текст запроса tree-sitter
    std::vector<std::string> languages;  // пусто = правило для всех грамматик
    Severity severity = Severity::Warning;
    std::string message;
    std::optional<std::string> fix;         // шаблон исправления ($capture)
    std::vector<GlobPattern> allow;         // пути, где правило не применяется
    std::vector<Requirement> requirements;  // requires

    bool enabled = true;
    bool builtin = false;

    bool is_global() const { return languages.empty(); }
};

/// Путь (от корня, '/' как разделитель) попадает в allow-list правила
bool is_allowed_path(const Rule& rule, std::string_view rel_path);

/// Скомпилировать список glob-шаблонов; некорректные отбрасываются
std::vector<GlobPattern> compile_globs(const std::vector<std::string>& patterns);

/// Встроенные правила
std::vector<Rule> builtin_rules();

// ============================================================================
// Requires
// ============================================================================

/// Сравнить значения для >= / <=.
/// Если обе строки - числа с точками ("2021", "1.70.0"), сравнение покомпонентное
/// числовое, иначе лексикографическое. Возвращает <0, 0, >0.
int compare_values(std::string_view a, std::string_view b);

/// Проверить одно ожидаемое значение против фактического
bool requirement_matches(std::string_view actual, std::string_view expected);

/// Все условия requires выполнены (И); отсутствующий ключ - отказ
bool check_requires(const Rule& rule, const sources::SourceRegistry& registry,
                    const sources::SourceContext& ctx);

// ============================================================================
// Конфигурация
// ============================================================================

/// Переопределение правила из конфигурации
struct RuleOverride {
    std::optional<std::string> severity;  // некорректное значение игнорируется
    std::optional<bool> enabled;
    std::vector<std::string> allow;  // добавляется к allow-list правила
};

struct Config {
    std::map<std::string, RuleOverride> rules;
};

/// Ошибка загрузки конфигурации
struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Путь к конфигурации проекта: <root>/.moss/config.yml
std::filesystem::path default_config_path(const std::filesystem::path& root);

/// Загрузить конфигурацию. Отсутствующий файл - пустая конфигурация.
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из текста YAML
ConfigResult parse_config(std::string_view yaml, const std::string& origin = {});

/// Применить переопределения и удалить выключенные правила.
/// Переопределения для неизвестных id игнорируются.
void apply_overrides(std::vector<Rule>& rules, const Config& config);

}  // namespace moss::rule

#endif  // MOSS_RULE_HPP
