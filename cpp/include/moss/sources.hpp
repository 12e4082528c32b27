// ==============================================================================
// moss/sources.hpp - Источники метаданных для условий requires
// ==============================================================================
//
// Назначение:
// - SourceContext: контекст файла (абсолютный путь, путь от корня, корень)
// - RuleSource: поставщик значений в своём пространстве имён ("rust", "env", ...)
// - SourceRegistry: поиск значения по ключу "namespace.field"
// - Встроенные источники: env, path, git (состояние репозитория), rust (Cargo.toml)
//
// Пример условия правила: rust.edition = ">=2021"
//
// ==============================================================================

#ifndef MOSS_SOURCES_HPP
#define MOSS_SOURCES_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace moss::sources {

// ----------------------------------------------------------------------------
// SourceContext
// ----------------------------------------------------------------------------

struct SourceContext {
    std::filesystem::path file_path;     // абсолютный путь к файлу
    std::string rel_path;                // путь от корня проекта ('/' как разделитель)
    std::filesystem::path project_root;  // корень проекта
};

/// Значения источника: field -> value
using Values = std::map<std::string, std::string>;

// ----------------------------------------------------------------------------
// RuleSource
// ----------------------------------------------------------------------------

class RuleSource {
public:
    virtual ~RuleSource() = default;

    /// Пространство имён источника ("rust", "env", "path")
    virtual std::string namespace_name() const = 0;

    /// Значения для файла. nullopt если источник к файлу не применим.
    virtual std::optional<Values> evaluate(const SourceContext& ctx) const = 0;
};

// ----------------------------------------------------------------------------
// SourceRegistry
// ----------------------------------------------------------------------------

class SourceRegistry {
public:
    SourceRegistry() = default;

    SourceRegistry(SourceRegistry&&) = default;
    SourceRegistry& operator=(SourceRegistry&&) = default;

    /// Зарегистрировать источник (порядок регистрации = приоритет)
    void add(std::unique_ptr<RuleSource> source);

    /// Значение по ключу "namespace.field".
    /// Ключ без '.' адресует источники с пустым пространством имён.
    /// Используется первый источник этого пространства имён, который применим
    /// к файлу; отсутствие поля в нём даёт nullopt.
    std::optional<std::string> get(const SourceContext& ctx, std::string_view key) const;

    /// Все значения для файла в виде "namespace.field" -> value
    Values evaluate(const SourceContext& ctx) const;

    std::vector<std::string> namespaces() const;
    std::size_t size() const { return sources_.size(); }

private:
    std::vector<std::unique_ptr<RuleSource>> sources_;
};

// ----------------------------------------------------------------------------
// Встроенные источники
// ----------------------------------------------------------------------------

/// env.<VAR> - переменные окружения процесса
class EnvSource : public RuleSource {
public:
    std::string namespace_name() const override { return "env"; }
    std::optional<Values> evaluate(const SourceContext& ctx) const override;
};

/// path.rel, path.abs, path.ext, path.filename
class PathSource : public RuleSource {
public:
    std::string namespace_name() const override { return "path"; }
    std::optional<Values> evaluate(const SourceContext& ctx) const override;
};

/// git.branch, git.staged, git.dirty - состояние git-репозитория корня проекта.
/// Команды git выполняются один раз на корень проекта; результат кэшируется.
/// Поле отсутствует, если соответствующая команда git не удалась.
class GitSource : public RuleSource {
public:
    std::string namespace_name() const override { return "git"; }
    std::optional<Values> evaluate(const SourceContext& ctx) const override;

private:
    struct RepoState {
        std::optional<std::string> branch;
        std::optional<std::set<std::string>> staged;  // пути из `git diff --cached`
        std::optional<bool> dirty;
    };

    const RepoState& state_for(const std::filesystem::path& root) const;

    mutable std::map<std::filesystem::path, RepoState> cache_;
};

/// rust.edition, rust.resolver, rust.name, rust.version из ближайшего Cargo.toml.
/// Применим только к файлам .rs.
class RustSource : public RuleSource {
public:
    std::string namespace_name() const override { return "rust"; }
    std::optional<Values> evaluate(const SourceContext& ctx) const override;

    /// Найти ближайший Cargo.toml, поднимаясь от каталога файла
    static std::optional<std::filesystem::path> find_cargo_toml(
        const std::filesystem::path& file_path);

    /// Простой разбор строк `key = "value"` для edition/resolver/name/version
    static Values parse_cargo_toml(std::string_view content);
};

/// Источник с фиксированными значениями (для встраивания и тестов)
class StaticSource : public RuleSource {
public:
    StaticSource(std::string ns, Values values)
        : namespace_(std::move(ns)), values_(std::move(values)) {}

    std::string namespace_name() const override { return namespace_; }
    std::optional<Values> evaluate(const SourceContext&) const override { return values_; }

private:
    std::string namespace_;
    Values values_;
};

/// Реестр со встроенными источниками: env, path, git, rust
SourceRegistry builtin_registry();

}  // namespace moss::sources

#endif  // MOSS_SOURCES_HPP
