// ==============================================================================
// moss/grammar.hpp - Загрузка грамматик tree-sitter из разделяемых библиотек
// ==============================================================================
//
// Назначение:
// - Пути поиска грамматик (MOSS_GRAMMAR_PATH, затем <config>/moss/grammars)
// - Загрузка <name>.so через dlopen и поиск символа tree_sitter_<name>
// - Кэш загруженных грамматик на время жизни загрузчика
// - Список доступных грамматик
//
// Отсутствующая грамматика - не ошибка: get() возвращает nullopt.
//
// ==============================================================================

#ifndef MOSS_GRAMMAR_HPP
#define MOSS_GRAMMAR_HPP

#include <moss/platform.hpp>
#include <moss/query.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace moss::io {

// ----------------------------------------------------------------------------
// Имена библиотек и символов
// ----------------------------------------------------------------------------

/// Имя файла библиотеки: "<name>.so" (".dylib" на macOS, ".dll" на Windows)
std::string grammar_library_name(std::string_view name);

/// Имя экспортируемой функции грамматики.
/// "tree_sitter_<name>" с заменой '-' на '_'; особые случаи:
/// rust -> tree_sitter_rust_orchard, vb -> tree_sitter_vb_dotnet
std::string grammar_symbol_name(std::string_view name);

/// Пути поиска по умолчанию: MOSS_GRAMMAR_PATH (по порядку), затем
/// <config dir>/moss/grammars
std::vector<std::filesystem::path> default_grammar_paths();

// ----------------------------------------------------------------------------
// GrammarLoader
// ----------------------------------------------------------------------------

class GrammarLoader {
public:
    /// Загрузчик с путями по умолчанию
    GrammarLoader();

    /// Загрузчик с явным списком путей
    explicit GrammarLoader(std::vector<std::filesystem::path> search_paths);

    GrammarLoader(const GrammarLoader&) = delete;
    GrammarLoader& operator=(const GrammarLoader&) = delete;

    /// Добавить путь поиска (с наименьшим приоритетом)
    void add_path(std::filesystem::path path);

    const std::vector<std::filesystem::path>& search_paths() const { return search_paths_; }

    /// Получить грамматику по имени (из кэша или загрузить).
    /// nullopt если библиотека не найдена или не содержит нужного символа.
    std::optional<query::Grammar> get(const std::string& name) const;

    /// Имена грамматик, найденных в путях поиска (отсортированы, без повторов)
    std::vector<std::string> available() const;

private:
    struct Loaded {
        platform::SharedLibrary library;
        query::Grammar grammar;
    };

    std::optional<query::Grammar> load_from_path(const std::string& name,
                                                 const std::filesystem::path& path) const;

    std::vector<std::filesystem::path> search_paths_;

    // Кэш: библиотеки остаются открытыми, пока жив загрузчик
    mutable std::map<std::string, Loaded> cache_;
    mutable std::set<std::string> missing_;
};

}  // namespace moss::io

#endif  // MOSS_GRAMMAR_HPP
