// ==============================================================================
// moss/discovery.hpp - Поиск исходных файлов
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход дерева проекта
// - Пропуск служебных каталогов VCS (.git, .hg, .svn)
// - Простые шаблоны из <root>/.gitignore
// - Только файлы с известной грамматикой (io::grammar_for_path)
// - Детерминированный порядок результатов (сортировка)
// - Группировка файлов по грамматикам
//
// ==============================================================================

#ifndef MOSS_DISCOVERY_HPP
#define MOSS_DISCOVERY_HPP

#include <moss/glob.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace moss::output {
class Writer;
}

namespace moss::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска файлов
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Учитывать <root>/.gitignore
    bool respect_gitignore = true;

    /// true: ошибки обхода выводятся предупреждениями и пропускаются
    /// false: std::runtime_error
    bool skip_errors = true;

    /// Куда писать предупреждения (nullptr - не писать)
    output::Writer* writer = nullptr;
};

// ----------------------------------------------------------------------------
// IgnoreRules - шаблоны .gitignore
// ----------------------------------------------------------------------------

/// Набор простых шаблонов игнорирования.
/// Пустые строки и '#' комментарии пропускаются, '!' (отрицание) не поддерживается,
/// завершающий '/' означает "только каталоги". Шаблон без '/' сравнивается с именем
/// файла на любой глубине, шаблон с '/' - с путём от корня.
class IgnoreRules {
public:
    /// Разобрать содержимое .gitignore
    static IgnoreRules parse(std::string_view content);

    /// Прочитать <root>/.gitignore (пустой набор если файла нет)
    static IgnoreRules load(const std::filesystem::path& root);

    /// Проверить путь относительно корня ('/' как разделитель)
    bool is_ignored(std::string_view rel_path, bool is_dir) const;

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

private:
    struct Entry {
        glob::Pattern pattern;
        bool dir_only = false;
        bool anchored = false;
    };

    std::vector<Entry> entries_;
};

// ----------------------------------------------------------------------------
// collect_source_files / group_by_grammar
// ----------------------------------------------------------------------------

/// Найти исходные файлы под root.
///
/// Если root - файл, он возвращается при наличии известной грамматики.
/// Результат отсортирован по пути.
///
/// @throws std::runtime_error если root не существует
///         (или при ошибке обхода, если skip_errors=false)
std::vector<std::filesystem::path> collect_source_files(const std::filesystem::path& root,
                                                        const DiscoveryOptions& opt = {});

/// Сгруппировать файлы по имени грамматики (ключи упорядочены по имени).
/// Файлы без известной грамматики отбрасываются, порядок внутри группы сохраняется.
std::map<std::string, std::vector<std::filesystem::path>> group_by_grammar(
    const std::vector<std::filesystem::path>& files);

}  // namespace moss::io

#endif  // MOSS_DISCOVERY_HPP
