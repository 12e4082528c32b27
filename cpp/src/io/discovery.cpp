// ==============================================================================
// discovery.cpp - Поиск исходных файлов
// ==============================================================================

#include "moss/discovery.hpp"

#include "moss/language.hpp"
#include "moss/output.hpp"
#include "moss/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace moss::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

bool is_vcs_dir(const std::string& name) {
    return name == ".git" || name == ".hg" || name == ".svn";
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

std::string_view basename(std::string_view rel_path) {
    auto pos = rel_path.rfind('/');
    return pos == std::string_view::npos ? rel_path : rel_path.substr(pos + 1);
}

/// Ошибка обхода: предупреждение (skip_errors) или исключение
void report(const DiscoveryOptions& opt, const std::string& message) {
    if (!opt.skip_errors) {
        throw std::runtime_error(message);
    }
    if (opt.writer != nullptr) {
        opt.writer->warn(message);
    }
}

/// Рекурсивно обходит каталог и собирает файлы с известной грамматикой
void collect_recursive(const std::filesystem::path& dir, const std::filesystem::path& root,
                       const IgnoreRules& ignore, const DiscoveryOptions& opt,
                       std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    std::filesystem::directory_iterator dir_iter(dir, ec);
    if (ec) {
        report(opt, "failed to read directory - " + platform::path_to_utf8(dir) + ": " +
                        ec.message());
        return;
    }

    for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            report(opt, "failed to enter directory - " + ec.message());
            return;
        }

        const std::filesystem::path entry_path = it->path();
        const std::string name = platform::path_to_utf8(entry_path.filename());

        // Ссылки на каталоги не обходятся (иначе цикл через ссылку на предка);
        // ссылка на файл учитывается как файл
        std::error_code status_ec;
        const bool is_link = it->is_symlink(status_ec);
        std::filesystem::file_status status;
        if (!status_ec) {
            status = it->status(status_ec);
        }
        if (status_ec) {
            report(opt, "failed to get metadata for file - " + platform::path_to_utf8(entry_path) +
                            ": " + status_ec.message());
            continue;
        }
        if (is_link && std::filesystem::is_directory(status)) {
            continue;
        }

        const bool is_dir = std::filesystem::is_directory(status);
        const std::string rel = platform::relative_utf8(entry_path, root);

        if (is_dir) {
            if (is_vcs_dir(name) || ignore.is_ignored(rel, true)) {
                continue;
            }
            collect_recursive(entry_path, root, ignore, opt, result);
        } else if (std::filesystem::is_regular_file(status)) {
            if (ignore.is_ignored(rel, false)) {
                continue;
            }
            if (grammar_for_path(entry_path).has_value()) {
                result.push_back(entry_path);
            }
        }
        // Прочие типы файлов игнорируются
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// IgnoreRules
// ----------------------------------------------------------------------------

IgnoreRules IgnoreRules::parse(std::string_view content) {
    IgnoreRules rules;

    std::size_t start = 0;
    while (start <= content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        std::string_view line = trim(content.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line.front() == '#' || line.front() == '!') {
            continue;
        }

        bool dir_only = false;
        if (line.back() == '/') {
            dir_only = true;
            line.remove_suffix(1);
        }

        bool anchored = line.find('/') != std::string_view::npos;
        if (!line.empty() && line.front() == '/') {
            line.remove_prefix(1);
        }
        if (line.empty()) {
            continue;
        }

        if (auto pattern = glob::Pattern::compile(line)) {
            rules.entries_.push_back(Entry{std::move(*pattern), dir_only, anchored});
        }
    }

    return rules;
}

IgnoreRules IgnoreRules::load(const std::filesystem::path& root) {
    auto content = platform::read_file(root / ".gitignore");
    if (!content.has_value()) {
        return IgnoreRules{};
    }
    return parse(*content);
}

bool IgnoreRules::is_ignored(std::string_view rel_path, bool is_dir) const {
    for (const auto& entry : entries_) {
        if (entry.dir_only && !is_dir) {
            continue;
        }
        std::string_view subject = entry.anchored ? rel_path : basename(rel_path);
        if (entry.pattern.matches(subject)) {
            return true;
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> collect_source_files(const std::filesystem::path& root,
                                                        const DiscoveryOptions& opt) {
    std::error_code ec;
    if (!std::filesystem::exists(root, ec) || ec) {
        throw std::runtime_error("Specified path does not exist - " + platform::path_to_utf8(root));
    }

    std::vector<std::filesystem::path> result;

    if (std::filesystem::is_regular_file(root, ec)) {
        if (grammar_for_path(root).has_value()) {
            result.push_back(root);
        }
        return result;
    }

    IgnoreRules ignore = opt.respect_gitignore ? IgnoreRules::load(root) : IgnoreRules{};
    collect_recursive(root, root, ignore, opt, result);

    // Порядок directory_iterator зависит от ОС
    std::sort(result.begin(), result.end());
    return result;
}

std::map<std::string, std::vector<std::filesystem::path>> group_by_grammar(
    const std::vector<std::filesystem::path>& files) {
    std::map<std::string, std::vector<std::filesystem::path>> groups;
    for (const auto& file : files) {
        if (auto grammar = grammar_for_path(file)) {
            groups[*grammar].push_back(file);
        }
    }
    return groups;
}

}  // namespace moss::io
