// ==============================================================================
// grammar.cpp - Загрузка грамматик tree-sitter из разделяемых библиотек
// ==============================================================================

#include "moss/grammar.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace moss::io {

namespace {

using LanguageFn = const TSLanguage* (*)();

}  // namespace

// ----------------------------------------------------------------------------
// Имена библиотек и символов
// ----------------------------------------------------------------------------

std::string grammar_library_name(std::string_view name) {
    return std::string(name) + platform::shared_library_extension();
}

std::string grammar_symbol_name(std::string_view name) {
    if (name == "rust") {
        return "tree_sitter_rust_orchard";
    }
    if (name == "vb") {
        return "tree_sitter_vb_dotnet";
    }

    std::string normalized(name);
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    return "tree_sitter_" + normalized;
}

std::vector<std::filesystem::path> default_grammar_paths() {
    std::vector<std::filesystem::path> paths;

    if (auto env = platform::env_var("MOSS_GRAMMAR_PATH")) {
        const char sep = platform::path_list_separator();
        std::string::size_type start = 0;
        while (start <= env->size()) {
            auto end = env->find(sep, start);
            if (end == std::string::npos) {
                end = env->size();
            }
            if (end > start) {
                paths.push_back(platform::path_from_utf8(env->substr(start, end - start)));
            }
            start = end + 1;
        }
    }

    if (auto config = platform::config_dir()) {
        paths.push_back(*config / "moss" / "grammars");
    }

    return paths;
}

// ----------------------------------------------------------------------------
// GrammarLoader
// ----------------------------------------------------------------------------

GrammarLoader::GrammarLoader() : search_paths_(default_grammar_paths()) {}

GrammarLoader::GrammarLoader(std::vector<std::filesystem::path> search_paths)
    : search_paths_(std::move(search_paths)) {}

void GrammarLoader::add_path(std::filesystem::path path) {
    search_paths_.push_back(std::move(path));
}

std::optional<query::Grammar> GrammarLoader::get(const std::string& name) const {
    if (auto it = cache_.find(name); it != cache_.end()) {
        return it->second.grammar;
    }
    if (missing_.count(name) > 0) {
        return std::nullopt;
    }

    const std::string lib_name = grammar_library_name(name);
    for (const auto& dir : search_paths_) {
        std::error_code ec;
        auto lib_path = dir / lib_name;
        if (!std::filesystem::exists(lib_path, ec)) {
            continue;
        }
        if (auto grammar = load_from_path(name, lib_path)) {
            return grammar;
        }
    }

    missing_.insert(name);
    return std::nullopt;
}

std::optional<query::Grammar> GrammarLoader::load_from_path(
    const std::string& name, const std::filesystem::path& path) const {
    platform::SharedLibrary library;
    try {
        library = platform::SharedLibrary::open(path);
    } catch (const std::runtime_error&) {
        // Повреждённая или несовместимая библиотека: пробуем следующий путь
        return std::nullopt;
    }

    // Сборки грамматик со стандартным именем символа тоже принимаются
    void* symbol = library.symbol(grammar_symbol_name(name).c_str());
    if (symbol == nullptr) {
        std::string fallback = "tree_sitter_" + name;
        std::replace(fallback.begin(), fallback.end(), '-', '_');
        symbol = library.symbol(fallback.c_str());
    }
    if (symbol == nullptr) {
        return std::nullopt;
    }

    auto language_fn = reinterpret_cast<LanguageFn>(symbol);
    const TSLanguage* language = language_fn();
    if (language == nullptr) {
        return std::nullopt;
    }

    query::Grammar grammar{language, name};
    cache_.emplace(name, Loaded{std::move(library), grammar});
    return grammar;
}

std::vector<std::string> GrammarLoader::available() const {
    std::set<std::string> names;
    const std::string ext = platform::shared_library_extension();

    for (const auto& dir : search_paths_) {
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            continue;
        }
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            std::string file = platform::path_to_utf8(it->path().filename());
            if (file.size() > ext.size() &&
                file.compare(file.size() - ext.size(), ext.size(), ext) == 0) {
                names.insert(file.substr(0, file.size() - ext.size()));
            }
        }
    }

    return std::vector<std::string>(names.begin(), names.end());
}

}  // namespace moss::io
