// ==============================================================================
// moss/language.hpp - Соответствие файлов и грамматик
// ==============================================================================
//
// Назначение:
// - Расширение файла -> имя грамматики tree-sitter
// - Особые имена файлов (Dockerfile, CMakeLists.txt, meson.build, ...)
//
// ==============================================================================

#ifndef MOSS_LANGUAGE_HPP
#define MOSS_LANGUAGE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moss::io {

/// Грамматика по расширению без точки ("rs" -> "rust"), с учётом регистра
std::optional<std::string> grammar_for_extension(std::string_view ext);

/// Грамматика для пути: сначала имя файла, затем расширение
std::optional<std::string> grammar_for_path(const std::filesystem::path& path);

/// Все известные имена грамматик (отсортированы, без повторов)
std::vector<std::string> known_grammars();

}  // namespace moss::io

#endif  // MOSS_LANGUAGE_HPP
