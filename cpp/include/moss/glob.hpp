// ==============================================================================
// moss/glob.hpp - Glob-шаблоны путей
// ==============================================================================
//
// Синтаксис: '*', '**', '?', '[abc]', '[a-z]', '[!abc]'.
// '*' может пересекать '/', пути сравниваются с учётом регистра.
// Шаблон транслируется в std::regex один раз при компиляции.
//
// ==============================================================================

#ifndef MOSS_GLOB_HPP
#define MOSS_GLOB_HPP

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace moss::glob {

class Pattern {
public:
    /// Скомпилировать шаблон. nullopt для некорректного шаблона
    /// (незакрытый '[', пустой класс символов).
    static std::optional<Pattern> compile(std::string_view text);

    /// Проверить путь (разделитель '/') на полное совпадение
    bool matches(std::string_view path) const;

    const std::string& text() const { return text_; }

private:
    Pattern(std::string text, std::regex regex)
        : text_(std::move(text)), regex_(std::move(regex)) {}

    std::string text_;
    std::regex regex_;
};

/// Транслировать glob в регулярное выражение ECMAScript (без якорей).
/// nullopt для некорректного шаблона.
std::optional<std::string> glob_to_regex(std::string_view glob);

}  // namespace moss::glob

#endif  // MOSS_GLOB_HPP
