// ==============================================================================
// language.cpp - Соответствие файлов и грамматик
// ==============================================================================

#include "moss/language.hpp"

#include "moss/platform.hpp"

#include <algorithm>
#include <set>

namespace moss::io {

namespace {

struct ExtensionEntry {
    std::string_view ext;
    std::string_view grammar;
};

// Первое совпадение выигрывает ("pl" -> perl, а не prolog)
constexpr ExtensionEntry kExtensions[] = {
    {"ada", "ada"},          {"adb", "ada"},           {"ads", "ada"},
    {"adoc", "asciidoc"},    {"asciidoc", "asciidoc"}, {"asc", "asciidoc"},
    {"bat", "batch"},        {"cmd", "batch"},         {"sh", "bash"},
    {"bash", "bash"},        {"c", "c"},               {"h", "c"},
    {"clj", "clojure"},      {"cljs", "clojure"},      {"cljc", "clojure"},
    {"edn", "clojure"},      {"cmake", "cmake"},       {"lisp", "commonlisp"},
    {"lsp", "commonlisp"},   {"cl", "commonlisp"},     {"asd", "commonlisp"},
    {"cpp", "cpp"},          {"cc", "cpp"},            {"cxx", "cpp"},
    {"hpp", "cpp"},          {"hh", "cpp"},            {"hxx", "cpp"},
    {"cs", "c_sharp"},       {"d", "d"},               {"di", "d"},
    {"dart", "dart"},        {"dts", "devicetree"},    {"dtsi", "devicetree"},
    {"dockerfile", "dockerfile"},                      {"el", "elisp"},
    {"ex", "elixir"},        {"exs", "elixir"},        {"elm", "elm"},
    {"erl", "erlang"},       {"hrl", "erlang"},        {"fish", "fish"},
    {"fs", "fsharp"},        {"fsi", "fsharp"},        {"fsx", "fsharp"},
    {"gleam", "gleam"},      {"glsl", "glsl"},         {"vert", "glsl"},
    {"frag", "glsl"},        {"geom", "glsl"},         {"comp", "glsl"},
    {"go", "go"},            {"graphql", "graphql"},   {"gql", "graphql"},
    {"groovy", "groovy"},    {"gradle", "groovy"},     {"hs", "haskell"},
    {"lhs", "haskell"},      {"tf", "hcl"},            {"tfvars", "hcl"},
    {"hcl", "hcl"},          {"hlsl", "hlsl"},         {"hlsli", "hlsl"},
    {"html", "html"},        {"htm", "html"},          {"idr", "idris"},
    {"java", "java"},        {"js", "javascript"},     {"mjs", "javascript"},
    {"cjs", "javascript"},   {"jsx", "javascript"},    {"jl", "julia"},
    {"kt", "kotlin"},        {"kts", "kotlin"},        {"lua", "lua"},
    {"nix", "nix"},          {"m", "objc"},            {"mm", "objc"},
    {"ml", "ocaml"},         {"mli", "ocaml"},         {"pl", "perl"},
    {"pm", "perl"},          {"php", "php"},           {"phtml", "php"},
    {"ps1", "powershell"},   {"psm1", "powershell"},   {"psd1", "powershell"},
    {"pro", "prolog"},       {"py", "python"},         {"pyi", "python"},
    {"pyw", "python"},       {"r", "r"},               {"R", "r"},
    {"res", "rescript"},     {"resi", "rescript"},     {"rb", "ruby"},
    {"rs", "rust"},          {"scala", "scala"},       {"sc", "scala"},
    {"scm", "scheme"},       {"ss", "scheme"},         {"rkt", "scheme"},
    {"scss", "scss"},        {"sass", "scss"},         {"sql", "sql"},
    {"svelte", "svelte"},    {"swift", "swift"},       {"ts", "typescript"},
    {"mts", "typescript"},   {"cts", "typescript"},    {"tsx", "tsx"},
    {"vb", "vb"},            {"vbs", "vb"},            {"v", "verilog"},
    {"sv", "verilog"},       {"svh", "verilog"},       {"vhd", "vhdl"},
    {"vhdl", "vhdl"},        {"vim", "vim"},           {"wit", "wit"},
    {"zig", "zig"},          {"zsh", "zsh"},
};

struct FileNameEntry {
    std::string_view name;
    std::string_view grammar;
};

constexpr FileNameEntry kFileNames[] = {
    {"Dockerfile", "dockerfile"}, {"Caddyfile", "caddy"},       {"CMakeLists.txt", "cmake"},
    {"meson.build", "meson"},     {"meson_options.txt", "meson"}, {".vimrc", "vim"},
    {".zshrc", "zsh"},            {".zshenv", "zsh"},           {".bashrc", "bash"},
};

}  // namespace

std::optional<std::string> grammar_for_extension(std::string_view ext) {
    for (const auto& entry : kExtensions) {
        if (entry.ext == ext) {
            return std::string(entry.grammar);
        }
    }
    return std::nullopt;
}

std::optional<std::string> grammar_for_path(const std::filesystem::path& path) {
    const std::string filename = platform::path_to_utf8(path.filename());
    for (const auto& entry : kFileNames) {
        if (entry.name == filename) {
            return std::string(entry.grammar);
        }
    }

    if (!path.has_extension()) {
        return std::nullopt;
    }
    std::string ext = platform::path_to_utf8(path.extension());
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return grammar_for_extension(ext);
}

std::vector<std::string> known_grammars() {
    std::set<std::string> names;
    for (const auto& entry : kExtensions) {
        names.emplace(entry.grammar);
    }
    for (const auto& entry : kFileNames) {
        names.emplace(entry.grammar);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

}  // namespace moss::io
