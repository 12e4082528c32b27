// ==============================================================================
// sources.cpp - Источники метаданных для условий requires
// ==============================================================================

#include "moss/sources.hpp"

#include "moss/platform.hpp"

#include <initializer_list>
#include <system_error>

namespace moss::sources {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

bool strip_prefix(std::string_view& s, std::string_view prefix) {
    if (s.substr(0, prefix.size()) != prefix) {
        return false;
    }
    s.remove_prefix(prefix.size());
    return true;
}

std::string_view trim_newlines(std::string_view s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

/// Строки вывода команды без '\r' в конце
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

/// Значение из ` = "value"`, ` = 'value'` или ` = value`
std::optional<std::string> parse_toml_value(std::string_view rest) {
    rest = trim(rest);
    if (rest.empty() || rest.front() != '=') {
        return std::nullopt;
    }
    rest = trim(rest.substr(1));

    for (char quote : {'"', '\''}) {
        if (!rest.empty() && rest.front() == quote) {
            rest.remove_prefix(1);
            if (rest.empty() || rest.back() != quote) {
                return std::nullopt;
            }
            rest.remove_suffix(1);
            return std::string(rest);
        }
    }
    return std::string(rest);
}

}  // namespace

// ----------------------------------------------------------------------------
// SourceRegistry
// ----------------------------------------------------------------------------

void SourceRegistry::add(std::unique_ptr<RuleSource> source) {
    sources_.push_back(std::move(source));
}

std::optional<std::string> SourceRegistry::get(const SourceContext& ctx,
                                               std::string_view key) const {
    std::string_view ns;
    std::string_view field = key;
    if (auto dot = key.find('.'); dot != std::string_view::npos) {
        ns = key.substr(0, dot);
        field = key.substr(dot + 1);
    }

    for (const auto& source : sources_) {
        if (source->namespace_name() != ns) {
            continue;
        }
        auto values = source->evaluate(ctx);
        if (!values.has_value()) {
            continue;
        }
        auto it = values->find(std::string(field));
        if (it == values->end()) {
            return std::nullopt;
        }
        return it->second;
    }
    return std::nullopt;
}

Values SourceRegistry::evaluate(const SourceContext& ctx) const {
    Values result;
    for (const auto& source : sources_) {
        auto values = source->evaluate(ctx);
        if (!values.has_value()) {
            continue;
        }
        const std::string ns = source->namespace_name();
        for (const auto& [field, value] : *values) {
            result[ns.empty() ? field : ns + "." + field] = value;
        }
    }
    return result;
}

std::vector<std::string> SourceRegistry::namespaces() const {
    std::vector<std::string> result;
    result.reserve(sources_.size());
    for (const auto& source : sources_) {
        result.push_back(source->namespace_name());
    }
    return result;
}

// ----------------------------------------------------------------------------
// EnvSource / PathSource
// ----------------------------------------------------------------------------

std::optional<Values> EnvSource::evaluate(const SourceContext&) const {
    return platform::environment();
}

std::optional<Values> PathSource::evaluate(const SourceContext& ctx) const {
    Values result;
    result["rel"] = ctx.rel_path;
    result["abs"] = platform::path_to_utf8(ctx.file_path);

    if (ctx.file_path.has_extension()) {
        std::string ext = platform::path_to_utf8(ctx.file_path.extension());
        result["ext"] = ext.substr(1);
    }
    if (ctx.file_path.has_filename()) {
        result["filename"] = platform::path_to_utf8(ctx.file_path.filename());
    }
    return result;
}

// ----------------------------------------------------------------------------
// GitSource
// ----------------------------------------------------------------------------

const GitSource::RepoState& GitSource::state_for(const std::filesystem::path& root) const {
    auto it = cache_.find(root);
    if (it != cache_.end()) {
        return it->second;
    }

    const std::string dir = root.empty() ? std::string(".") : platform::path_to_utf8(root);
    RepoState state;

    if (auto r = platform::run_command({"git", "-C", dir, "rev-parse", "--abbrev-ref", "HEAD"})) {
        state.branch = std::string(trim(trim_newlines(r.output)));  // "HEAD" вне ветки
    }
    if (auto r = platform::run_command({"git", "-C", dir, "diff", "--cached", "--name-only"})) {
        std::set<std::string> staged;
        for (auto line : split_lines(r.output)) {
            if (!line.empty()) {
                staged.emplace(line);
            }
        }
        state.staged = std::move(staged);
    }
    if (auto r = platform::run_command({"git", "-C", dir, "status", "--porcelain"})) {
        state.dirty = !r.output.empty();
    }

    return cache_.emplace(root, std::move(state)).first->second;
}

std::optional<Values> GitSource::evaluate(const SourceContext& ctx) const {
    const RepoState& state = state_for(ctx.project_root);

    Values result;
    if (state.branch.has_value()) {
        result["branch"] = *state.branch;
    }
    if (state.staged.has_value()) {
        result["staged"] = state.staged->count(ctx.rel_path) > 0 ? "true" : "false";
    }
    if (state.dirty.has_value()) {
        result["dirty"] = *state.dirty ? "true" : "false";
    }
    return result;
}

// ----------------------------------------------------------------------------
// RustSource
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> RustSource::find_cargo_toml(
    const std::filesystem::path& file_path) {
    std::filesystem::path current = file_path.parent_path();
    while (!current.empty()) {
        std::error_code ec;
        auto candidate = current / "Cargo.toml";
        if (std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
        auto parent = current.parent_path();
        if (parent == current) {
            break;
        }
        current = parent;
    }
    return std::nullopt;
}

Values RustSource::parse_cargo_toml(std::string_view content) {
    static constexpr std::string_view kKeys[] = {"edition", "resolver", "name", "version"};

    Values result;
    std::size_t start = 0;
    while (start <= content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        std::string_view line = trim(content.substr(start, end - start));
        start = end + 1;

        for (auto key : kKeys) {
            std::string_view rest = line;
            if (strip_prefix(rest, key)) {
                if (auto value = parse_toml_value(rest)) {
                    result[std::string(key)] = *value;
                }
                break;
            }
        }
    }
    return result;
}

std::optional<Values> RustSource::evaluate(const SourceContext& ctx) const {
    if (ctx.file_path.extension() != ".rs") {
        return std::nullopt;
    }

    auto cargo_toml = find_cargo_toml(ctx.file_path);
    if (!cargo_toml.has_value()) {
        return std::nullopt;
    }
    auto content = platform::read_file(*cargo_toml);
    if (!content.has_value()) {
        return std::nullopt;
    }
    return parse_cargo_toml(*content);
}

// ----------------------------------------------------------------------------
// builtin_registry
// ----------------------------------------------------------------------------

SourceRegistry builtin_registry() {
    SourceRegistry registry;
    registry.add(std::make_unique<EnvSource>());
    registry.add(std::make_unique<PathSource>());
    registry.add(std::make_unique<GitSource>());
    registry.add(std::make_unique<RustSource>());
    return registry;
}

}  // namespace moss::sources
