// ==============================================================================
// fix.cpp - Применение автоисправлений
// ==============================================================================

#include "moss/fix.hpp"

#include "moss/platform.hpp"

#include <algorithm>
#include <optional>
#include <system_error>

namespace moss::fix {

namespace {

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return;
    }
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::filesystem::path canonical_key(const std::filesystem::path& file) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(file, ec);
    return ec ? file : canonical;
}

}  // namespace

std::string expand_fix_template(std::string_view tmpl,
                                const std::map<std::string, std::string>& captures) {
    std::string result(tmpl);
    for (const auto& [name, value] : captures) {
        replace_all(result, "$" + name, value);
    }
    return result;
}

std::size_t fixable(const std::vector<runner::Finding>& findings) {
    return static_cast<std::size_t>(
        std::count_if(findings.begin(), findings.end(),
                      [](const runner::Finding& f) { return f.fix.has_value(); }));
}

FixResult apply_fixes(const std::vector<runner::Finding>& findings) {
    FixResult result;

    // Группировка по каноническому пути: один файл под разными именами
    // (символические ссылки) переписывается один раз
    std::map<std::filesystem::path, std::vector<const runner::Finding*>> by_file;
    for (const auto& f : findings) {
        if (f.fix.has_value()) {
            by_file[canonical_key(f.file)].push_back(&f);
        }
    }

    for (auto& [file, file_findings] : by_file) {
        std::stable_sort(file_findings.begin(), file_findings.end(),
                         [](const runner::Finding* a, const runner::Finding* b) {
                             return a->start_byte > b->start_byte;
                         });

        auto content = platform::read_file(file);
        if (!content.has_value()) {
            result.error = "failed to read file - " + platform::path_to_utf8(file);
            return result;
        }

        std::optional<std::size_t> applied_start;
        for (const auto* f : file_findings) {
            if (f->start_byte > f->end_byte || f->end_byte > content->size()) {
                result.error = "fix range out of bounds in " + platform::path_to_utf8(file) +
                               " (" + f->rule_id + " at line " + std::to_string(f->start_line) +
                               ")";
                return result;
            }
            // Диапазон пересекается с уже заменённым (или повторяет его)
            if (applied_start.has_value() &&
                (f->end_byte > *applied_start || f->start_byte == *applied_start)) {
                continue;
            }
            const std::string replacement = expand_fix_template(*f->fix, f->captures);
            content->replace(f->start_byte, f->end_byte - f->start_byte, replacement);
            applied_start = f->start_byte;
            ++result.fixes_applied;
        }

        if (!platform::write_file(file, *content)) {
            result.error = "failed to write file - " + platform::path_to_utf8(file);
            return result;
        }
        ++result.files_modified;
    }

    result.ok = true;
    return result;
}

}  // namespace moss::fix
