// ==============================================================================
// moss/fix.hpp - Применение автоисправлений
// ==============================================================================
//
// Назначение:
// - Подстановка захватов в шаблон исправления ($name)
// - Группировка находок по файлам и замена байтовых диапазонов
//   в порядке убывания смещения (смещения не пересчитываются)
// - Одна запись на файл
//
// ==============================================================================

#ifndef MOSS_FIX_HPP
#define MOSS_FIX_HPP

#include <moss/runner.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace moss::fix {

/// Заменить каждое "$name" значением захвата name (имена в порядке сортировки).
/// Токены без захвата остаются как есть. Подстановка строковая: значение,
/// содержащее "$other", может быть заменено повторно.
std::string expand_fix_template(std::string_view tmpl,
                                const std::map<std::string, std::string>& captures);

/// Результат применения исправлений
struct FixResult {
    bool ok = false;
    std::size_t files_modified = 0;
    std::size_t fixes_applied = 0;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Применить исправления всех находок с шаблоном.
///
/// Находки группируются по каноническому пути файла. Внутри файла находка,
/// диапазон которой пересекается с уже применённым, пропускается.
/// Первая ошибка чтения/записи или выход диапазона за пределы файла
/// останавливает обработку; уже записанные файлы остаются изменёнными.
FixResult apply_fixes(const std::vector<runner::Finding>& findings);

/// Количество находок с шаблоном исправления
std::size_t fixable(const std::vector<runner::Finding>& findings);

}  // namespace moss::fix

#endif  // MOSS_FIX_HPP
