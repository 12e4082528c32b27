// ==============================================================================
// moss/output.hpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// RapidJSON для JSON сериализации.
// Только этот модуль пишет в stdout/stderr.
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами ([+] [!] [x] [*] [~])
// - Цветной вывод (ANSI escape codes) только для TTY
// - JSON вывод
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef MOSS_OUTPUT_HPP
#define MOSS_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace moss::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Записать жёлтую строку в stdout
    void yellow_line(std::string_view message);

    /// Записать красную строку в stdout
    void red_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (отступ 2 пробела)
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Проверить, открыт ли файл для вывода
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    /// Закрыть файл вывода
    void close_output_file();

    /// Записать байты (внутренний метод с учётом output file)
    void write_impl(Stream s, std::string_view bytes);

    /// Записать сообщение с цветным префиксом в stderr
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // Файл для вывода (если --output)
};

}  // namespace moss::output

#endif  // MOSS_OUTPUT_HPP
