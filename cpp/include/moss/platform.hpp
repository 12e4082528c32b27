// ==============================================================================
// moss/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Каталоги конфигурации пользователя
// - Загрузка разделяемых библиотек (грамматики tree-sitter)
// - Чтение/запись файлов целиком
// - Временные файлы (для тестов)
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef MOSS_PLATFORM_HPP
#define MOSS_PLATFORM_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moss::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// Путь относительно root в виде UTF-8 с разделителем '/'
/// Если path не лежит под root, возвращается path целиком;
/// если path совпадает с root - пустая строка
std::string relative_utf8(const std::filesystem::path& path, const std::filesystem::path& root);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Значение переменной окружения (nullopt если не задана)
std::optional<std::string> env_var(const char* name);

/// Все переменные окружения процесса
std::map<std::string, std::string> environment();

/// Каталог пользовательской конфигурации: $XDG_CONFIG_HOME или ~/.config
/// (на Windows - %APPDATA%). nullopt если определить не удалось.
std::optional<std::filesystem::path> config_dir();

/// Разделитель списков путей в переменных окружения (':' или ';')
char path_list_separator();

// ----------------------------------------------------------------------------
// Разделяемые библиотеки
// ----------------------------------------------------------------------------

/// Расширение разделяемой библиотеки с точкой: ".so", ".dylib", ".dll"
const char* shared_library_extension();

/// RAII-владелец загруженной разделяемой библиотеки
class SharedLibrary {
public:
    SharedLibrary() = default;
    ~SharedLibrary();

    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    /// Открыть библиотеку
    /// @throws std::runtime_error если библиотеку загрузить не удалось
    static SharedLibrary open(const std::filesystem::path& path);

    /// Найти символ (nullptr если отсутствует)
    void* symbol(const char* name) const;

    bool is_open() const { return handle_ != nullptr; }

private:
    explicit SharedLibrary(void* handle) : handle_(handle) {}

    void close();

    void* handle_ = nullptr;
};

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Прочитать файл целиком (байты как есть). nullopt при ошибке ввода-вывода.
std::optional<std::string> read_file(const std::filesystem::path& path);

/// Записать файл целиком (с усечением). false при ошибке ввода-вывода.
bool write_file(const std::filesystem::path& path, std::string_view data);

// ----------------------------------------------------------------------------
// Внешние процессы
// ----------------------------------------------------------------------------

/// Результат запуска внешней команды
struct CommandResult {
    bool ok = false;     // процесс запущен и завершился с кодом 0
    int exit_code = -1;
    std::string output;  // stdout (stderr отбрасывается)

    explicit operator bool() const { return ok; }
};

/// Запустить команду (argv[0] ищется в PATH) и собрать её stdout.
/// Аргументы экранируются для командной оболочки.
CommandResult run_command(const std::vector<std::string>& args);

}  // namespace moss::platform

#endif  // MOSS_PLATFORM_HPP
