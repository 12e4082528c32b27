// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Платформенная специфика (dlopen/LoadLibrary, isatty, environ, popen) изолирована здесь.
//
// ==============================================================================

#include "moss/platform.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <dlfcn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace moss::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

std::string relative_utf8(const std::filesystem::path& path, const std::filesystem::path& root) {
    // Лексическое сравнение компонент: root должен быть префиксом path
    auto p_it = path.begin();
    for (auto r_it = root.begin(); r_it != root.end(); ++r_it) {
        if (r_it->empty()) {
            // завершающий '/' у root даёт пустую компоненту
            continue;
        }
        if (p_it == path.end() || *p_it != *r_it) {
            return path_to_utf8(path);
        }
        ++p_it;
    }

    std::string result;
    for (; p_it != path.end(); ++p_it) {
        if (!result.empty()) {
            result += '/';
        }
        result += path_to_utf8(*p_it);
    }
    return result;
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

std::optional<std::string> env_var(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::map<std::string, std::string> environment() {
    std::map<std::string, std::string> result;
#ifdef _WIN32
    char** env = _environ;
#else
    char** env = environ;
#endif
    if (env == nullptr) {
        return result;
    }
    for (char** it = env; *it != nullptr; ++it) {
        std::string_view entry(*it);
        auto eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }
        result.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return result;
}

std::optional<std::filesystem::path> config_dir() {
#ifdef _WIN32
    if (auto appdata = env_var("APPDATA"); appdata && !appdata->empty()) {
        return path_from_utf8(*appdata);
    }
    return std::nullopt;
#else
    if (auto xdg = env_var("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
        return std::filesystem::path(*xdg);
    }
    if (auto home = env_var("HOME"); home && !home->empty()) {
        return std::filesystem::path(*home) / ".config";
    }
    return std::nullopt;
#endif
}

char path_list_separator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

// ----------------------------------------------------------------------------
// Разделяемые библиотеки
// ----------------------------------------------------------------------------

const char* shared_library_extension() {
#ifdef _WIN32
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

SharedLibrary::~SharedLibrary() {
    close();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept : handle_(other.handle_) {
    other.handle_ = nullptr;
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

SharedLibrary SharedLibrary::open(const std::filesystem::path& path) {
#ifdef _WIN32
    HMODULE h = LoadLibraryW(path.c_str());
    if (h == nullptr) {
        throw std::runtime_error("failed to load library - " + path_to_utf8(path));
    }
    return SharedLibrary(reinterpret_cast<void*>(h));
#else
    void* h = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (h == nullptr) {
        const char* err = dlerror();
        throw std::runtime_error("failed to load library - " + path_to_utf8(path) +
                                 (err != nullptr ? std::string(": ") + err : std::string()));
    }
    return SharedLibrary(h);
#endif
}

void* SharedLibrary::symbol(const char* name) const {
    if (handle_ == nullptr) {
        return nullptr;
    }
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(handle_), name));
#else
    return dlsym(handle_, name);
#endif
}

void SharedLibrary::close() {
    if (handle_ == nullptr) {
        return;
    }
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(handle_));
#else
    dlclose(handle_);
#endif
    handle_ = nullptr;
}

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

bool write_file(const std::filesystem::path& path, std::string_view data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    return static_cast<bool>(ofs);
}

// ----------------------------------------------------------------------------
// Внешние процессы
// ----------------------------------------------------------------------------

namespace {

std::string shell_quote(const std::string& arg) {
#ifdef _WIN32
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "\"";
#else
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
#endif
}

}  // namespace

CommandResult run_command(const std::vector<std::string>& args) {
    CommandResult result;
    if (args.empty()) {
        return result;
    }

    std::string cmd;
    for (const auto& arg : args) {
        if (!cmd.empty()) {
            cmd += ' ';
        }
        cmd += shell_quote(arg);
    }
#ifdef _WIN32
    cmd += " 2>NUL";
    FILE* pipe = _popen(cmd.c_str(), "r");
#else
    cmd += " 2>/dev/null";
    FILE* pipe = popen(cmd.c_str(), "r");
#endif
    if (pipe == nullptr) {
        return result;
    }

    std::array<char, 4096> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }

#ifdef _WIN32
    result.exit_code = _pclose(pipe);
#else
    const int status = pclose(pipe);
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
#endif
    result.ok = result.exit_code == 0;
    return result;
}

}  // namespace moss::platform
