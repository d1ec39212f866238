// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "openhtml/platform.hpp"

#include <cstdio>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#include <shellapi.h>
#else
#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace openhtml::platform {

namespace {

#ifdef _WIN32
std::wstring utf8_to_wide(std::string_view u8str) {
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return {};
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return wstr;
}
#endif

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    std::wstring wstr = utf8_to_wide(u8str);
    if (wstr.empty()) {
        // Fallback: просто используем как есть
        return std::filesystem::path(u8str);
    }
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
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
// Системный обработчик по умолчанию
// ----------------------------------------------------------------------------

const char* default_handler_name() {
#ifdef _WIN32
    return "ShellExecuteW";
#elif defined(__APPLE__)
    return "open";
#else
    return "xdg-open";
#endif
}

std::size_t reap_finished_handlers() {
#ifdef _WIN32
    return 0;
#else
    std::size_t reaped = 0;
    while (waitpid(-1, nullptr, WNOHANG) > 0) {
        ++reaped;
    }
    return reaped;
#endif
}

bool open_with_default_handler(std::string_view target) {
#ifdef _WIN32
    std::wstring wtarget = utf8_to_wide(target);
    if (wtarget.empty()) {
        return false;
    }
    HINSTANCE h = ShellExecuteW(nullptr, L"open", wtarget.c_str(), nullptr, nullptr, SW_SHOWNORMAL);
    // ShellExecute: значения > 32 означают успех
    return reinterpret_cast<INT_PTR>(h) > 32;
#else
    // posix_spawnp вместо system(): аргумент передаётся без shell quoting
    std::string program = default_handler_name();
    std::string arg(target);
    std::vector<char*> argv{program.data(), arg.data(), nullptr};

    posix_spawn_file_actions_t actions;
    if (posix_spawn_file_actions_init(&actions) != 0) {
        return false;
    }
    // Вывод обработчика не смешивается с выводом openhtml
    if (posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0) != 0 ||
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0) != 0) {
        posix_spawn_file_actions_destroy(&actions);
        return false;
    }

    // Обработчики прошлых вызовов, успевшие завершиться
    reap_finished_handlers();

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    // Не ждём: xdg-open может жить, пока жив браузер. Зомби собирает
    // reap_finished_handlers() при следующем вызове или ОС при выходе
    return rc == 0;
#endif
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace openhtml::platform
