// ==============================================================================
// openhtml/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Вызов системного обработчика по умолчанию (браузер для file:// URI)
//
// Вся платформенная специфика (#ifdef _WIN32 / __APPLE__) изолирована здесь.
//
// ==============================================================================

#ifndef OPENHTML_PLATFORM_HPP
#define OPENHTML_PLATFORM_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace openhtml::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить native path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Системный обработчик по умолчанию
// ----------------------------------------------------------------------------

/// Попросить ОС открыть target (URI или путь) обработчиком по умолчанию.
///
/// Linux/BSD: xdg-open, macOS: open, Windows: ShellExecuteW("open").
/// Вызов не ждёт завершения обработчика и не наблюдает ответ браузера.
///
/// @return false, если процесс обработчика не удалось даже запустить
bool open_with_default_handler(std::string_view target);

/// Забрать статус уже завершившихся дочерних процессов без ожидания
///
/// Вызывается перед каждым запуском обработчика, чтобы завершившиеся
/// xdg-open не копились зомби. На Windows ничего не делает.
/// @return число собранных процессов
std::size_t reap_finished_handlers();

/// Имя программы, через которую открываются ресурсы на этой платформе
const char* default_handler_name();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace openhtml::platform

#endif  // OPENHTML_PLATFORM_HPP
