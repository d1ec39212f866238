// ==============================================================================
// openhtml/launcher.hpp - Открытие HTML файлов в браузере
// ==============================================================================
//
// Назначение:
// - Один запрос "открыть в новой вкладке" на каждый найденный файл
// - Opener - шов между логикой запуска и вызовом ОС (подменяется в тестах)
//
// Запросы fire-and-forget: ответ браузера не наблюдается, ошибка запуска
// не меняет код возврата.
//
// ==============================================================================

#ifndef OPENHTML_LAUNCHER_HPP
#define OPENHTML_LAUNCHER_HPP

#include "openhtml/discovery.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace openhtml::output {
class Writer;
}  // namespace openhtml::output

namespace openhtml::launch {

// ----------------------------------------------------------------------------
// Opener - запрос к обработчику по умолчанию
// ----------------------------------------------------------------------------

class Opener {
public:
    virtual ~Opener() = default;

    /// Попросить браузер открыть uri в новой вкладке
    /// @return false, если запрос не удалось отправить
    virtual bool open_new_tab(const std::string& uri) = 0;
};

/// Opener поверх platform::open_with_default_handler
class SystemOpener : public Opener {
public:
    bool open_new_tab(const std::string& uri) override;
};

// ----------------------------------------------------------------------------
// Launcher
// ----------------------------------------------------------------------------

struct LaunchReport {
    std::size_t requested = 0;  // отправлено запросов
    std::size_t failed = 0;     // обработчик не запустился (только информативно)
};

class Launcher {
public:
    Launcher(Opener& opener, output::Writer& writer);

    /// Открыть все файлы в порядке получения, ровно один запрос на файл
    LaunchReport launch_all(const std::vector<io::CandidateFile>& files);

private:
    Opener& opener_;
    output::Writer& writer_;
};

}  // namespace openhtml::launch

#endif  // OPENHTML_LAUNCHER_HPP
