// ==============================================================================
// launcher.cpp - Открытие HTML файлов в браузере
// ==============================================================================

#include "openhtml/launcher.hpp"

#include "openhtml/output.hpp"
#include "openhtml/platform.hpp"

#include <string>

namespace openhtml::launch {

bool SystemOpener::open_new_tab(const std::string& uri) {
    // Ни один системный обработчик не различает вкладку и окно
    return platform::open_with_default_handler(uri);
}

Launcher::Launcher(Opener& opener, output::Writer& writer) : opener_(opener), writer_(writer) {}

LaunchReport Launcher::launch_all(const std::vector<io::CandidateFile>& files) {
    LaunchReport report;

    for (const auto& file : files) {
        writer_.info("-> Opening: " + file.name);

        bool started = opener_.open_new_tab(file.uri);
        ++report.requested;

        if (!started) {
            ++report.failed;
            writer_.debug(std::string("failed to start ") + platform::default_handler_name() +
                          " for " + file.uri);
        } else {
            writer_.trace("open request sent: " + file.uri);
        }
    }

    return report;
}

}  // namespace openhtml::launch
