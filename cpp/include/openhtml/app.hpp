// ==============================================================================
// openhtml/app.hpp - Выполнение команд
// ==============================================================================
//
// Поток выполнения: resolve -> validate -> list -> filter -> launch-each.
// Opener передаётся снаружи: main() использует SystemOpener, тесты - запись
// запросов в память.
//
// Коды возврата: 0 - успех (включая "файлы не найдены"),
//                1 - директория не найдена / нет доступа / ошибка листинга,
//                2 - ошибка CLI.
//
// ==============================================================================

#ifndef OPENHTML_APP_HPP
#define OPENHTML_APP_HPP

#include "openhtml/cli.hpp"

namespace openhtml::output {
class Writer;
}  // namespace openhtml::output

namespace openhtml::launch {
class Opener;
}  // namespace openhtml::launch

namespace openhtml::app {

/// Парсинг argv, создание Writer, dispatch команды
int run(int argc, char** argv, launch::Opener& opener);

/// Найти HTML файлы и открыть (или перечислить) их
int run_open(const cli::OpenCommand& cmd, output::Writer& writer, launch::Opener& opener);

}  // namespace openhtml::app

#endif  // OPENHTML_APP_HPP
