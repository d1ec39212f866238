// ==============================================================================
// openhtml/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv: один необязательный позиционный аргумент DIR и флаги
// - Генерация --help / --version
// - Диагностические ошибки CLI (возвращаются данными, не исключениями)
//
// ==============================================================================

#ifndef OPENHTML_CLI_HPP
#define OPENHTML_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace openhtml::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q, --quiet
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основной режим: найти и открыть HTML файлы
struct OpenCommand {
    std::optional<std::filesystem::path> directory;  // [DIR], nullopt = cwd
    bool dry_run = false;                            // -n, --dry-run
    bool json = false;                               // -j, --json
};

/// -h, --help
struct HelpCommand {};

/// -V, --version
struct VersionCommand {};

using Command = std::variant<OpenCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM_NAME = "openhtml";

constexpr const char* VERSION = "1.1.0";

constexpr const char* ABOUT = "Open every HTML file in a directory in the default web browser";

}  // namespace openhtml::cli

#endif  // OPENHTML_CLI_HPP
