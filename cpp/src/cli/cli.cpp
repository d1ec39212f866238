// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: help и сообщения об ошибках в стиле clap.
//
// ==============================================================================

#include "openhtml/cli.hpp"

#include "openhtml/platform.hpp"

#include <cstring>

namespace openhtml::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// Сообщение об ошибке парсинга: error + Usage + подсказка
std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n"
                       "Usage: openhtml [OPTIONS] [DIR]\n\n"
                       "For more information, try '--help'.\n";
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: openhtml [OPTIONS] [DIR]\n"
           "\n"
           "Arguments:\n"
           "  [DIR]  Directory to search for .html files (default: current directory)\n"
           "\n"
           "Options:\n"
           "  -n, --dry-run  Print the file URIs instead of opening them\n"
           "  -j, --json     Print the matched files as JSON instead of opening them\n"
           "  -q, --quiet    Suppress informational output\n"
           "  -v...          Print verbose output\n"
           "  -h, --help     Print help\n"
           "  -V, --version  Print version\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    OpenCommand open_cmd;

    // "-v", "-vv", "-vvv" -> число 'v'; 0, если аргумент не из одних 'v'
    auto verbose_count = [](const char* arg) {
        if (arg[0] != '-' || arg[1] != 'v') {
            return 0;
        }
        int count = 0;
        for (const char* p = arg + 1; *p != '\0'; ++p) {
            if (*p != 'v') {
                return 0;
            }
            ++count;
        }
        return count;
    };

    // После "--" все аргументы позиционные (директории, начинающиеся с '-')
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (!options_done && arg[0] == '-' && arg[1] != '\0') {
            if (str_eq(arg, "--")) {
                options_done = true;
            } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{};
                return result;
            } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
                result.ok = true;
                result.command = VersionCommand{};
                return result;
            } else if (int count = verbose_count(arg); count > 0) {
                result.global.verbose += count;
            } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-n") || str_eq(arg, "--dry-run")) {
                open_cmd.dry_run = true;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                open_cmd.json = true;
            } else {
                result.diagnostic.exit_code = 2;
                result.diagnostic.stderr_message = render_usage_error(
                    std::string("error: unexpected argument '") + arg + "' found");
                return result;
            }
            continue;
        }

        // Позиционный аргумент DIR - не больше одного
        if (open_cmd.directory.has_value()) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        }
        open_cmd.directory = platform::path_from_utf8(arg);
    }

    result.ok = true;
    result.command = open_cmd;
    return result;
}

}  // namespace openhtml::cli
