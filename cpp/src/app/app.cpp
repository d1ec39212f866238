// ==============================================================================
// app.cpp - Выполнение команд
// ==============================================================================

#include "openhtml/app.hpp"

#include "openhtml/discovery.hpp"
#include "openhtml/launcher.hpp"
#include "openhtml/output.hpp"
#include "openhtml/platform.hpp"

#include <rapidjson/document.h>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace openhtml::app {

namespace {

// ----------------------------------------------------------------------------
// JSON листинг (--json)
// ----------------------------------------------------------------------------

void write_listing_json(const std::vector<io::CandidateFile>& files, output::Writer& writer) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    for (const auto& file : files) {
        std::string path = platform::path_to_utf8(file.absolute_path);

        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("name", rapidjson::Value(file.name.c_str(), alloc), alloc);
        obj.AddMember("path", rapidjson::Value(path.c_str(), alloc), alloc);
        obj.AddMember("uri", rapidjson::Value(file.uri.c_str(), alloc), alloc);
        doc.PushBack(obj, alloc);
    }

    writer.write_json_pretty(doc);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// run_open
// ----------------------------------------------------------------------------

int run_open(const cli::OpenCommand& cmd, output::Writer& writer, launch::Opener& opener) {
    writer.green_line_stderr("--- HTML File Opener ---");

    std::vector<io::CandidateFile> files;
    try {
        std::filesystem::path dir = io::resolve_directory(cmd.directory);
        writer.info("Searching for HTML files in: " + platform::path_to_utf8(dir));

        files = io::list_html_files(dir);
    } catch (const io::DiscoveryError& e) {
        writer.error(e.what());
        return 1;
    }

    if (files.empty()) {
        writer.info("No HTML files found in the current directory.");
        return 0;
    }

    // --json подразумевает --dry-run
    if (cmd.json) {
        writer.debug("Found " + std::to_string(files.size()) + " HTML file(s)");
        write_listing_json(files, writer);
        return 0;
    }

    if (cmd.dry_run) {
        writer.info("Found " + std::to_string(files.size()) + " HTML file(s). Dry run, not opening");
        for (const auto& file : files) {
            writer.write_line(output::Stream::Stdout, file.uri);
        }
        return 0;
    }

    writer.info("Found " + std::to_string(files.size()) + " HTML file(s). Opening them now...");

    launch::Launcher launcher(opener, writer);
    launch::LaunchReport report = launcher.launch_all(files);

    writer.green_line_stderr("--- Finished ---");
    writer.info("All " + std::to_string(report.requested) +
                " files have been sent to the default browser.");
    if (report.failed > 0) {
        writer.debug(std::to_string(report.failed) + " request(s) could not start " +
                     platform::default_handler_name());
    }

    // Ошибки запуска браузера не влияют на код возврата
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv, launch::Opener& opener) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга печатаются без префикса [x], как есть
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    writer.trace("platform: " + platform::os_name());

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_open(cmd, writer, opener);
            }
        },
        parse_result.command);
}

}  // namespace openhtml::app
