// ==============================================================================
// discovery.cpp - Поиск HTML файлов
// ==============================================================================

#include "openhtml/discovery.hpp"

#include "openhtml/platform.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace openhtml::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

constexpr std::string_view HTML_SUFFIX = ".html";

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool is_permission_error(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

/// Ошибка листинга -> DiscoveryError нужного вида
[[noreturn]] void throw_listing_error(const std::filesystem::path& dir,
                                      const std::error_code& ec) {
    std::string dir_str = platform::path_to_utf8(dir);
    if (is_permission_error(ec)) {
        throw DiscoveryError(DiscoveryError::Kind::PermissionDenied, dir,
                             "Permission denied to access directory: " + dir_str);
    }
    throw DiscoveryError(DiscoveryError::Kind::ReadFailed, dir,
                         "failed to read directory - " + dir_str + ": " + ec.message());
}

}  // namespace

// ----------------------------------------------------------------------------
// DiscoveryError
// ----------------------------------------------------------------------------

DiscoveryError::DiscoveryError(Kind kind, std::filesystem::path path, const std::string& message)
    : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::filesystem::path resolve_directory(const std::optional<std::filesystem::path>& input) {
    std::error_code ec;
    std::filesystem::path dir;

    if (!input.has_value()) {
        dir = std::filesystem::current_path(ec);
        if (ec) {
            throw DiscoveryError(DiscoveryError::Kind::NotFound, {},
                                 "failed to get current directory - " + ec.message());
        }
    } else {
        dir = std::filesystem::absolute(*input, ec);
        if (ec) {
            throw DiscoveryError(DiscoveryError::Kind::NotFound, *input,
                                 "Directory '" + platform::path_to_utf8(*input) +
                                     "' not found or is not a directory.");
        }
        dir = dir.lexically_normal();
        // "dir/" -> "dir", корень ("/") не трогаем
        if (!dir.has_filename() && dir.has_relative_path()) {
            dir = dir.parent_path();
        }
    }

    // Любая ошибка stat трактуется как "не директория"
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        throw DiscoveryError(DiscoveryError::Kind::NotFound, dir,
                             "Directory '" + platform::path_to_utf8(dir) +
                                 "' not found or is not a directory.");
    }

    return dir;
}

std::string make_file_uri(const std::filesystem::path& path) {
    std::filesystem::path absolute = path.is_absolute() ? path : std::filesystem::absolute(path);
    std::string str = platform::path_to_utf8(absolute);

#ifdef _WIN32
    std::replace(str.begin(), str.end(), '\\', '/');
    if (str.empty() || str[0] != '/') {
        str.insert(str.begin(), '/');
    }
#endif

    return "file://" + str;
}

bool is_html_name(std::string_view name) {
    if (name.size() < HTML_SUFFIX.size()) {
        return false;
    }
    return iequals(name.substr(name.size() - HTML_SUFFIX.size()), HTML_SUFFIX);
}

std::vector<CandidateFile> list_html_files(const std::filesystem::path& dir) {
    std::vector<CandidateFile> result;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw_listing_error(dir, ec);
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;

        std::string name = platform::path_to_utf8(entry.path().filename());
        if (!is_html_name(name)) {
            continue;
        }

        // is_regular_file разыменовывает symlink; битая ссылка - не файл
        std::error_code status_ec;
        if (!entry.is_regular_file(status_ec) || status_ec) {
            continue;
        }

        CandidateFile file;
        file.name = std::move(name);
        file.absolute_path = entry.path();
        file.uri = make_file_uri(file.absolute_path);
        result.push_back(std::move(file));
    }

    // increment(ec) завершает цикл при ошибке, листинг неполный
    if (ec) {
        throw_listing_error(dir, ec);
    }

    return result;
}

}  // namespace openhtml::io
