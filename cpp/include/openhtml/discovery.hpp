// ==============================================================================
// openhtml/discovery.hpp - Поиск HTML файлов
// ==============================================================================
//
// Назначение:
// - Разрешение целевой директории (аргумент или текущая директория)
// - Нерекурсивный обход одной директории
// - Фильтрация: только обычные файлы с именем на ".html" (без учёта регистра)
// - Построение file:// URI для найденных файлов
// - Порядок результатов = порядок листинга ОС (сортировка не применяется)
//
// ==============================================================================

#ifndef OPENHTML_DISCOVERY_HPP
#define OPENHTML_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace openhtml::io {

// ----------------------------------------------------------------------------
// CandidateFile - найденный HTML файл
// ----------------------------------------------------------------------------

/// Живёт один проход: создаётся фильтром, потребляется launcher'ом
struct CandidateFile {
    std::string name;                     // имя записи в директории (UTF-8)
    std::filesystem::path absolute_path;  // директория / name
    std::string uri;                      // "file://" + absolute_path
};

// ----------------------------------------------------------------------------
// DiscoveryError - фатальные ошибки поиска
// ----------------------------------------------------------------------------

class DiscoveryError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,          // путь не существует или не директория
        PermissionDenied,  // нет прав на чтение листинга
        ReadFailed         // прочие ошибки листинга
    };

    DiscoveryError(Kind kind, std::filesystem::path path, const std::string& message);

    Kind kind() const noexcept { return kind_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    Kind kind_;
    std::filesystem::path path_;
};

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

/// Определить абсолютную нормализованную целевую директорию
///
/// @param input Путь из командной строки; nullopt = текущая рабочая директория
/// @return Абсолютный путь без завершающего разделителя
/// @throws DiscoveryError(NotFound), если путь не указывает на директорию
std::filesystem::path resolve_directory(const std::optional<std::filesystem::path>& input);

/// Построить "file://" URI для пути
///
/// Относительный путь предварительно делается абсолютным. Разделители
/// приводятся к '/', на Windows перед буквой диска добавляется '/'
/// ("file:///C:/dir/a.html"). Percent-encoding не выполняется.
std::string make_file_uri(const std::filesystem::path& path);

/// Имя заканчивается на ".html" без учёта регистра
bool is_html_name(std::string_view name);

/// Найти HTML файлы непосредственно в директории dir (без рекурсии)
///
/// Поддиректории и специальные файлы пропускаются; символические ссылки
/// разыменовываются (ссылка на обычный файл считается файлом).
/// Пустой результат - не ошибка.
///
/// @throws DiscoveryError(PermissionDenied) при отказе в доступе к листингу
/// @throws DiscoveryError(ReadFailed) при прочих ошибках листинга
std::vector<CandidateFile> list_html_files(const std::filesystem::path& dir);

}  // namespace openhtml::io

#endif  // OPENHTML_DISCOVERY_HPP
