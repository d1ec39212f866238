// ==============================================================================
// openhtml/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) только для TTY
// - JSON листинг через RapidJSON
//
// stdout - результаты (URI, JSON), stderr - диагностика.
//
// ==============================================================================

#ifndef OPENHTML_OUTPUT_HPP
#define OPENHTML_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace openhtml::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Зелёная строка без префикса в stderr (если не quiet)
    void green_line_stderr(std::string_view message);

    // JSON
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами) + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Префикс сообщения, окрашенный при TTY
    void write_prefix(std::string_view prefix, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace openhtml::output

#endif  // OPENHTML_OUTPUT_HPP
