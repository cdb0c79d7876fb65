// ==============================================================================
// terse/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами ([+] [!] [x] [*] [~])
// - Цветной вывод (ANSI escape codes) только для TTY
// - JSON вывод через RapidJSON
//
// stdout в режиме `terse run` принадлежит выводу целевой команды: всё
// диагностическое уходит в stderr.
//
// ==============================================================================

#ifndef TERSE_OUTPUT_HPP
#define TERSE_OUTPUT_HPP

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

namespace terse::output {

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
    Yellow,  // Предупреждения
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

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Строка в stdout зелёным/жёлтым при TTY
    void green_line(std::string_view message);
    void yellow_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами)
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Записать префикс уровня (с цветом при TTY) и сообщение
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    void write_colored(Stream s, std::string_view message, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace terse::output

#endif  // TERSE_OUTPUT_HPP
