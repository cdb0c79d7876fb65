// ==============================================================================
// terse/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY
// - Домашний каталог и каталог состояния (~/.terse)
// - Атомарная запись файлов (write-then-rename) и дозапись строк
// - Время (unix seconds, RFC 3339)
//
// Вся платформенная специфика изолирована здесь и в process.cpp.
//
// ==============================================================================

#ifndef TERSE_PLATFORM_HPP
#define TERSE_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace terse::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// Построить путь из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Преобразовать путь в UTF-8 строку
std::string path_to_utf8(const std::filesystem::path& p);

/// Домашний каталог пользователя (HOME / USERPROFILE)
std::optional<std::filesystem::path> home_dir();

/// Каталог состояния terse: $TERSE_HOME или ~/.terse
/// @return nullopt если домашний каталог не определён
std::optional<std::filesystem::path> state_dir();

/// Путь к исполняемому файлу текущего процесса
std::optional<std::filesystem::path> current_exe();

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Создать временный файл с префиксом в каталоге dir (или $TMPDIR)
/// @throws std::runtime_error при ошибке создания
std::filesystem::path make_temp_file(std::string_view prefix,
                                     const std::filesystem::path& dir = {});

/// Атомарно заменить содержимое файла: запись во временный файл рядом
/// с целевым и rename поверх. Родительский каталог создаётся при необходимости.
/// @return false при любой ошибке (целевой файл при этом не повреждается)
bool write_file_atomic(const std::filesystem::path& path, std::string_view content);

/// Дописать строку (с '\n') в конец файла одним вызовом write с O_APPEND
/// @return false при ошибке
bool append_line(const std::filesystem::path& path, std::string_view line);

/// Прочитать файл целиком
/// @return nullopt если файл не существует или не читается
std::optional<std::string> read_file(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Текущее время в секундах от эпохи
std::int64_t now_unix();

/// Текущее время UTC в формате RFC 3339 ("2024-01-10T14:00:01Z")
std::string now_rfc3339();

/// Монотонные миллисекунды (для измерения задержек)
std::uint64_t monotonic_ms();

// ----------------------------------------------------------------------------
// Переменные окружения
// ----------------------------------------------------------------------------

/// Значение переменной окружения (nullopt если не задана)
std::optional<std::string> get_env(const char* name);

}  // namespace terse::platform

#endif  // TERSE_PLATFORM_HPP
