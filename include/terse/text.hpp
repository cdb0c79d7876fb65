// ==============================================================================
// terse/text.hpp - Строковые утилиты и оценка токенов
// ==============================================================================
//
// Назначение:
// - ASCII-регистронезависимые сравнения и префиксы
// - Разбиение на строки и склейка
// - Оценка числа токенов (~4 байта на токен)
// - Эвристики сигналов ошибки/успеха в строке вывода
//
// ==============================================================================

#ifndef TERSE_TEXT_HPP
#define TERSE_TEXT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace terse::text {

// ----------------------------------------------------------------------------
// Регистр и пробелы
// ----------------------------------------------------------------------------

std::string to_lower(std::string_view s);

bool iequals(std::string_view a, std::string_view b);

bool starts_with(std::string_view s, std::string_view prefix);

bool ends_with(std::string_view s, std::string_view suffix);

/// Поиск подстроки без учёта регистра (ASCII)
bool icontains(std::string_view haystack, std::string_view needle);

std::string_view trim(std::string_view s);
std::string_view trim_start(std::string_view s);
std::string_view trim_end(std::string_view s);

// ----------------------------------------------------------------------------
// Строки
// ----------------------------------------------------------------------------

/// Разбить текст по '\n' (завершающий '\r' каждой строки отбрасывается).
/// Финальный перевод строки не порождает пустую строку.
std::vector<std::string_view> split_lines(std::string_view text);

/// Склеить строки через '\n'
std::string join_lines(const std::vector<std::string>& lines);

/// Разбить по пробельным символам
std::vector<std::string_view> split_whitespace(std::string_view s);

/// Первое слово (до пробела)
std::string_view first_word(std::string_view s);

/// Заменить первое вхождение from на to (false если не найдено)
bool replace_first(std::string& s, std::string_view from, std::string_view to);

/// Обрезать строку до max_chars байт, добавив "..." (с учётом границы UTF-8)
std::string truncate_chars(std::string_view s, size_t max_chars);

// ----------------------------------------------------------------------------
// Токены
// ----------------------------------------------------------------------------

/// Оценка числа токенов: ceil(bytes / 4)
size_t estimate_tokens(std::string_view text);

/// Процент экономии (0..100), 0 если original == 0
double savings_pct(size_t original_tokens, size_t optimized_tokens);

// ----------------------------------------------------------------------------
// Сигналы в строке вывода
// ----------------------------------------------------------------------------

/// Строка несёт сигнал ошибки/неудачи (error, fail, fatal, panic, exception,
/// traceback, "FAILED", "✕", "✗")
bool has_failure_signal(std::string_view line);

}  // namespace terse::text

#endif  // TERSE_TEXT_HPP
