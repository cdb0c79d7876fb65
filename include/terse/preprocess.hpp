// ==============================================================================
// terse/preprocess.hpp - Конвейер предобработки вывода
// ==============================================================================
//
// Назначение:
// - Детерминированное сжатие сырого вывода команды перед Smart path
// - Фиксированный порядок стадий:
//     noise -> path_filter -> dedup -> truncation -> trim
// - Каждая стадия включается отдельно, линейна по времени и идемпотентна:
//   повторный прогон на собственном выводе ничего не меняет
//
// Стадии не знают о командах; единственный контекст - подсказка категории.
//
// ==============================================================================

#ifndef TERSE_PREPROCESS_HPP
#define TERSE_PREPROCESS_HPP

#include "terse/category.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace terse::preprocess {

// ----------------------------------------------------------------------------
// Имена стадий (для stages_applied и журналов)
// ----------------------------------------------------------------------------

constexpr const char* STAGE_NOISE = "noise";
constexpr const char* STAGE_PATH_FILTER = "path_filter";
constexpr const char* STAGE_DEDUP = "dedup";
constexpr const char* STAGE_TRUNCATION = "truncation";
constexpr const char* STAGE_TRIM = "trim";

/// Минимально допустимый потолок для усечения
constexpr size_t MIN_MAX_OUTPUT_BYTES = 256;

/// Потолок по умолчанию (32 KB)
constexpr size_t DEFAULT_MAX_OUTPUT_BYTES = 32 * 1024;

// ----------------------------------------------------------------------------
// Опции
// ----------------------------------------------------------------------------

enum class PathFilterMode {
    Summary,  // серия строк заменяется одной строкой-сводкой
    Remove,   // строки удаляются без следа
};

std::string to_string(PathFilterMode mode);
PathFilterMode parse_path_filter_mode(std::string_view s);  // throws std::invalid_argument

struct Options {
    bool noise = true;
    bool path_filter = true;
    bool dedup = true;
    bool truncation = true;
    bool trim = true;

    size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;
    PathFilterMode path_filter_mode = PathFilterMode::Summary;
    std::vector<std::string> extra_boilerplate;   // дополнительные префиксы строк
    std::vector<std::string> extra_noise_paths;   // дополнительные фрагменты путей
};

// ----------------------------------------------------------------------------
// Результат
// ----------------------------------------------------------------------------

struct PreprocessedOutput {
    std::string text;
    size_t original_bytes = 0;
    size_t processed_bytes = 0;
    std::vector<std::string> stages_applied;  // стадии, которые изменили текст

    double reduction_pct() const {
        if (original_bytes == 0 || processed_bytes >= original_bytes) {
            return 0.0;
        }
        return 100.0 * static_cast<double>(original_bytes - processed_bytes) /
               static_cast<double>(original_bytes);
    }
};

/// Прогнать сырой вывод через все включённые стадии
PreprocessedOutput run(std::string_view raw, Category hint, const Options& options = {});

// ----------------------------------------------------------------------------
// Стадии (доступны по отдельности)
// ----------------------------------------------------------------------------

/// Удалить ANSI-последовательности, схлопнуть перезапись через `\r`,
/// убрать шаблонные строки, декоративные линии и индикаторы прогресса,
/// схлопнуть 3+ пустых строк в одну
std::string strip_noise(std::string_view text, Category hint,
                        const std::vector<std::string>& extra_boilerplate = {});

/// Строки с путями внутри шумовых каталогов. Строки с признаком ошибки
/// сохраняются всегда.
std::string filter_paths(std::string_view text, PathFilterMode mode,
                         const std::vector<std::string>& extra_noise_paths = {});

/// Схлопнуть одинаковые строки, похожие строки и нумерованные
/// последовательности `k/N`. Строки с признаком ошибки не сворачиваются.
std::string deduplicate(std::string_view text);

/// Голова и хвост в пределах max_bytes, строки ошибок из середины сохраняются
/// в пределах отдельного бюджета
std::string truncate(std::string_view text, size_t max_bytes);

/// Концы строк `\n`, без хвостовых пробелов, без пустых строк по краям
std::string normalize_whitespace(std::string_view text);

/// Список шумовых фрагментов путей по умолчанию
const std::vector<std::string>& default_noise_paths();

}  // namespace terse::preprocess

#endif  // TERSE_PREPROCESS_HPP
