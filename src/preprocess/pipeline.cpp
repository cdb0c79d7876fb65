// ==============================================================================
// pipeline.cpp - Конвейер предобработки
// ==============================================================================

#include "terse/preprocess.hpp"

#include <algorithm>

namespace terse::preprocess {

namespace {

/// Применить стадию и отметить её, если текст изменился
template <typename Stage>
void apply(std::string& text, const char* name, std::vector<std::string>& applied, Stage stage) {
    std::string next = stage(text);
    if (next != text) {
        applied.emplace_back(name);
        text = std::move(next);
    }
}

}  // namespace

PreprocessedOutput run(std::string_view raw, Category hint, const Options& options) {
    PreprocessedOutput result;
    result.original_bytes = raw.size();

    std::string text(raw);
    auto& applied = result.stages_applied;

    if (options.noise) {
        apply(text, STAGE_NOISE, applied, [&](const std::string& t) {
            return strip_noise(t, hint, options.extra_boilerplate);
        });
    }
    if (options.path_filter) {
        apply(text, STAGE_PATH_FILTER, applied, [&](const std::string& t) {
            return filter_paths(t, options.path_filter_mode, options.extra_noise_paths);
        });
    }
    if (options.dedup) {
        apply(text, STAGE_DEDUP, applied, [](const std::string& t) { return deduplicate(t); });
    }
    if (options.truncation) {
        const size_t max_bytes = std::max(options.max_output_bytes, MIN_MAX_OUTPUT_BYTES);
        apply(text, STAGE_TRUNCATION, applied,
              [max_bytes](const std::string& t) { return truncate(t, max_bytes); });
    }
    if (options.trim) {
        apply(text, STAGE_TRIM, applied,
              [](const std::string& t) { return normalize_whitespace(t); });
    }

    result.processed_bytes = text.size();
    result.text = std::move(text);
    return result;
}

}  // namespace terse::preprocess
