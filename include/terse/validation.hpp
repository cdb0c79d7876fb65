// ==============================================================================
// terse/validation.hpp - Проверка и очистка ответа LLM
// ==============================================================================
//
// Назначение:
// - Очистка ответа модели: вступительные фразы, markdown-ограждения,
//   строки с командами, которые модель "придумала"
// - Проверка кандидата перед выдачей агенту: не пустой, заметно короче
//   исходного, без отказов, без выдуманных команд, не копия примера из
//   промпта, без структурных маркеров, которых не было во входе
//
// При отказе роутер отдает предобработанный вывод.
//
// ==============================================================================

#ifndef TERSE_VALIDATION_HPP
#define TERSE_VALIDATION_HPP

#include "terse/category.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace terse::validation {

/// Кандидат длиннее этой доли входа (в байтах) отклоняется
constexpr double MAX_LENGTH_RATIO = 0.9;

struct ValidationResult {
    bool ok = false;
    std::string reason;  // причина отказа

    explicit operator bool() const { return ok; }

    static ValidationResult accept() {
        ValidationResult r;
        r.ok = true;
        return r;
    }
    static ValidationResult reject(std::string why) {
        ValidationResult r;
        r.reason = std::move(why);
        return r;
    }
};

const std::vector<std::string>& refusal_markers();
const std::vector<std::string>& fabrication_markers();

/// Проверить кандидата против исходного входа
ValidationResult validate(std::string_view input, std::string_view candidate, Category category);

/// Удалить вступительные фразы ("Here is the condensed ...") и ``` вокруг ответа
std::string strip_preamble(std::string_view response);

/// Удалить строки, похожие на команды оболочки
std::string strip_command_lines(std::string_view response);

/// strip_preamble + strip_command_lines + trim
std::string clean_response(std::string_view response);

}  // namespace terse::validation

#endif  // TERSE_VALIDATION_HPP
