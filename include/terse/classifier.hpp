// ==============================================================================
// terse/classifier.hpp - Классификатор безопасности (до выполнения)
// ==============================================================================
//
// Назначение:
// - Пометить команду как NeverOptimize или Optimizable до её выполнения
// - Порядок проверок (первое совпадение выигрывает):
//   1. повторный вызов `terse run` (loop guard)
//   2. первое слово ядра входит в deny-list
//   3. исходная строка содержит перенаправление вывода или heredoc
//   4. иначе Optimizable
//
// Классификатор не выполняет команду и не смотрит на её вывод.
//
// ==============================================================================

#ifndef TERSE_CLASSIFIER_HPP
#define TERSE_CLASSIFIER_HPP

#include "terse/command.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace terse::safety {

// ----------------------------------------------------------------------------
// Причины NeverOptimize
// ----------------------------------------------------------------------------

enum class NeverReason {
    LoopGuard,     // команда сама вызывает `terse run`
    DenyListed,    // разрушающая команда или редактор
    Redirection,   // вывод перенаправлен в файл
    Heredoc,       // heredoc / here-string
};

/// Строка для журналов и ответа хука
std::string to_string(NeverReason reason);

// ----------------------------------------------------------------------------
// CommandClassification
// ----------------------------------------------------------------------------

struct Classification {
    bool optimizable = true;
    NeverReason reason = NeverReason::LoopGuard;  // значимо только при !optimizable
    std::string detail;                           // например, совпавшая программа

    static Classification never(NeverReason r, std::string d = {}) {
        Classification c;
        c.optimizable = false;
        c.reason = r;
        c.detail = std::move(d);
        return c;
    }
};

// ----------------------------------------------------------------------------
// Deny-list
// ----------------------------------------------------------------------------

/// Встроенный список: удаление/перемещение файлов и интерактивные редакторы
const std::vector<std::string>& builtin_deny_list();

class Classifier {
public:
    /// @param extra_deny дополнительные программы из конфигурации
    explicit Classifier(std::vector<std::string> extra_deny = {});

    /// Классифицировать контекст (чистая функция от ctx и deny-list)
    Classification classify(const command::CommandContext& ctx) const;

    /// Программа (первое слово ядра, без пути и .exe) входит в deny-list
    bool is_denied(std::string_view program) const;

private:
    std::vector<std::string> deny_;  // в нижнем регистре
};

/// Имя программы из первого слова: без каталога, без ".exe", в нижнем регистре
std::string program_name(std::string_view core);

}  // namespace terse::safety

#endif  // TERSE_CLASSIFIER_HPP
