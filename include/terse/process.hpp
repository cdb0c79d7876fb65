// ==============================================================================
// terse/process.hpp - Запуск целевой команды
// ==============================================================================
//
// Назначение:
// - Выполнение строки команды через `sh -c`
// - Раздельный захват stdout и stderr
// - Ограничение по времени (SIGKILL по истечении)
//
// Коды возврата: код целевой команды; 124 - тайм-аут; 127 - не удалось
// запустить; 128+N - завершение сигналом N.
//
// ==============================================================================

#ifndef TERSE_PROCESS_HPP
#define TERSE_PROCESS_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace terse::process {

constexpr int EXIT_TIMEOUT = 124;
constexpr int EXIT_SPAWN_FAILURE = 127;

struct ProcessOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool success = false;    // exit_code == 0 и не тайм-аут
    bool timed_out = false;
    bool spawned = false;    // процесс удалось запустить
    std::uint64_t elapsed_ms = 0;
    std::string error;       // описание ошибки запуска

    /// stdout и stderr, склеенные через '\n' (пустые части пропускаются)
    std::string combined() const;
};

/// Выполнить команду через `sh -c`.
/// timeout_ms == 0 - без ограничения по времени.
ProcessOutput run_shell(std::string_view command, std::uint64_t timeout_ms = 0);

// ----------------------------------------------------------------------------
// CommandRunner - точка подмены для тестов роутера
// ----------------------------------------------------------------------------

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual ProcessOutput run(std::string_view command) = 0;
};

/// Запуск через run_shell с фиксированным тайм-аутом
class ShellRunner : public CommandRunner {
public:
    explicit ShellRunner(std::uint64_t timeout_ms = 0) : timeout_ms_(timeout_ms) {}

    ProcessOutput run(std::string_view command) override;

private:
    std::uint64_t timeout_ms_;
};

}  // namespace terse::process

#endif  // TERSE_PROCESS_HPP
