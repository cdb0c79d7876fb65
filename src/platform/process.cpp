// ==============================================================================
// process.cpp - Запуск целевой команды (POSIX)
// ==============================================================================
//
// posix_spawn + два канала (stdout, stderr), чтение через poll до закрытия
// обоих каналов, затем waitpid. По истечении тайм-аута процесс получает
// SIGKILL, захваченный к этому моменту вывод сохраняется.
//
// ==============================================================================

#include "terse/process.hpp"

#include "terse/platform.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace terse::process {

namespace {

constexpr int POLL_INTERVAL_MS = 50;

/// Канал с закрытием дескрипторов в деструкторе
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() { return ::pipe(fds) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() {
        if (fds[0] >= 0) {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }
    void close_write() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

/// Прочитать доступные байты; false - канал закрыт
bool drain(int fd, std::string& out) {
    char buf[8192];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(buf)) {
                return true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: данных пока нет; прочие ошибки считаются закрытием
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

ProcessOutput spawn_failure(std::string message, std::uint64_t started) {
    ProcessOutput out;
    out.exit_code = EXIT_SPAWN_FAILURE;
    out.error = std::move(message);
    out.stderr_text = "terse: " + out.error + "\n";
    out.elapsed_ms = platform::monotonic_ms() - started;
    return out;
}

}  // namespace

std::string ProcessOutput::combined() const {
    if (stderr_text.empty()) {
        return stdout_text;
    }
    if (stdout_text.empty()) {
        return stderr_text;
    }
    std::string out = stdout_text;
    if (out.back() != '\n') {
        out += '\n';
    }
    out += stderr_text;
    return out;
}

ProcessOutput run_shell(std::string_view command, std::uint64_t timeout_ms) {
    const std::uint64_t started = platform::monotonic_ms();

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        return spawn_failure(std::string("pipe: ") + std::strerror(errno), started);
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, out_pipe.write_end(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe.write_end(), STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, out_pipe.read_end());
    posix_spawn_file_actions_addclose(&actions, err_pipe.read_end());
    posix_spawn_file_actions_addclose(&actions, out_pipe.write_end());
    posix_spawn_file_actions_addclose(&actions, err_pipe.write_end());

    std::string cmd(command);
    std::vector<char*> argv = {const_cast<char*>("sh"), const_cast<char*>("-c"), cmd.data(),
                               nullptr};

    pid_t pid = 0;
    const int rc = ::posix_spawn(&pid, "/bin/sh", &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        return spawn_failure(std::string("posix_spawn: ") + std::strerror(rc), started);
    }

    out_pipe.close_write();
    err_pipe.close_write();
    ::fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

    ProcessOutput result;
    result.spawned = true;

    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        if (timeout_ms > 0 && platform::monotonic_ms() - started >= timeout_ms) {
            ::kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) {
            fds[count++] = pollfd{out_pipe.read_end(), POLLIN, 0};
        }
        if (err_open) {
            fds[count++] = pollfd{err_pipe.read_end(), POLLIN, 0};
        }
        const int ready = ::poll(fds, count, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == out_pipe.read_end()) {
                out_open = drain(fds[i].fd, result.stdout_text);
            } else {
                err_open = drain(fds[i].fd, result.stderr_text);
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    result.elapsed_ms = platform::monotonic_ms() - started;
    if (result.timed_out) {
        result.exit_code = EXIT_TIMEOUT;
        result.stderr_text += "terse: command timed out after " + std::to_string(timeout_ms) +
                              " ms\n";
        return result;
    }
    result.exit_code = decode_status(status);
    result.success = result.exit_code == 0;
    return result;
}

ProcessOutput ShellRunner::run(std::string_view command) {
    return run_shell(command, timeout_ms_);
}

}  // namespace terse::process
