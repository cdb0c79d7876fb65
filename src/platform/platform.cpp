// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "terse/platform.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace terse::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

std::optional<std::filesystem::path> home_dir() {
#ifdef _WIN32
    const char* var = "USERPROFILE";
#else
    const char* var = "HOME";
#endif
    auto value = get_env(var);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return path_from_utf8(*value);
}

std::optional<std::filesystem::path> state_dir() {
    // TERSE_HOME перекрывает ~/.terse (используется тестами и CI)
    auto override_dir = get_env("TERSE_HOME");
    if (override_dir && !override_dir->empty()) {
        return path_from_utf8(*override_dir);
    }
    auto home = home_dir();
    if (!home) {
        return std::nullopt;
    }
    return *home / ".terse";
}

std::optional<std::filesystem::path> current_exe() {
#ifdef _WIN32
    wchar_t buf[MAX_PATH + 1];
    DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH + 1);
    if (len == 0 || len > MAX_PATH) {
        return std::nullopt;
    }
    return std::filesystem::path(std::wstring(buf, len));
#else
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return p;
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file(std::string_view prefix, const std::filesystem::path& dir) {
#ifdef _WIN32
    auto generate_random_suffix = [](size_t length = 8) -> std::string {
        static const char chars[] = "0123456789abcdef";
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, sizeof(chars) - 2);

        std::string result;
        result.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            result += chars[dis(gen)];
        }
        return result;
    };

    std::filesystem::path temp_dir = dir;
    if (temp_dir.empty()) {
        wchar_t temp_path[MAX_PATH + 1];
        DWORD len = GetTempPathW(MAX_PATH + 1, temp_path);
        if (len == 0 || len > MAX_PATH) {
            throw std::runtime_error("Failed to get temp path");
        }
        temp_dir = std::filesystem::path(std::wstring(temp_path, len));
    }

    std::string filename = std::string(prefix) + "_" + generate_random_suffix() + ".tmp";
    std::filesystem::path full_path = temp_dir / path_from_utf8(filename);

    HANDLE h = CreateFileW(full_path.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                           FILE_ATTRIBUTE_TEMPORARY, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        throw std::runtime_error("Failed to create temp file");
    }
    CloseHandle(h);

    return full_path;
#else
    // Unix: mkstemp()
    std::string temp_dir = dir.empty() ? std::string("/tmp") : dir.string();
    if (dir.empty()) {
        const char* tmpdir = std::getenv("TMPDIR");
        if (tmpdir != nullptr && tmpdir[0] != '\0') {
            temp_dir = tmpdir;
        }
    }

    std::string tmpl = temp_dir + "/" + std::string(prefix) + "_XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = mkstemp(tmpl_buf.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file");
    }
    close(fd);

    return std::filesystem::path(tmpl_buf.data());
#endif
}

bool write_file_atomic(const std::filesystem::path& path, std::string_view content) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::filesystem::path tmp;
    try {
        tmp = make_temp_file(path.filename().string(), parent.empty() ? "." : parent);
    } catch (const std::runtime_error&) {
        return false;
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    // rename в пределах одного каталога атомарен (POSIX)
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        return false;
    }
    return true;
}

bool append_line(const std::filesystem::path& path, std::string_view line) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::string record(line);
    record.push_back('\n');

#ifdef _WIN32
    FILE* f = _wfopen(path.c_str(), L"ab");
    if (f == nullptr) {
        return false;
    }
    size_t written = std::fwrite(record.data(), 1, record.size(), f);
    std::fclose(f);
    return written == record.size();
#else
    // Одна запись write() с O_APPEND: строки параллельных процессов не перемешиваются
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return false;
    }
    ssize_t written = ::write(fd, record.data(), record.size());
    ::close(fd);
    return written == static_cast<ssize_t>(record.size());
#endif
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

std::int64_t now_unix() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string now_rfc3339() {
    std::time_t t = std::time(nullptr);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

std::uint64_t monotonic_ms() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now().time_since_epoch())
                                          .count());
}

// ----------------------------------------------------------------------------
// Переменные окружения
// ----------------------------------------------------------------------------

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace terse::platform
