// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "harvest/platform.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace harvest::platform {

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

namespace {

std::string random_suffix(size_t length = 8) {
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
}

}  // namespace

std::optional<std::filesystem::path> stage_file(const std::filesystem::path& target,
                                               std::string_view content, std::string* error) {
    auto fail = [&](const std::string& msg) -> std::optional<std::filesystem::path> {
        if (error != nullptr) {
            *error = msg;
        }
        return std::nullopt;
    };

    std::filesystem::path dir = target.parent_path();
    std::error_code ec;
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return fail("could not create directory '" + path_to_utf8(dir) + "' - " +
                        ec.message());
        }
    }

    // Временный файл в той же директории: rename остаётся в пределах одной ФС
    std::filesystem::path tmp = target;
    tmp += "." + random_suffix() + ".tmp";

    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return fail("could not open '" + path_to_utf8(tmp) + "' for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        out.close();
        std::filesystem::remove(tmp, ec);
        return fail("could not write '" + path_to_utf8(tmp) + "'");
    }
    return tmp;
}

bool commit_staged(const std::filesystem::path& staged, const std::filesystem::path& target,
                   std::string* error) {
    std::error_code ec;
    std::filesystem::rename(staged, target, ec);
    if (ec) {
        discard_staged(staged);
        if (error != nullptr) {
            *error = "could not replace '" + path_to_utf8(target) + "' - " + ec.message();
        }
        return false;
    }
    return true;
}

void discard_staged(const std::filesystem::path& staged) {
    std::error_code ignore;
    std::filesystem::remove(staged, ignore);
}

std::optional<std::filesystem::path> move_aside(const std::filesystem::path& target,
                                                std::string* error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(target, ec)) {
        return std::filesystem::path();
    }

    std::filesystem::path backup = target;
    backup += "." + random_suffix() + ".bak";
    std::filesystem::rename(target, backup, ec);
    if (ec) {
        if (error != nullptr) {
            *error = "could not move aside '" + path_to_utf8(target) + "' - " + ec.message();
        }
        return std::nullopt;
    }
    return backup;
}

bool restore_aside(const std::filesystem::path& backup, const std::filesystem::path& target,
                   std::string* error) {
    std::error_code ec;
    std::filesystem::rename(backup, target, ec);
    if (ec) {
        if (error != nullptr) {
            *error = "could not restore '" + path_to_utf8(target) + "' from '" +
                     path_to_utf8(backup) + "' - " + ec.message();
        }
        return false;
    }
    return true;
}

bool write_file_atomic(const std::filesystem::path& target, std::string_view content,
                       std::string* error) {
    auto staged = stage_file(target, content, error);
    return staged.has_value() && commit_staged(*staged, target, error);
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<std::string> env_var(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace harvest::platform
