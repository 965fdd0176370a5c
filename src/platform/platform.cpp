#include "zshrcman/platform.hpp"
#include "zshrcman/types.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace zshrcman {

namespace fs = std::filesystem;

OsType detect_os() {
#if defined(__APPLE__)
    return OsType::MacOS;
#elif defined(_WIN32)
    return OsType::Windows;
#else
    return OsType::Linux;
#endif
}

namespace {

// Unique within the process, in the target's directory
std::string sibling_temp_path(const std::string& path) {
    static std::atomic<unsigned> counter{0};
    auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
    return path + ".tmp." + std::to_string(tick) + "." + std::to_string(counter++);
}

#ifndef _WIN32
// Create the file, write every byte and flush it to stable storage.
// Returns an error message, empty on success.
std::string write_synced(const std::string& path, const std::string& content) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        return "cannot create " + path + ": " + std::strerror(errno);
    }

    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = "cannot write " + path + ": " + std::strerror(errno);
            close(fd);
            return err;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }

#ifdef __APPLE__
    bool synced = fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    bool synced = fsync(fd) == 0;
#endif
    bool closed = close(fd) == 0;
    if (!synced || !closed) {
        return "cannot flush " + path;
    }
    return {};
}

void sync_directory(const std::string& dir) {
    int fd = open(dir.c_str(), O_RDONLY);
    if (fd >= 0) {
        fsync(fd);
        close(fd);
    }
}
#else
std::string write_synced(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return "cannot create " + path;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        return "cannot write " + path;
    }
    return {};
}

void sync_directory(const std::string&) {}
#endif

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty() && !create_directories(dir_path)) {
        result.error = "failed to create directory: " + dir_path;
        return result;
    }

    std::string temp_path = sibling_temp_path(path);
    std::error_code ignored;

    std::string err = write_synced(temp_path, content);
    if (!err.empty()) {
        fs::remove(temp_path, ignored);
        result.error = err;
        return result;
    }

    // Replaces an existing target
    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ignored);
        result.error = "failed to replace " + path + ": " + ec.message();
        return result;
    }

    if (!dir_path.empty()) {
        sync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

#ifdef _WIN32
    char* environ_block = GetEnvironmentStrings();
    if (environ_block) {
        const char* p = environ_block;
        while (*p) {
            std::string entry(p);
            auto eq = entry.find('=');
            if (eq != std::string::npos && eq > 0) {
                env[entry.substr(0, eq)] = entry.substr(eq + 1);
            }
            p += entry.size() + 1;
        }
        FreeEnvironmentStrings(environ_block);
    }
#else
    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
#endif

    return env;
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace zshrcman
