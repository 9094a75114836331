#include "askills/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace askills {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

// Sibling of the target: <name>.tmp.<8 hex>
std::string make_temp_filename(const std::string& base) {
    static const char digits[] = "0123456789abcdef";
    std::random_device rd;
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string temp = base + kTempMarker;
    for (int i = 0; i < 8; ++i) temp += digits[nibble(rd)];
    return temp;
}

#ifndef _WIN32
bool write_all(int fd, const std::string& content) {
    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}
#endif

// The mode is applied to the temp file, so the target never appears
// with the wrong permissions
AtomicWriteResult replace_file(const std::string& path, const std::string& content,
                               unsigned int mode) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty() && !create_directories(dir_path)) {
        result.error = "cannot create directory " + dir_path;
        return result;
    }

    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    (void)mode;
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out.flush()) {
            DeleteFileA(temp_path.c_str());
            result.error = "cannot write " + temp_path;
            return result;
        }
    }
    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "cannot replace " + path;
        return result;
    }
#else
    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
        result.error = "cannot create " + temp_path + ": " + std::strerror(errno);
        return result;
    }

    const char* failed = nullptr;
    if (!write_all(fd, content)) {
        failed = "write";
    } else if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        failed = "chmod";
    } else if (!fsync_fd(fd)) {
        failed = "fsync";
    }
    int saved_errno = errno;
    close(fd);

    if (failed) {
        unlink(temp_path.c_str());
        result.error = std::string(failed) + " failed for " + temp_path + ": " +
                       std::strerror(saved_errno);
        return result;
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        saved_errno = errno;
        unlink(temp_path.c_str());
        result.error = "cannot rename onto " + path + ": " + std::strerror(saved_errno);
        return result;
    }

    if (!dir_path.empty()) fsync_directory(dir_path);
#endif

    result.ok = true;
    return result;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return replace_file(path, content, 0644);
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned int mode) {
    return replace_file(path, content, mode);
}

bool is_temp_artifact(const std::string& filename) {
    auto pos = filename.rfind(kTempMarker);
    if (pos == std::string::npos) return false;
    std::string suffix = filename.substr(pos + std::strlen(kTempMarker));
    return suffix.size() == 8 &&
           std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) {
               return std::isxdigit(c) != 0;
           });
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) return to_portable_path(path);
    std::string result = to_portable_path(abs.lexically_normal().string());
    while (result.size() > 1 && result.back() == '/') result.pop_back();
    return result;
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

std::vector<std::string> list_files_recursive(const std::string& path) {
    std::vector<std::string> files;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return files;

    for (auto it = fs::recursive_directory_iterator(path, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(to_portable_path(
                fs::relative(it->path(), path, ec).generic_string()));
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec && !fs::exists(fs::symlink_status(path, ec));
}

void prune_empty_directories(const std::string& dir, const std::string& stop_at) {
    fs::path current = fs::path(absolute_path(dir));
    fs::path stop = fs::path(absolute_path(stop_at));

    std::error_code ec;
    while (!current.empty() && current != stop && current != current.root_path()) {
        if (!fs::is_directory(current, ec) || !fs::is_empty(current, ec)) break;
        if (!fs::remove(current, ec) || ec) break;
        current = current.parent_path();
    }
}

bool is_executable(const std::string& path) {
    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (ec) return false;
    return (perms & fs::perms::owner_exec) != fs::perms::none;
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

namespace {

std::string format_utc_now(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), format, &tm_buf);
    return buf;
}

} // namespace

std::string get_current_timestamp() {
    return format_utc_now("%Y-%m-%dT%H:%M:%SZ");
}

std::string get_current_date() {
    return format_utc_now("%Y-%m-%d");
}

bool stdin_is_interactive() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(fileno(stdin)) != 0;
#endif
}

} // namespace askills
