#include "schemafm/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace schemafm {

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

// Generate a temporary filename
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}
#endif

} // namespace

ReadFileResult read_file(const std::string& path) {
    ReadFileResult result;

    if (!fs::is_regular_file(path)) {
        result.error = "file not found: " + path;
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + path;
        return result;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        result.error = "failed to read file: " + path;
        return result;
    }

    result.content = ss.str();
    result.ok = true;
    return result;
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

#ifdef _WIN32
    std::string temp_path = path + ".tmp";

    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file";
        return result;
    }

    temp_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    temp_file.close();

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file";
        return result;
    }

    result.ok = true;
#else
    // POSIX implementation: temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

AtomicWriteResult append_line(const std::string& path, const std::string& line) {
    AtomicWriteResult result;
    std::string data = line + "\n";

#ifdef _WIN32
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        result.error = "failed to open for append: " + path;
        return result;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        result.error = "failed to append: " + path;
        return result;
    }
    result.ok = true;
#else
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd < 0) {
        result.error = "failed to open for append: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, data.data(), data.size());
    if (written < 0 || static_cast<size_t>(written) != data.size()) {
        close(fd);
        result.error = "failed to append line";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        result.error = "failed to fsync " + path;
        return result;
    }

    close(fd);
    result.ok = true;
#endif

    return result;
}

} // namespace schemafm
