#include "schemafm/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace schemafm {

namespace fs = std::filesystem;

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

std::string get_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string replace_extension(const std::string& path, const std::string& ext) {
    fs::path p(path);
    p.replace_extension(ext);
    return to_portable_path(p.string());
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

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

std::vector<std::string> list_files(const std::string& dir,
                                    const std::vector<std::string>& exts) {
    std::vector<std::string> files;

    if (is_regular_file(dir)) {
        files.push_back(to_portable_path(dir));
        return files;
    }
    if (!is_directory(dir)) return files;

    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string path = to_portable_path(it->path().string());
        std::string ext = get_extension(path);
        if (exts.empty() || std::find(exts.begin(), exts.end(), ext) != exts.end()) {
            files.push_back(path);
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace schemafm
