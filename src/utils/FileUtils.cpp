/**
 * FileUtils.cpp
 *
 * File system operations.
 */

#include "FileUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace homestream::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::directoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<fs::path> FileUtils::listDirectory(const fs::path& path) {
    std::vector<fs::path> entries;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;
    for (const auto& e : fs::directory_iterator(path, fs::directory_options::skip_permission_denied, ec)) {
        entries.push_back(e.path());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) return true;

    // Different file systems
    fs::copy_file(source, destination, fs::copy_options::none, ec);
    if (ec) return false;
    fs::remove(source, ec);
    return true;
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? -1 : static_cast<int64_t>(size);
}

std::optional<std::chrono::system_clock::time_point> FileUtils::getLastModified(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(st.st_mtime);
}

std::optional<fs::path> FileUtils::moveToUniquePath(const fs::path& source, const fs::path& directory,
                                                    const std::string& stem, const std::string& extension) {
    for (int count = 1; count < 10000; ++count) {
        std::string name = stem;
        if (count > 1) {
            name += " (" + std::to_string(count) + ")";
        }
        fs::path candidate = directory / (name + extension);

        // link() fails with EEXIST instead of replacing the target
        if (::link(source.c_str(), candidate.c_str()) == 0) {
            std::error_code ec;
            fs::remove(source, ec);
            return candidate;
        }
        if (errno == EEXIST) {
            continue;
        }

        // No hard links on this file system
        std::error_code ec;
        if (fs::exists(candidate, ec)) {
            continue;
        }
        if (moveFile(source, candidate)) {
            return candidate;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

// -- Read/Write operations --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

bool FileUtils::writeFile(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file << content;
    return static_cast<bool>(file);
}

} // namespace homestream::utils
