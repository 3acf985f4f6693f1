// HomeStream - File Utilities
// File system operations

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <chrono>

namespace fs = std::filesystem;

namespace homestream::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool directoryExists(const fs::path& path);
    static std::vector<fs::path> listDirectory(const fs::path& path);   // sorted by name

    // File operations
    static bool fileExists(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static bool deleteFile(const fs::path& path);
    static int64_t getFileSize(const fs::path& path);   // -1 if unknown
    static std::optional<std::chrono::system_clock::time_point> getLastModified(const fs::path& path);

    /**
     * Move source into directory as "<stem><extension>", or
     * "<stem> (2)<extension>", "<stem> (3)<extension>"... when taken.
     * Never replaces an existing file.
     * @return The path the file was moved to, nullopt on failure
     */
    static std::optional<fs::path> moveToUniquePath(const fs::path& source, const fs::path& directory,
                                                    const std::string& stem, const std::string& extension);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);
    static bool writeFile(const fs::path& path, const std::string& content);
};

} // namespace homestream::utils
