// HomeStream - String Utilities
// String manipulation and formatting

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace homestream::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static std::string toUpper(const std::string& str);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search and replace
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatTimestamp(std::chrono::system_clock::time_point time,
                                       const std::string& format = "%Y-%m-%d %H:%M:%S");
    static std::string formatIsoTimestamp(std::chrono::system_clock::time_point time);
    static std::string toHex(uint64_t value);

    // Parsing
    static std::optional<int64_t> parseLong(const std::string& str);
    static int parseInt(const std::string& str, int defaultValue = 0);

    // "2021-02-22" or "2021-02-22T20:30:00Z" (UTC)
    static std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& str);

    // Bit rates as ffmpeg reads them: "448k" == 448000, "2Ki" == 2048, "2MB" == 16000000
    static std::optional<double> parseBitrate(const std::string& str);

    // Escaping
    static std::string escapeXml(const std::string& str);

    // Replace characters that are unsafe in file names
    static std::string sanitizeFileName(const std::string& name);
};

} // namespace homestream::utils
