/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace homestream::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) result += separator + parts[i];
    return result;
}

// -- Search/Replace --

std::string StringUtils::replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatTimestamp(std::chrono::system_clock::time_point time, const std::string& format) {
    auto tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

std::string StringUtils::formatIsoTimestamp(std::chrono::system_clock::time_point time) {
    return formatTimestamp(time, "%Y-%m-%dT%H:%M:%SZ");
}

std::string StringUtils::toHex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << value;
    return oss.str();
}

// -- Parsing --

std::optional<int64_t> StringUtils::parseLong(const std::string& str) {
    std::string s = trim(str);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

int StringUtils::parseInt(const std::string& str, int defaultValue) {
    auto value = parseLong(str);
    if (!value || *value > INT32_MAX || *value < INT32_MIN) return defaultValue;
    return static_cast<int>(*value);
}

std::optional<std::chrono::system_clock::time_point> StringUtils::parseIsoTimestamp(const std::string& str) {
    std::string s = trim(str);
    if (s.size() < 10) return std::nullopt;

    std::tm tm{};
    std::istringstream iss(s);
    if (s.size() == 10) {
        iss >> std::get_time(&tm, "%Y-%m-%d");
    } else {
        if (s.back() == 'Z') s.pop_back();
        iss.str(s);
        iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    }
    if (iss.fail()) return std::nullopt;

    time_t tt = timegm(&tm);
    if (tt == static_cast<time_t>(-1) && !(tm.tm_year == 69 && tm.tm_mon == 11 && tm.tm_mday == 31)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

std::optional<double> StringUtils::parseBitrate(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end == s.c_str()) return std::nullopt;

    std::string suffix(end);
    if (suffix.empty()) return value;

    double multiplier = 1.0;
    size_t pos = 0;
    switch (suffix[0]) {
        case 'k': case 'K': multiplier = 1e3; pos = 1; break;
        case 'm': case 'M': multiplier = 1e6; pos = 1; break;
        case 'g': case 'G': multiplier = 1e9; pos = 1; break;
        default: break;
    }
    if (pos < suffix.size() && suffix[pos] == 'i') {
        multiplier = std::pow(1024.0, std::round(std::log10(multiplier) / 3.0));
        ++pos;
    }
    if (pos < suffix.size() && suffix[pos] == 'B') {
        multiplier *= 8.0;
        ++pos;
    }
    if (pos != suffix.size()) return std::nullopt;

    return value * multiplier;
}

// -- Escaping --

std::string StringUtils::escapeXml(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

std::string StringUtils::sanitizeFileName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '\\': result += '-'; break;
            case '/':  result += '-'; break;
            case ':':  result += " -"; break;
            case ';':  result += ','; break;
            case '*':  result += '.'; break;
            case '?':  result += '.'; break;
            case '!':  result += '.'; break;
            case '"':  result += '\''; break;
            case '<':  result += '('; break;
            case '>':  result += ')'; break;
            case '|':  result += ' '; break;
            default:
                if (static_cast<unsigned char>(c) >= 0x20) result += c;
        }
    }
    return result;
}

} // namespace homestream::utils
