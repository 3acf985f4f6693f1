#pragma once

/**
 * SyncErrorReport.hpp
 *
 * JSON report left behind for a pull attempt.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../Errors.hpp"
#include "../stream/StreamValidator.hpp"

namespace homestream::core::downloader {

struct AttemptReport {
    std::string taskId;
    std::string receiver;
    std::string recordingId;
    std::string title;
    int attempt{1};
    int maxAttempts{1};
    uint64_t startOffset{0};
    bool success{false};
    ErrorKind errorKind{ErrorKind::None};
    std::string error;
    uint64_t bytes{0};
    std::vector<stream::SyncError> syncErrors;
    std::chrono::system_clock::time_point time;

    nlohmann::json toJson() const;
};

/**
 * Writes reports as "<directory>/<taskId>.attempt<N>.json"
 */
class ReportWriter {
public:
    explicit ReportWriter(std::string directory);

    /**
     * @return Path of the written report, nullopt if it could not be written
     */
    std::optional<std::string> write(const AttemptReport& report) const;

    const std::string& directory() const { return m_directory; }

private:
    std::string m_directory;
};

} // namespace homestream::core::downloader
