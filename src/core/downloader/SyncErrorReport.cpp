/**
 * SyncErrorReport.cpp
 */

#include "SyncErrorReport.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <filesystem>

namespace homestream::core::downloader {

using utils::StringUtils;

nlohmann::json AttemptReport::toJson() const {
    nlohmann::json errors = nlohmann::json::array();
    for (const auto& e : syncErrors) {
        errors.push_back(e.toJson());
    }

    return {
        {"task", taskId},
        {"receiver", receiver},
        {"recording", recordingId},
        {"title", title},
        {"attempt", attempt},
        {"maxAttempts", maxAttempts},
        {"startOffsetMB", static_cast<double>(startOffset) / (1024.0 * 1024.0)},
        {"outcome", success ? "success" : "failure"},
        {"errorKind", toString(errorKind)},
        {"error", error},
        {"bytes", bytes},
        {"time", StringUtils::formatIsoTimestamp(time)},
        {"syncErrors", errors}
    };
}

ReportWriter::ReportWriter(std::string directory)
    : m_directory(std::move(directory)) {
}

std::optional<std::string> ReportWriter::write(const AttemptReport& report) const {
    auto path = std::filesystem::path(m_directory) /
                (report.taskId + ".attempt" + std::to_string(report.attempt) + ".json");

    // Invalid UTF-8 in a title becomes U+FFFD instead of throwing
    std::string text = report.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!utils::FileUtils::writeFile(path, text)) {
        LOG_ERROR("Cannot write report {}", path.string());
        return std::nullopt;
    }

    LOG_INFO("Wrote report {}", path.string());
    return path.string();
}

} // namespace homestream::core::downloader
