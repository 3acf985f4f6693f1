/**
 * DownloadTask.cpp
 */

#include "DownloadTask.hpp"
#include "../../utils/StringUtils.hpp"

namespace homestream::core::downloader {

using utils::StringUtils;

const char* toString(ErrorMode mode) {
    switch (mode) {
        case ErrorMode::None:  return "none";
        case ErrorMode::First: return "first";
        case ErrorMode::All:   return "all";
    }
    return "first";
}

ErrorMode parseErrorMode(const std::string& value) {
    std::string mode = StringUtils::toLower(StringUtils::trim(value));
    if (mode == "none")  return ErrorMode::None;
    if (mode == "first") return ErrorMode::First;
    if (mode == "all")   return ErrorMode::All;
    throw ConfigError("invalid error mode '" + value + "' (expected none, first or all)");
}

const char* toString(SyncErrorAction action) {
    switch (action) {
        case SyncErrorAction::Reject: return "reject";
        case SyncErrorAction::Best:   return "best";
        case SyncErrorAction::Ignore: return "ignore";
    }
    return "reject";
}

SyncErrorAction parseSyncErrorAction(const std::string& value) {
    std::string action = StringUtils::toLower(StringUtils::trim(value));
    if (action == "reject") return SyncErrorAction::Reject;
    if (action == "best")   return SyncErrorAction::Best;
    if (action == "ignore") return SyncErrorAction::Ignore;
    throw ConfigError("invalid ts error mode '" + value + "' (expected reject, best or ignore)");
}

nlohmann::json TaskStatus::toJson() const {
    return {
        {"id", id},
        {"recording", recordingId},
        {"title", title},
        {"unit", unit},
        {"state", toString(state)},
        {"attempt", attempt},
        {"maxAttempts", maxAttempts},
        {"errorKind", toString(lastErrorKind)},
        {"error", lastError},
        {"bytes", bytes},
        {"syncErrors", syncErrorCount},
        {"corruptPackets", corruptPackets},
        {"finalPath", finalPath},
        {"reports", reports},
        {"created", StringUtils::formatIsoTimestamp(created)},
        {"updated", StringUtils::formatIsoTimestamp(updated)}
    };
}

} // namespace homestream::core::downloader
