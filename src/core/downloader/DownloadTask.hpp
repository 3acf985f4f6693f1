#pragma once

/**
 * DownloadTask.hpp
 *
 * Represents a single pull of a recording, and the status snapshot handed
 * out to other threads.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../Errors.hpp"
#include "../models/Recording.hpp"
#include "../transfer/TransferState.hpp"

namespace homestream::core::downloader {

/**
 * Which failed or finished attempts leave a report behind
 */
enum class ErrorMode {
    None,    // never
    First,   // the earliest failed attempt only
    All      // every attempt, success or failure
};

const char* toString(ErrorMode mode);

/**
 * @throws ConfigError for anything but "none", "first" or "all"
 */
ErrorMode parseErrorMode(const std::string& value);

/**
 * What a transport stream with sync errors is worth
 */
enum class SyncErrorAction {
    Reject,  // fail the attempt and retry
    Best,    // keep the attempt with the fewest corrupt packets
    Ignore   // keep the first attempt that completes
};

const char* toString(SyncErrorAction action);

/**
 * @throws ConfigError for anything but "reject", "best" or "ignore"
 */
SyncErrorAction parseSyncErrorAction(const std::string& value);

/**
 * Sync error found during a given attempt
 */
struct SyncErrorRecord {
    uint64_t offset{0};
    uint64_t packetCount{0};
    uint8_t foundByte{0};
    int attempt{0};
};

/**
 * Per-pull settings
 */
struct DownloadOptions {
    int maxAttempts{3};
    bool decode{false};                  // run the decoder when one is configured
    std::string mak;                     // empty = the receiver's configured key
    std::chrono::milliseconds retryDelay{2000};
    bool validate{true};
    SyncErrorAction syncAction{SyncErrorAction::Reject};
    bool saveMetadata{false};            // write "<file>.txt" beside the recording
};

/**
 * DownloadTask - one requested pull
 *
 * Owned by the worker that drives it. Other threads only see TaskStatus
 * snapshots.
 */
struct DownloadTask {
    // Task ID (assigned by DownloadManager)
    std::string id;

    // Copy of the recording, immutable after creation
    Recording recording;

    std::string destinationDir;
    ErrorMode errorMode{ErrorMode::First};
    DownloadOptions options;

    int attemptCount{0};
    std::vector<SyncErrorRecord> syncErrors;

    // Set only on success
    std::string finalPath;

    // Best mode: the attempt kept so far
    std::string bestPath;

    // Corrupt packets in bestPath, or in finalPath once finished
    uint64_t corruptPackets{0};

    bool reportWritten{false};
};

/**
 * Point-in-time view of a task
 */
struct TaskStatus {
    std::string id;
    std::string recordingId;
    std::string title;
    std::string unit;
    TransferState state{TransferState::Queued};
    int attempt{0};
    int maxAttempts{0};
    ErrorKind lastErrorKind{ErrorKind::None};
    std::string lastError;
    uint64_t bytes{0};
    size_t syncErrorCount{0};
    uint64_t corruptPackets{0};    // of the kept file
    std::string finalPath;
    std::vector<std::string> reports;
    std::chrono::system_clock::time_point created;
    std::chrono::system_clock::time_point updated;

    bool isTerminal() const { return core::isTerminal(state); }
    bool isSuccess() const { return state == TransferState::Complete; }
    bool wasCancelled() const { return lastErrorKind == ErrorKind::Cancelled; }

    nlohmann::json toJson() const;
};

} // namespace homestream::core::downloader
