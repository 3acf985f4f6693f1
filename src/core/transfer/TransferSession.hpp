#pragma once

/**
 * TransferSession.hpp
 *
 * One attempt of a pull, or one response of a serve, driven from
 * connection to completion.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "TransferState.hpp"
#include "StreamSource.hpp"
#include "StreamSink.hpp"
#include "../Errors.hpp"
#include "../models/Recording.hpp"
#include "../stream/StreamValidator.hpp"

namespace homestream::core {

enum class Direction {
    Serve,
    Pull
};

/**
 * What to do when the validator finds a misaligned packet
 */
enum class SyncPolicy {
    AbortOnFirst,   // stop the attempt at the first error run
    CollectAll,     // read to the end, recording every error run
    Tolerate        // like CollectAll, but sync errors alone do not fail the attempt
};

struct SessionOptions {
    Direction direction{Direction::Pull};
    StreamKind streamKind{StreamKind::TS};
    bool validate{true};                  // only applies to TS pulls
    SyncPolicy syncPolicy{SyncPolicy::AbortOnFirst};
    // Tolerate only: give up once this many packets are corrupt
    std::optional<uint64_t> corruptPacketLimit;
    uint64_t startOffset{0};
    std::optional<uint64_t> expectedBytes;   // overrides the length the source declares
    int attempt{1};
    std::string label;                    // for log messages
};

struct TransferResult {
    TransferState state{TransferState::Failed};
    ErrorKind errorKind{ErrorKind::None};
    std::string error;
    uint64_t bytes{0};
    std::vector<stream::SyncError> syncErrors;
    uint64_t corruptPackets{0};
    uint64_t startOffset{0};
    std::string finalPath;
    std::chrono::milliseconds elapsed{0};

    bool success() const { return state == TransferState::Complete; }
};

/**
 * TransferSession - single transfer state machine
 *
 *   Connecting -> Transferring -> Verifying -> [Decoding] -> [Finalizing] -> Complete
 *
 * Any error ends the session in Failed. Errors are caught here and
 * reported through TransferResult; run() does not throw engine errors.
 *
 * The cancel flag is checked at every state boundary and before each
 * chunk is written; a chunk write in progress always completes.
 */
class TransferSession {
public:
    using StateListener = std::function<void(TransferState)>;
    using ProgressListener = std::function<void(uint64_t bytes)>;
    using DecodeStep = std::function<void()>;
    using FinalizeStep = std::function<std::string()>;

    TransferSession(StreamSource& source, StreamSink& sink, SessionOptions options,
                    const std::atomic<bool>* cancel = nullptr);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    void setStateListener(StateListener listener) { m_stateListener = std::move(listener); }
    void setProgressListener(ProgressListener listener) { m_progressListener = std::move(listener); }

    /**
     * Optional step run after verification; throws DecodeError on failure
     */
    void setDecodeStep(DecodeStep step) { m_decodeStep = std::move(step); }

    /**
     * Optional last step; returns the final path of the output
     */
    void setFinalizeStep(FinalizeStep step) { m_finalizeStep = std::move(step); }

    TransferResult run();

    TransferState state() const { return m_state.load(); }
    uint64_t bytesTransferred() const { return m_bytes.load(); }
    const std::vector<stream::SyncError>& syncErrors() const { return m_validator.errors(); }
    uint64_t corruptPackets() const { return m_validator.corruptPackets(); }

private:
    void transition(TransferState next);
    void checkCancelled() const;
    bool onChunk(const char* data, size_t len);
    void verify();

    StreamSource& m_source;
    StreamSink& m_sink;
    SessionOptions m_options;
    const std::atomic<bool>* m_cancel;

    std::atomic<TransferState> m_state{TransferState::Queued};
    std::atomic<uint64_t> m_bytes{0};

    bool m_validating{false};
    stream::StreamValidator m_validator;

    // Why the chunk handler stopped the source, if it did
    enum class StopReason { None, Cancelled, SinkFailed, SyncError };
    StopReason m_stop{StopReason::None};

    StateListener m_stateListener;
    ProgressListener m_progressListener;
    DecodeStep m_decodeStep;
    FinalizeStep m_finalizeStep;
};

} // namespace homestream::core
