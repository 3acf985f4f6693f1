/**
 * TransferSession.cpp
 */

#include "TransferSession.hpp"
#include "../Logger.hpp"

namespace homestream::core {

TransferSession::TransferSession(StreamSource& source, StreamSink& sink, SessionOptions options,
                                 const std::atomic<bool>* cancel)
    : m_source(source)
    , m_sink(sink)
    , m_options(std::move(options))
    , m_cancel(cancel)
    , m_validator(m_options.startOffset == 0) {
    m_validating = m_options.validate &&
                   m_options.direction == Direction::Pull &&
                   m_options.streamKind == StreamKind::TS;
    if (m_options.label.empty()) {
        m_options.label = m_source.describe();
    }
}

void TransferSession::transition(TransferState next) {
    LOG_TRACE("{}: {} -> {}", m_options.label, toString(m_state.load()), toString(next));
    m_state = next;
    if (m_stateListener) {
        m_stateListener(next);
    }
}

void TransferSession::checkCancelled() const {
    if (m_cancel && m_cancel->load()) {
        throw CancelledError();
    }
}

bool TransferSession::onChunk(const char* data, size_t len) {
    if (m_cancel && m_cancel->load()) {
        m_stop = StopReason::Cancelled;
        return false;
    }

    if (m_state == TransferState::Connecting) {
        transition(TransferState::Transferring);
    }

    if (!m_sink.write(data, len)) {
        m_stop = StopReason::SinkFailed;
        return false;
    }

    uint64_t total = m_bytes += len;
    if (m_progressListener) {
        m_progressListener(total);
    }

    if (m_validating) {
        size_t newRuns = m_validator.feed(reinterpret_cast<const uint8_t*>(data), len);
        if (newRuns > 0) {
            const auto& last = m_validator.errors().back();
            LOG_INFO("{}: TS sync loss at offset {} (attempt {})",
                     m_options.label, m_options.startOffset + last.offset, m_options.attempt);
            if (m_options.syncPolicy == SyncPolicy::AbortOnFirst) {
                m_stop = StopReason::SyncError;
                return false;
            }
        }
        if (m_options.syncPolicy == SyncPolicy::Tolerate && m_options.corruptPacketLimit &&
            m_validator.corruptPackets() >= *m_options.corruptPacketLimit) {
            LOG_INFO("{}: {} corrupt packet(s), no better than a previous attempt",
                     m_options.label, m_validator.corruptPackets());
            m_stop = StopReason::SyncError;
            return false;
        }
    }

    return true;
}

void TransferSession::verify() {
    bool tolerated = m_options.syncPolicy == SyncPolicy::Tolerate && m_stop != StopReason::SyncError;
    if (m_validating && !m_validator.clean() && !tolerated) {
        throw StreamCorruptionError(
            std::to_string(m_validator.errors().size()) + " TS sync error(s), " +
            std::to_string(m_validator.corruptPackets()) + " packet(s) affected");
    }

    auto expected = m_options.expectedBytes ? m_options.expectedBytes : m_source.expectedLength();
    if (expected && *expected != m_bytes.load()) {
        throw StreamCorruptionError("received " + std::to_string(m_bytes.load()) +
                                    " of " + std::to_string(*expected) + " bytes");
    }
}

TransferResult TransferSession::run() {
    TransferResult result;
    auto start = std::chrono::steady_clock::now();

    try {
        checkCancelled();
        transition(TransferState::Connecting);
        m_source.open(m_options.startOffset);
        if (!m_sink.open()) {
            throw ConnectError("cannot open " + m_sink.describe());
        }

        checkCancelled();
        m_source.pump([this](const char* data, size_t len) {
            return onChunk(data, len);
        });
        if (m_state == TransferState::Connecting) {
            // Empty stream
            transition(TransferState::Transferring);
        }

        bool flushed = m_sink.close();
        switch (m_stop) {
            case StopReason::Cancelled:
                throw CancelledError();
            case StopReason::SinkFailed:
                throw ConnectError("write to " + m_sink.describe() + " failed");
            case StopReason::SyncError:
            case StopReason::None:
                break;
        }
        if (!flushed) {
            throw ConnectError("cannot flush " + m_sink.describe());
        }

        checkCancelled();
        transition(TransferState::Verifying);
        verify();

        if (m_decodeStep) {
            checkCancelled();
            transition(TransferState::Decoding);
            m_decodeStep();
        }

        if (m_finalizeStep) {
            checkCancelled();
            transition(TransferState::Finalizing);
            result.finalPath = m_finalizeStep();
        }

        transition(TransferState::Complete);
        result.state = TransferState::Complete;

    } catch (const HomeStreamError& e) {
        m_sink.close();
        result.errorKind = e.kind();
        result.error = e.what();
        result.state = TransferState::Failed;
        transition(TransferState::Failed);
    } catch (const std::exception& e) {
        m_sink.close();
        result.errorKind = ErrorKind::None;
        result.error = e.what();
        result.state = TransferState::Failed;
        transition(TransferState::Failed);
    }

    result.bytes = m_bytes.load();
    result.syncErrors = m_validator.errors();
    result.corruptPackets = m_validator.corruptPackets();
    result.startOffset = m_options.startOffset;
    for (auto& e : result.syncErrors) {
        e.offset += m_options.startOffset;
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.success()) {
        LOG_DEBUG("{}: transferred {} bytes in {} ms", m_options.label, result.bytes, result.elapsed.count());
    } else {
        LOG_WARN("{}: attempt {} failed ({}): {}", m_options.label, m_options.attempt,
                 toString(result.errorKind), result.error);
    }

    return result;
}

} // namespace homestream::core
