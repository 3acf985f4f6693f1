#pragma once

/**
 * TransferState.hpp
 *
 * States shared by pull tasks and serve transfers.
 *
 *   Queued -> Connecting -> Transferring -> Verifying -> [Decoding] -> [Finalizing] -> Complete
 *   any failure -> Retrying -> Connecting   (attempts left)
 *               -> Failed                   (no attempts left, or cancelled)
 */

#include <optional>
#include <string>

namespace homestream::core {

enum class TransferState {
    Queued,
    Connecting,
    Transferring,
    Verifying,
    Decoding,
    Finalizing,
    Complete,
    Failed,
    Retrying
};

inline const char* toString(TransferState state) {
    switch (state) {
        case TransferState::Queued:       return "queued";
        case TransferState::Connecting:   return "connecting";
        case TransferState::Transferring: return "transferring";
        case TransferState::Verifying:    return "verifying";
        case TransferState::Decoding:     return "decoding";
        case TransferState::Finalizing:   return "finalizing";
        case TransferState::Complete:     return "complete";
        case TransferState::Failed:       return "failed";
        case TransferState::Retrying:     return "retrying";
    }
    return "unknown";
}

inline bool isTerminal(TransferState state) {
    return state == TransferState::Complete || state == TransferState::Failed;
}

} // namespace homestream::core
