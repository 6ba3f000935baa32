#pragma once

#include <string>
#include <functional>
#include <atomic>
#include <cstdint>

namespace sharebox {

/**
 * Session state of a single file transfer.
 * The sending side moves through METADATA_SENT, the receiving side through METADATA_RECEIVED.
 */
enum class TransferState {
    REQUESTED,              // Request sent or accepted, nothing streamed yet
    METADATA_SENT,          // Sender announced name, size and chunk count
    METADATA_RECEIVED,      // Receiver accepted the announcement
    STREAMING,              // Chunks flowing, one in flight at a time
    AWAITING_COMPLETION,    // All chunks acknowledged, waiting for the completion frame
    DONE,                   // Terminal: transfer completed
    FAILED                  // Terminal: transfer aborted
};

std::string transfer_state_to_string(TransferState state);

/**
 * Session-scoped bookkeeping for one transfer, owned by the session that created it
 */
struct Transfer {
    std::string filename;
    uint64_t file_size;
    uint64_t expected_chunks;
    uint64_t received_chunks;   // Chunks written (receiver) or acknowledged (sender)
    uint64_t bytes_transferred;
    bool cancelled;
    
    Transfer() : file_size(0), expected_chunks(0), received_chunks(0),
                 bytes_transferred(0), cancelled(false) {}
    
    // Calculate completion percentage (0.0 to 100.0)
    double get_completion_percentage() const {
        if (expected_chunks == 0) return 100.0;
        return (static_cast<double>(received_chunks) / expected_chunks) * 100.0;
    }
};

/**
 * Outcome of a protocol operation as seen by the local caller
 */
struct TransferResult {
    bool success;
    std::string message;
    bool connection_usable;     // false after timeouts, lost streams and desynchronized exchanges
    uint64_t bytes_transferred;
    
    TransferResult() : success(false), connection_usable(true), bytes_transferred(0) {}
    TransferResult(bool ok, const std::string& msg, bool usable = true)
        : success(ok), message(msg), connection_usable(usable), bytes_transferred(0) {}
};

/**
 * Cooperative cancellation flag, checked by sessions between chunks
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}
    
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_;
    
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
};

/**
 * Called after every chunk is applied and acknowledged
 */
using TransferProgressCallback = std::function<void(const Transfer& transfer)>;

} // namespace sharebox
