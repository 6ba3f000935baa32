#include "transfer.h"

namespace sharebox {

std::string transfer_state_to_string(TransferState state) {
    switch (state) {
        case TransferState::REQUESTED: return "requested";
        case TransferState::METADATA_SENT: return "metadata_sent";
        case TransferState::METADATA_RECEIVED: return "metadata_received";
        case TransferState::STREAMING: return "streaming";
        case TransferState::AWAITING_COMPLETION: return "awaiting_completion";
        case TransferState::DONE: return "done";
        case TransferState::FAILED: return "failed";
    }
    return "unknown";
}

} // namespace sharebox
