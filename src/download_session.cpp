#include "download_session.h"
#include "base64.h"
#include "fs.h"
#include "logger.h"
#include <algorithm>
#include <limits>
#include <vector>

// Download module logging macros
#define LOG_DOWNLOAD_DEBUG(message) LOG_DEBUG("download", message)
#define LOG_DOWNLOAD_INFO(message)  LOG_INFO("download", message)
#define LOG_DOWNLOAD_WARN(message)  LOG_WARN("download", message)
#define LOG_DOWNLOAD_ERROR(message) LOG_ERROR("download", message)

namespace sharebox {

namespace {
const uint64_t kNoChunkId = std::numeric_limits<uint64_t>::max();
const char kPartialSuffix[] = ".part";

// Best effort: the connection is dropped right after, whether or not the peer hears about it
void send_abort_notice(socket_t socket, const std::string& error) {
    if (!send_message(socket, MessageType::ERROR_MESSAGE, create_error_payload(error))) {
        LOG_DOWNLOAD_DEBUG("Could not deliver abort notice: " << error);
    }
}
}

//=============================================================================
// DownloadSender Implementation
//=============================================================================

DownloadSender::DownloadSender(socket_t socket, const FileStore& store, uint32_t chunk_size,
                               uint32_t max_frame_size, const CancellationToken* cancel)
    : socket_(socket), store_(store),
      chunk_size_(chunk_size == 0 ? MAX_CHUNK_SIZE : chunk_size),
      max_frame_size_(max_frame_size), cancel_(cancel),
      state_(TransferState::REQUESTED) {
}

TransferResult DownloadSender::run(const std::string& requested_filename) {
    transfer_.filename = requested_filename;
    state_ = TransferState::REQUESTED;
    
    std::string path;
    if (!store_.resolve_path(requested_filename, path) || !is_file(path)) {
        std::string error = "File not found: " + requested_filename;
        bool sent = send_message(socket_, MessageType::ERROR_MESSAGE, create_error_payload(error));
        return fail(error, sent);
    }
    
    int64_t file_size = get_file_size(path);
    if (file_size < 0) {
        std::string error = "Failed to read file: " + requested_filename;
        bool sent = send_message(socket_, MessageType::ERROR_MESSAGE, create_error_payload(error));
        return fail(error, sent);
    }
    
    std::string filename = FileStore::sanitize_filename(requested_filename);
    transfer_.filename = filename;
    transfer_.file_size = static_cast<uint64_t>(file_size);
    transfer_.expected_chunks = calculate_chunk_count(transfer_.file_size, chunk_size_);
    
    if (!send_message(socket_, MessageType::FILE_RESPONSE,
                      create_file_metadata_payload(filename, transfer_.file_size, transfer_.expected_chunks))) {
        return fail("Connection lost", false);
    }
    state_ = TransferState::METADATA_SENT;
    
    LOG_DOWNLOAD_INFO("Sending " << filename << " (" << transfer_.file_size << " bytes, "
                      << transfer_.expected_chunks << " chunks)");
    
    std::vector<uint8_t> buffer(static_cast<size_t>(std::min<uint64_t>(chunk_size_, transfer_.file_size)));
    
    for (uint64_t chunk_id = 0; chunk_id < transfer_.expected_chunks; ++chunk_id) {
        state_ = TransferState::STREAMING;
        
        if (cancel_ && cancel_->is_cancelled()) {
            transfer_.cancelled = true;
            std::string error = "Transfer aborted: server shutting down";
            send_abort_notice(socket_, error);
            return fail(error, false);
        }
        
        uint64_t offset = chunk_id * chunk_size_;
        size_t length = static_cast<size_t>(std::min<uint64_t>(chunk_size_, transfer_.file_size - offset));
        
        if (!read_file_chunk(path, offset, buffer.data(), length)) {
            std::string error = "Failed to read file: " + filename;
            bool sent = send_message(socket_, MessageType::ERROR_MESSAGE, create_error_payload(error));
            return fail(error, sent);
        }
        
        if (!send_message(socket_, MessageType::FILE_CHUNK,
                          create_chunk_payload(chunk_id, transfer_.expected_chunks, buffer.data(), length))) {
            return fail("Connection lost", false);
        }
        
        TransferResult ack_failure;
        if (!wait_for_ack(chunk_id, ack_failure)) {
            return ack_failure;
        }
        
        transfer_.received_chunks++;
        transfer_.bytes_transferred += length;
        LOG_DOWNLOAD_DEBUG("Chunk " << chunk_id + 1 << "/" << transfer_.expected_chunks << " of " << filename << " acknowledged");
    }
    
    state_ = TransferState::AWAITING_COMPLETION;
    if (!send_message(socket_, MessageType::TRANSFER_COMPLETE, create_transfer_complete_payload(true, filename))) {
        return fail("Connection lost", false);
    }
    
    state_ = TransferState::DONE;
    LOG_DOWNLOAD_INFO("Sent file: " << filename);
    
    TransferResult result(true, "Sent file: " + filename);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

bool DownloadSender::wait_for_ack(uint64_t chunk_id, TransferResult& result) {
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        result = fail("Waiting for acknowledgment failed: " + frame_status_to_string(frame.status), false);
        return false;
    }
    
    const Message& message = frame.message;
    if (message.is(MessageType::CHUNK_ACK)) {
        uint64_t acked = get_uint64_field(message.payload, "chunk_id", kNoChunkId);
        if (acked == chunk_id) {
            return true;
        }
        
        std::string error = "Protocol violation: expected acknowledgment for chunk " + std::to_string(chunk_id);
        send_abort_notice(socket_, error);
        result = fail(error, false);
        return false;
    }
    
    if (message.is(MessageType::ERROR_MESSAGE)) {
        transfer_.cancelled = true;
        result = fail("Client aborted transfer: " + get_string_field(message.payload, "error", "Unknown error"), true);
        return false;
    }
    
    std::string error = "Protocol violation: expected CHUNK_ACK, got " + message_type_to_string(message.type);
    send_abort_notice(socket_, error);
    result = fail(error, false);
    return false;
}

TransferResult DownloadSender::fail(const std::string& message, bool connection_usable) {
    state_ = TransferState::FAILED;
    LOG_DOWNLOAD_WARN("Download of '" << transfer_.filename << "' failed: " << message);
    
    TransferResult result(false, message, connection_usable);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

//=============================================================================
// DownloadReceiver Implementation
//=============================================================================

DownloadReceiver::DownloadReceiver(socket_t socket, const std::string& destination_path,
                                   uint32_t max_frame_size, const CancellationToken* cancel,
                                   TransferProgressCallback progress)
    : socket_(socket), destination_path_(destination_path), max_frame_size_(max_frame_size),
      cancel_(cancel), progress_callback_(progress), state_(TransferState::REQUESTED),
      partial_path_(destination_path + kPartialSuffix), partial_created_(false) {
}

TransferResult DownloadReceiver::run(const std::string& filename) {
    transfer_.filename = filename;
    state_ = TransferState::REQUESTED;
    
    // Local failures are caught before the server starts streaming
    if (!create_file_binary(partial_path_.c_str(), nullptr, 0)) {
        return fail("Cannot write to " + destination_path_, true);
    }
    partial_created_ = true;
    
    if (!send_message(socket_, MessageType::FILE_REQUEST, create_file_request_payload(filename))) {
        return fail("Connection lost", false);
    }
    
    TransferResult result;
    if (!receive_metadata(result)) {
        return result;
    }
    
    while (transfer_.received_chunks < transfer_.expected_chunks) {
        state_ = TransferState::STREAMING;
        
        FrameResult frame = receive_message(socket_, max_frame_size_);
        if (!frame.ok()) {
            return fail_on_frame(frame);
        }
        
        const Message& message = frame.message;
        if (message.is(MessageType::ERROR_MESSAGE)) {
            return fail("Server error: " + get_string_field(message.payload, "error", "Unknown error"), true);
        }
        
        if (message.is(MessageType::TRANSFER_COMPLETE)) {
            return fail("Incomplete transfer: received " + std::to_string(transfer_.received_chunks) +
                        " of " + std::to_string(transfer_.expected_chunks) + " chunks", true);
        }
        
        if (!message.is(MessageType::FILE_CHUNK)) {
            return fail("Unexpected message during transfer: " + message_type_to_string(message.type), false);
        }
        
        // The server is blocked on our answer to this chunk, so an error frame here ends it cleanly
        if (cancel_ && cancel_->is_cancelled()) {
            transfer_.cancelled = true;
            bool sent = send_message(socket_, MessageType::ERROR_MESSAGE,
                                     create_error_payload("Transfer cancelled by client"));
            return fail("Download cancelled", sent);
        }
        
        if (!apply_chunk(message, result)) {
            return result;
        }
    }
    
    state_ = TransferState::AWAITING_COMPLETION;
    
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        return fail_on_frame(frame);
    }
    if (frame.message.is(MessageType::TRANSFER_COMPLETE)) {
        return finish(frame.message);
    }
    if (frame.message.is(MessageType::ERROR_MESSAGE)) {
        return fail("Server error: " + get_string_field(frame.message.payload, "error", "Unknown error"), true);
    }
    return fail("Incomplete transfer: expected completion, got " + message_type_to_string(frame.message.type), false);
}

bool DownloadReceiver::receive_metadata(TransferResult& result) {
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        result = fail_on_frame(frame);
        return false;
    }
    
    const Message& message = frame.message;
    if (message.is(MessageType::ERROR_MESSAGE)) {
        result = fail("Server error: " + get_string_field(message.payload, "error", "Unknown error"), true);
        return false;
    }
    
    if (!message.is(MessageType::FILE_RESPONSE)) {
        result = fail("Unexpected response from server: " + message_type_to_string(message.type), false);
        return false;
    }
    
    transfer_.file_size = get_uint64_field(message.payload, "file_size");
    transfer_.expected_chunks = get_uint64_field(message.payload, "chunks");
    
    bool consistent = !message.malformed &&
                      (transfer_.file_size == 0) == (transfer_.expected_chunks == 0) &&
                      transfer_.expected_chunks <= transfer_.file_size;
    if (!consistent) {
        result = fail("Invalid file metadata from server", false);
        return false;
    }
    
    state_ = TransferState::METADATA_RECEIVED;
    LOG_DOWNLOAD_INFO("Receiving " << transfer_.filename << " (" << transfer_.file_size << " bytes, "
                      << transfer_.expected_chunks << " chunks) into " << destination_path_);
    return true;
}

bool DownloadReceiver::apply_chunk(const Message& message, TransferResult& result) {
    uint64_t chunk_id = get_uint64_field(message.payload, "chunk_id", kNoChunkId);
    if (chunk_id != transfer_.received_chunks) {
        result = abort_with_error("Protocol violation: expected chunk " + std::to_string(transfer_.received_chunks) +
                                  ", got " + (chunk_id == kNoChunkId ? std::string("none") : std::to_string(chunk_id)));
        return false;
    }
    
    std::vector<uint8_t> data;
    if (!has_field(message.payload, "data") ||
        !base64::decode(get_string_field(message.payload, "data"), data)) {
        result = abort_with_error("Invalid data in chunk " + std::to_string(chunk_id));
        return false;
    }
    
    if (data.empty() || transfer_.bytes_transferred + data.size() > transfer_.file_size) {
        result = abort_with_error("Chunk " + std::to_string(chunk_id) + " does not fit the declared file size");
        return false;
    }
    
    if (!write_file_chunk(partial_path_, transfer_.bytes_transferred, data.data(), data.size())) {
        result = abort_with_error("Failed to write to " + destination_path_);
        return false;
    }
    
    transfer_.received_chunks++;
    transfer_.bytes_transferred += data.size();
    
    if (!send_message(socket_, MessageType::CHUNK_ACK, create_chunk_ack_payload(chunk_id))) {
        result = fail("Connection lost", false);
        return false;
    }
    
    if (progress_callback_) {
        progress_callback_(transfer_);
    }
    return true;
}

TransferResult DownloadReceiver::finish(const Message& message) {
    if (!get_bool_field(message.payload, "success", true)) {
        return fail("Server reported transfer failure", true);
    }
    
    if (transfer_.bytes_transferred != transfer_.file_size) {
        return fail("Incomplete transfer: received " + std::to_string(transfer_.bytes_transferred) +
                    " of " + std::to_string(transfer_.file_size) + " bytes", true);
    }
    
    if (!rename_file(partial_path_, destination_path_)) {
        return fail("Failed to save " + destination_path_, true);
    }
    partial_created_ = false;
    
    state_ = TransferState::DONE;
    if (transfer_.expected_chunks == 0 && progress_callback_) {
        progress_callback_(transfer_);
    }
    
    LOG_DOWNLOAD_INFO("Downloaded " << transfer_.filename << " to " << destination_path_);
    
    TransferResult result(true, "File saved to " + destination_path_);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

TransferResult DownloadReceiver::abort_with_error(const std::string& message) {
    bool sent = send_message(socket_, MessageType::ERROR_MESSAGE, create_error_payload(message));
    return fail(message, sent);
}

TransferResult DownloadReceiver::fail(const std::string& message, bool connection_usable) {
    state_ = TransferState::FAILED;
    
    if (partial_created_ && !delete_file(partial_path_)) {
        LOG_DOWNLOAD_WARN("Failed to remove partial file " << partial_path_);
    }
    partial_created_ = false;
    
    LOG_DOWNLOAD_WARN("Download of '" << transfer_.filename << "' failed: " << message);
    
    TransferResult result(false, message, connection_usable);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

TransferResult DownloadReceiver::fail_on_frame(const FrameResult& frame) {
    switch (frame.status) {
        case FrameStatus::TIMEOUT:
            return fail("Timed out waiting for server", false);
        case FrameStatus::FRAME_ERROR:
            return fail("Invalid frame from server", false);
        default:
            return fail("Connection lost", false);
    }
}

} // namespace sharebox
