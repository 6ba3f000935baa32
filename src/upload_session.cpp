#include "upload_session.h"
#include "base64.h"
#include "fs.h"
#include "logger.h"
#include <algorithm>
#include <limits>
#include <vector>

// Upload module logging macros
#define LOG_UPLOAD_DEBUG(message) LOG_DEBUG("upload", message)
#define LOG_UPLOAD_INFO(message)  LOG_INFO("upload", message)
#define LOG_UPLOAD_WARN(message)  LOG_WARN("upload", message)
#define LOG_UPLOAD_ERROR(message) LOG_ERROR("upload", message)

namespace sharebox {

namespace {
const uint64_t kNoChunkId = std::numeric_limits<uint64_t>::max();

bool metadata_consistent(uint64_t file_size, uint64_t chunks) {
    return (file_size == 0) == (chunks == 0) && chunks <= file_size;
}
}

//=============================================================================
// UploadSender Implementation
//=============================================================================

UploadSender::UploadSender(socket_t socket, const std::string& local_path, uint32_t chunk_size,
                           uint32_t max_frame_size, const CancellationToken* cancel,
                           TransferProgressCallback progress)
    : socket_(socket), local_path_(local_path),
      chunk_size_(chunk_size == 0 ? MAX_CHUNK_SIZE : chunk_size),
      max_frame_size_(max_frame_size), cancel_(cancel), progress_callback_(progress),
      state_(TransferState::REQUESTED) {
}

bool UploadSender::prepare(TransferResult& result) {
    if (!is_file(local_path_)) {
        result = fail("File not found: " + local_path_, true);
        return false;
    }
    
    int64_t file_size = get_file_size(local_path_);
    if (file_size < 0) {
        result = fail("Failed to read file: " + local_path_, true);
        return false;
    }
    
    transfer_.filename = get_filename_from_path(local_path_);
    transfer_.file_size = static_cast<uint64_t>(file_size);
    transfer_.expected_chunks = calculate_chunk_count(transfer_.file_size, chunk_size_);
    return true;
}

TransferResult UploadSender::run() {
    state_ = TransferState::REQUESTED;
    
    TransferResult result;
    if (!prepare(result)) {
        return result;
    }
    
    if (!send_message(socket_, MessageType::FILE_UPLOAD_REQUEST,
                      create_upload_request_payload(transfer_.filename, transfer_.file_size, transfer_.expected_chunks))) {
        return fail("Connection lost", false);
    }
    
    if (!wait_for_acceptance(result)) {
        return result;
    }
    
    LOG_UPLOAD_INFO("Uploading " << transfer_.filename << " (" << transfer_.file_size << " bytes, "
                    << transfer_.expected_chunks << " chunks)");
    
    std::vector<uint8_t> buffer(static_cast<size_t>(std::min<uint64_t>(chunk_size_, transfer_.file_size)));
    
    for (uint64_t chunk_id = 0; chunk_id < transfer_.expected_chunks; ++chunk_id) {
        state_ = TransferState::STREAMING;
        
        if (cancel_ && cancel_->is_cancelled()) {
            transfer_.cancelled = true;
            bool sent = send_message(socket_, MessageType::ERROR_MESSAGE,
                                     create_error_payload("Transfer cancelled by client"));
            return fail("Upload cancelled", sent);
        }
        
        uint64_t offset = chunk_id * chunk_size_;
        size_t length = static_cast<size_t>(std::min<uint64_t>(chunk_size_, transfer_.file_size - offset));
        
        if (!read_file_chunk(local_path_, offset, buffer.data(), length)) {
            return abort_with_error("Failed to read file: " + local_path_);
        }
        
        if (!send_message(socket_, MessageType::FILE_CHUNK,
                          create_chunk_payload(chunk_id, transfer_.expected_chunks, buffer.data(), length))) {
            return fail("Connection lost", false);
        }
        
        if (!wait_for_ack(chunk_id, result)) {
            return result;
        }
        
        transfer_.received_chunks++;
        transfer_.bytes_transferred += length;
        
        if (progress_callback_) {
            progress_callback_(transfer_);
        }
    }
    
    state_ = TransferState::AWAITING_COMPLETION;
    if (!send_message(socket_, MessageType::TRANSFER_COMPLETE,
                      create_transfer_complete_payload(true, transfer_.filename))) {
        return fail("Connection lost", false);
    }
    
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        return fail_on_frame(frame);
    }
    return finish(frame.message);
}

TransferResult UploadSender::run_single_frame() {
    state_ = TransferState::REQUESTED;
    
    TransferResult result;
    if (!prepare(result)) {
        return result;
    }
    
    std::vector<uint8_t> content(static_cast<size_t>(transfer_.file_size));
    if (!content.empty() && !read_file_chunk(local_path_, 0, content.data(), content.size())) {
        return fail("Failed to read file: " + local_path_, true);
    }
    
    // The whole file travels in one frame
    transfer_.expected_chunks = content.empty() ? 0 : 1;
    
    state_ = TransferState::STREAMING;
    if (!send_message(socket_, MessageType::FILE_UPLOAD_REQUEST,
                      create_single_frame_upload_payload(transfer_.filename, base64::encode(content)))) {
        return fail("Connection lost", false);
    }
    
    state_ = TransferState::AWAITING_COMPLETION;
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        return fail_on_frame(frame);
    }
    
    transfer_.received_chunks = transfer_.expected_chunks;
    transfer_.bytes_transferred = transfer_.file_size;
    
    result = finish(frame.message);
    if (result.success && transfer_.expected_chunks == 1 && progress_callback_) {
        progress_callback_(transfer_);
    }
    return result;
}

bool UploadSender::wait_for_acceptance(TransferResult& result) {
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        result = fail_on_frame(frame);
        return false;
    }
    
    const Message& message = frame.message;
    if (message.is(MessageType::FILE_UPLOAD_RESPONSE)) {
        result = fail(get_string_field(message.payload, "message", "Upload rejected by server"), true);
        return false;
    }
    
    if (message.is(MessageType::ERROR_MESSAGE)) {
        result = fail("Server error: " + get_string_field(message.payload, "error", "Unknown error"), true);
        return false;
    }
    
    if (!message.is(MessageType::FILE_RESPONSE)) {
        result = fail("Unexpected response from server: " + message_type_to_string(message.type), false);
        return false;
    }
    
    if (get_uint64_field(message.payload, "file_size", kNoChunkId) != transfer_.file_size ||
        get_uint64_field(message.payload, "chunks", kNoChunkId) != transfer_.expected_chunks) {
        result = abort_with_error("Upload metadata mismatch");
        return false;
    }
    
    std::string accepted_name = get_string_field(message.payload, "filename");
    if (!accepted_name.empty()) {
        transfer_.filename = accepted_name;
    }
    
    state_ = TransferState::METADATA_RECEIVED;
    return true;
}

bool UploadSender::wait_for_ack(uint64_t chunk_id, TransferResult& result) {
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        result = fail_on_frame(frame);
        return false;
    }
    
    const Message& message = frame.message;
    if (message.is(MessageType::CHUNK_ACK)) {
        uint64_t acked = get_uint64_field(message.payload, "chunk_id", kNoChunkId);
        if (acked == chunk_id) {
            return true;
        }
        result = fail("Protocol violation: expected acknowledgment for chunk " + std::to_string(chunk_id), false);
        return false;
    }
    
    // The server answers a chunk it cannot apply with a failed upload response
    if (message.is(MessageType::FILE_UPLOAD_RESPONSE)) {
        result = fail(get_string_field(message.payload, "message", "Upload rejected by server"), true);
        return false;
    }
    
    if (message.is(MessageType::ERROR_MESSAGE)) {
        result = fail("Server error: " + get_string_field(message.payload, "error", "Unknown error"), true);
        return false;
    }
    
    result = fail("Unexpected message during upload: " + message_type_to_string(message.type), false);
    return false;
}

TransferResult UploadSender::finish(const Message& message) {
    if (message.is(MessageType::ERROR_MESSAGE)) {
        return fail("Server error: " + get_string_field(message.payload, "error", "Unknown error"), true);
    }
    
    if (!message.is(MessageType::FILE_UPLOAD_RESPONSE)) {
        return fail("Unexpected response from server: " + message_type_to_string(message.type), false);
    }
    
    std::string server_message = get_string_field(message.payload, "message");
    if (!get_bool_field(message.payload, "success", false)) {
        return fail(server_message.empty() ? "Upload failed" : server_message, true);
    }
    
    state_ = TransferState::DONE;
    if (transfer_.expected_chunks == 0 && progress_callback_) {
        progress_callback_(transfer_);
    }
    
    LOG_UPLOAD_INFO("Uploaded " << transfer_.filename << ": " << server_message);
    
    TransferResult result(true, server_message.empty() ? "File uploaded successfully" : server_message);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

TransferResult UploadSender::abort_with_error(const std::string& message) {
    bool sent = send_message(socket_, MessageType::ERROR_MESSAGE, create_error_payload(message));
    return fail(message, sent);
}

TransferResult UploadSender::fail(const std::string& message, bool connection_usable) {
    state_ = TransferState::FAILED;
    LOG_UPLOAD_WARN("Upload of '" << local_path_ << "' failed: " << message);
    
    TransferResult result(false, message, connection_usable);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

TransferResult UploadSender::fail_on_frame(const FrameResult& frame) {
    switch (frame.status) {
        case FrameStatus::TIMEOUT:
            return fail("Timed out waiting for server", false);
        case FrameStatus::FRAME_ERROR:
            return fail("Invalid frame from server", false);
        default:
            return fail("Connection lost", false);
    }
}

//=============================================================================
// UploadReceiver Implementation
//=============================================================================

UploadReceiver::UploadReceiver(socket_t socket, FileStore& store, uint32_t max_frame_size,
                               const CancellationToken* cancel)
    : socket_(socket), store_(store), max_frame_size_(max_frame_size), cancel_(cancel),
      state_(TransferState::REQUESTED) {
}

TransferResult UploadReceiver::run(const Message& request) {
    state_ = TransferState::REQUESTED;
    
    std::string requested = get_string_field(request.payload, "filename");
    std::string filename = FileStore::sanitize_filename(requested);
    transfer_.filename = filename.empty() ? requested : filename;
    
    if (filename.empty() || !store_.resolve_path(filename, final_path_)) {
        return reject("Invalid filename: " + requested);
    }
    
    if (has_field(request.payload, "file_data")) {
        return run_single_frame(request.payload);
    }
    
    if (!has_field(request.payload, "file_size") || !has_field(request.payload, "chunks")) {
        return reject("Invalid file upload request");
    }
    
    transfer_.file_size = get_uint64_field(request.payload, "file_size");
    transfer_.expected_chunks = get_uint64_field(request.payload, "chunks");
    if (!metadata_consistent(transfer_.file_size, transfer_.expected_chunks)) {
        return reject("Invalid file upload request");
    }
    
    temp_path_ = store_.create_temp_path(filename);
    if (!create_file_binary(temp_path_.c_str(), nullptr, 0)) {
        temp_path_.clear();
        return reject("Failed to create file: " + filename);
    }
    
    if (!send_message(socket_, MessageType::FILE_RESPONSE,
                      create_file_metadata_payload(filename, transfer_.file_size, transfer_.expected_chunks))) {
        return fail("Connection lost", false);
    }
    state_ = TransferState::METADATA_SENT;
    
    LOG_UPLOAD_INFO("Receiving " << filename << " (" << transfer_.file_size << " bytes, "
                    << transfer_.expected_chunks << " chunks)");
    
    TransferResult result;
    while (transfer_.received_chunks < transfer_.expected_chunks) {
        state_ = TransferState::STREAMING;
        
        FrameResult frame = receive_message(socket_, max_frame_size_);
        if (!frame.ok()) {
            return fail("Upload interrupted: " + frame_status_to_string(frame.status), false);
        }
        
        const Message& message = frame.message;
        if (message.is(MessageType::ERROR_MESSAGE)) {
            transfer_.cancelled = true;
            return fail("Client aborted upload: " + get_string_field(message.payload, "error", "Unknown error"), true);
        }
        
        if (message.is(MessageType::TRANSFER_COMPLETE)) {
            return reject("Incomplete upload: received " + std::to_string(transfer_.received_chunks) +
                          " of " + std::to_string(transfer_.expected_chunks) + " chunks");
        }
        
        if (!message.is(MessageType::FILE_CHUNK)) {
            return reject("Protocol violation: expected FILE_CHUNK, got " + message_type_to_string(message.type), false);
        }
        
        if (cancel_ && cancel_->is_cancelled()) {
            transfer_.cancelled = true;
            return reject("Upload aborted: server shutting down", false);
        }
        
        if (!apply_chunk(message, result)) {
            return result;
        }
    }
    
    state_ = TransferState::AWAITING_COMPLETION;
    
    FrameResult frame = receive_message(socket_, max_frame_size_);
    if (!frame.ok()) {
        return fail("Upload interrupted: " + frame_status_to_string(frame.status), false);
    }
    
    const Message& message = frame.message;
    if (message.is(MessageType::ERROR_MESSAGE)) {
        transfer_.cancelled = true;
        return fail("Client aborted upload: " + get_string_field(message.payload, "error", "Unknown error"), true);
    }
    
    if (!message.is(MessageType::TRANSFER_COMPLETE)) {
        return reject("Protocol violation: expected TRANSFER_COMPLETE, got " + message_type_to_string(message.type), false);
    }
    
    if (!get_bool_field(message.payload, "success", true)) {
        return reject("Upload aborted by client");
    }
    
    return commit();
}

TransferResult UploadReceiver::run_single_frame(const nlohmann::json& payload) {
    std::vector<uint8_t> content;
    if (!base64::decode(get_string_field(payload, "file_data"), content)) {
        return reject("Invalid file data");
    }
    
    transfer_.file_size = content.size();
    transfer_.expected_chunks = content.empty() ? 0 : 1;
    state_ = TransferState::STREAMING;
    
    temp_path_ = store_.create_temp_path(transfer_.filename);
    if (!create_file_binary(temp_path_.c_str(), content.data(), content.size())) {
        discard_temp_file();
        return reject("Failed to write file: " + transfer_.filename);
    }
    
    transfer_.received_chunks = transfer_.expected_chunks;
    transfer_.bytes_transferred = content.size();
    return commit();
}

bool UploadReceiver::apply_chunk(const Message& message, TransferResult& result) {
    uint64_t chunk_id = get_uint64_field(message.payload, "chunk_id", kNoChunkId);
    if (chunk_id != transfer_.received_chunks) {
        result = reject("Protocol violation: expected chunk " + std::to_string(transfer_.received_chunks) +
                        ", got " + (chunk_id == kNoChunkId ? std::string("none") : std::to_string(chunk_id)));
        return false;
    }
    
    std::vector<uint8_t> data;
    if (!has_field(message.payload, "data") ||
        !base64::decode(get_string_field(message.payload, "data"), data)) {
        result = reject("Invalid data in chunk " + std::to_string(chunk_id));
        return false;
    }
    
    if (data.empty() || transfer_.bytes_transferred + data.size() > transfer_.file_size) {
        result = reject("Chunk " + std::to_string(chunk_id) + " does not fit the declared file size");
        return false;
    }
    
    if (!write_file_chunk(temp_path_, transfer_.bytes_transferred, data.data(), data.size())) {
        result = reject("Failed to write file: " + transfer_.filename);
        return false;
    }
    
    transfer_.received_chunks++;
    transfer_.bytes_transferred += data.size();
    
    if (!send_message(socket_, MessageType::CHUNK_ACK, create_chunk_ack_payload(chunk_id))) {
        result = fail("Connection lost", false);
        return false;
    }
    
    LOG_UPLOAD_DEBUG("Chunk " << chunk_id + 1 << "/" << transfer_.expected_chunks << " of "
                     << transfer_.filename << " written");
    return true;
}

TransferResult UploadReceiver::commit() {
    int64_t written = get_file_size(temp_path_);
    if (written < 0 || static_cast<uint64_t>(written) != transfer_.file_size ||
        transfer_.bytes_transferred != transfer_.file_size) {
        return reject("Incomplete upload: received " + std::to_string(transfer_.bytes_transferred) +
                      " of " + std::to_string(transfer_.file_size) + " bytes");
    }
    
    if (!rename_file(temp_path_, final_path_)) {
        return reject("Failed to store file: " + transfer_.filename);
    }
    temp_path_.clear();
    
    std::string message = "File " + transfer_.filename + " uploaded successfully";
    if (!send_message(socket_, MessageType::FILE_UPLOAD_RESPONSE, create_upload_response_payload(true, message))) {
        // The file is already in place; only the confirmation was lost
        state_ = TransferState::DONE;
        TransferResult result(true, message, false);
        result.bytes_transferred = transfer_.bytes_transferred;
        return result;
    }
    
    state_ = TransferState::DONE;
    LOG_UPLOAD_INFO("Stored " << transfer_.filename << " (" << transfer_.file_size << " bytes)");
    
    TransferResult result(true, message);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

TransferResult UploadReceiver::reject(const std::string& message, bool connection_usable) {
    bool sent = send_message(socket_, MessageType::FILE_UPLOAD_RESPONSE,
                             create_upload_response_payload(false, message));
    return fail(message, sent && connection_usable);
}

TransferResult UploadReceiver::fail(const std::string& message, bool connection_usable) {
    state_ = TransferState::FAILED;
    discard_temp_file();
    LOG_UPLOAD_WARN("Upload of '" << transfer_.filename << "' failed: " << message);
    
    TransferResult result(false, message, connection_usable);
    result.bytes_transferred = transfer_.bytes_transferred;
    return result;
}

void UploadReceiver::discard_temp_file() {
    if (temp_path_.empty()) {
        return;
    }
    if (!delete_file(temp_path_)) {
        LOG_UPLOAD_WARN("Failed to remove temporary file " << temp_path_);
    }
    temp_path_.clear();
}

} // namespace sharebox
