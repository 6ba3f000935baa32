#pragma once

#include "file_store.h"
#include "protocol.h"
#include "socket.h"
#include "transfer.h"
#include <string>

namespace sharebox {

/**
 * Client side of an upload.
 *
 * The chunked form announces the file, waits for the server to accept it
 * and then streams chunks lock-step, one acknowledgment per chunk. The
 * single-frame form carries the whole file base64-encoded in the request.
 */
class UploadSender {
public:
    /**
     * @param socket Connection to the server
     * @param local_path File to upload; its base name becomes the remote name
     * @param chunk_size Maximum bytes per chunk
     * @param max_frame_size Largest inbound frame accepted
     * @param cancel Optional token checked before every chunk
     * @param progress Optional callback invoked after every acknowledged chunk
     */
    UploadSender(socket_t socket, const std::string& local_path, uint32_t chunk_size = MAX_CHUNK_SIZE,
                 uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE,
                 const CancellationToken* cancel = nullptr,
                 TransferProgressCallback progress = nullptr);
    
    TransferResult run();
    TransferResult run_single_frame();
    
    TransferState get_state() const { return state_; }
    const Transfer& get_transfer() const { return transfer_; }

private:
    socket_t socket_;
    std::string local_path_;
    uint32_t chunk_size_;
    uint32_t max_frame_size_;
    const CancellationToken* cancel_;
    TransferProgressCallback progress_callback_;
    TransferState state_;
    Transfer transfer_;
    
    bool prepare(TransferResult& result);
    bool wait_for_acceptance(TransferResult& result);
    bool wait_for_ack(uint64_t chunk_id, TransferResult& result);
    TransferResult finish(const Message& message);
    TransferResult abort_with_error(const std::string& message);
    TransferResult fail(const std::string& message, bool connection_usable);
    TransferResult fail_on_frame(const FrameResult& frame);
};

/**
 * Server side of an upload.
 *
 * Chunks are written into a hidden temporary in the store and renamed over
 * the final name only after the byte count has been verified. Failures are
 * reported to the client as an upload response with success = false.
 */
class UploadReceiver {
public:
    /**
     * @param socket Connection to the uploading client
     * @param store Storage the file is written to
     * @param max_frame_size Largest inbound frame accepted
     * @param cancel Optional token checked for every chunk
     */
    UploadReceiver(socket_t socket, FileStore& store, uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE,
                   const CancellationToken* cancel = nullptr);
    
    /**
     * Handle an upload request already read by the dispatch loop
     * @param request FILE_UPLOAD_REQUEST message, chunked or single-frame form
     */
    TransferResult run(const Message& request);
    
    TransferState get_state() const { return state_; }
    const Transfer& get_transfer() const { return transfer_; }

private:
    socket_t socket_;
    FileStore& store_;
    uint32_t max_frame_size_;
    const CancellationToken* cancel_;
    TransferState state_;
    Transfer transfer_;
    std::string temp_path_;
    std::string final_path_;
    
    TransferResult run_single_frame(const nlohmann::json& payload);
    bool apply_chunk(const Message& message, TransferResult& result);
    TransferResult commit();
    TransferResult reject(const std::string& message, bool connection_usable = true);
    TransferResult fail(const std::string& message, bool connection_usable);
    void discard_temp_file();
};

} // namespace sharebox
