#pragma once

#include "file_store.h"
#include "protocol.h"
#include "socket.h"
#include "transfer.h"
#include <string>

namespace sharebox {

/**
 * Server side of a chunked download.
 *
 * Announces the file, then sends one chunk at a time and blocks for the
 * matching acknowledgment before sending the next. A missing file is
 * answered with a single error frame naming it.
 */
class DownloadSender {
public:
    /**
     * @param socket Connection to the requesting client
     * @param store Storage the file is read from
     * @param chunk_size Maximum bytes per chunk
     * @param max_frame_size Largest inbound frame accepted while waiting for acks
     * @param cancel Optional token checked before every chunk
     */
    DownloadSender(socket_t socket, const FileStore& store, uint32_t chunk_size = MAX_CHUNK_SIZE,
                   uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE, const CancellationToken* cancel = nullptr);
    
    /**
     * Serve one file request
     * @param requested_filename Name as sent by the client
     * @return Result; connection_usable is false when the stream must be closed
     */
    TransferResult run(const std::string& requested_filename);
    
    TransferState get_state() const { return state_; }
    const Transfer& get_transfer() const { return transfer_; }

private:
    socket_t socket_;
    const FileStore& store_;
    uint32_t chunk_size_;
    uint32_t max_frame_size_;
    const CancellationToken* cancel_;
    TransferState state_;
    Transfer transfer_;
    
    bool wait_for_ack(uint64_t chunk_id, TransferResult& result);
    TransferResult fail(const std::string& message, bool connection_usable);
};

/**
 * Client side of a chunked download.
 *
 * Sends the request, writes chunks in id order at the running offset of a
 * "<destination>.part" sibling and acknowledges each one. The sibling is
 * renamed over the destination once the transfer completes. Aborts on an
 * error frame, lost stream, timeout, protocol violation or cancellation; a
 * failed download removes the sibling and leaves the destination untouched.
 */
class DownloadReceiver {
public:
    /**
     * @param socket Connection to the server
     * @param destination_path Local path the file is saved to (replaced on success)
     * @param max_frame_size Largest inbound frame accepted
     * @param cancel Optional token checked for every chunk
     * @param progress Optional callback invoked after every acknowledged chunk
     */
    DownloadReceiver(socket_t socket, const std::string& destination_path,
                     uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE,
                     const CancellationToken* cancel = nullptr,
                     TransferProgressCallback progress = nullptr);
    
    /**
     * Request a file and receive it
     * @param filename Remote name
     */
    TransferResult run(const std::string& filename);
    
    TransferState get_state() const { return state_; }
    const Transfer& get_transfer() const { return transfer_; }

private:
    socket_t socket_;
    std::string destination_path_;
    uint32_t max_frame_size_;
    const CancellationToken* cancel_;
    TransferProgressCallback progress_callback_;
    TransferState state_;
    Transfer transfer_;
    std::string partial_path_;
    bool partial_created_;
    
    bool receive_metadata(TransferResult& result);
    bool apply_chunk(const Message& message, TransferResult& result);
    TransferResult finish(const Message& message);
    TransferResult abort_with_error(const std::string& message);
    TransferResult fail(const std::string& message, bool connection_usable);
    TransferResult fail_on_frame(const FrameResult& frame);
};

} // namespace sharebox
