#pragma once

#include "config.h"
#include "file_list_exchange.h"
#include "socket.h"
#include "transfer.h"
#include <string>
#include <mutex>
#include <atomic>

namespace sharebox {

/**
 * FileClient - one connection to a FileServer.
 *
 * Operations are blocking and serialized: a call made while another one is
 * running on the same client returns immediately with an error result. Any
 * timeout or lost stream disconnects the client.
 */
class FileClient {
public:
    explicit FileClient(const ClientConfig& config = ClientConfig());
    ~FileClient();
    
    /**
     * Connect to a server, replacing any existing connection
     * @param host Hostname or IP address
     * @param port Server port
     * @return true if connected
     */
    bool connect(const std::string& host, int port);
    
    /**
     * Close the connection. An operation running on another thread is
     * woken up and the connection is closed when it returns, whatever its result.
     */
    void disconnect();
    
    bool is_connected() const { return connected_.load() && !disconnect_requested_.load(); }
    
    /**
     * Fetch the server's file listing
     */
    FileListResult list_files();
    
    /**
     * Download a file
     * @param filename Remote name
     * @param destination Local path; empty means <download_directory>/<filename>
     * @param progress Optional callback invoked after every chunk
     * @param cancel Optional token; cancellation takes effect at the next chunk
     */
    TransferResult download_file(const std::string& filename, const std::string& destination = "",
                                 TransferProgressCallback progress = nullptr,
                                 const CancellationToken* cancel = nullptr);
    
    /**
     * Upload a local file under its base name
     * @param local_path File to upload
     * @param progress Optional callback invoked after every chunk
     * @param cancel Optional token; cancellation takes effect at the next chunk
     */
    TransferResult upload_file(const std::string& local_path,
                               TransferProgressCallback progress = nullptr,
                               const CancellationToken* cancel = nullptr);
    
    const ClientConfig& get_config() const { return config_; }

private:
    ClientConfig config_;
    socket_t socket_;
    std::atomic<bool> connected_;
    std::atomic<bool> disconnect_requested_;    // Set by disconnect() while an operation holds the socket
    mutable std::mutex socket_mutex_;
    std::mutex operation_mutex_;
    
    socket_t get_socket() const;
    bool check_connected();
    void close_connection();
    void after_operation(bool connection_usable);
};

} // namespace sharebox
