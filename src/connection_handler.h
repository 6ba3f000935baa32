#pragma once

#include "config.h"
#include "file_store.h"
#include "protocol.h"
#include "socket.h"
#include "threadmanager.h"
#include "transfer.h"
#include <string>
#include <thread>
#include <mutex>
#include <atomic>
#include <unordered_map>
#include <cstdint>

namespace sharebox {

/**
 * FileServer - accepts connections and serves file list, download and upload
 * requests, one thread per connection.
 *
 * Each connection is a strict request/response loop; transfers run lock-step
 * inside it. Connections above max_connections are refused with an error frame.
 */
class FileServer : public ThreadManager {
public:
    explicit FileServer(const ServerConfig& config = ServerConfig());
    ~FileServer();
    
    /**
     * Create the storage directory, bind the listening socket and start accepting
     * @return true if the server is running afterwards
     */
    bool start();
    
    /**
     * Stop accepting, wake and close every live connection and join all threads
     */
    void stop();
    
    bool is_running() const { return running_.load(); }
    
    /**
     * Get the port the server is bound to (resolves port 0 to the actual port)
     */
    int get_port() const { return bound_port_; }
    
    /**
     * Get the number of live connections
     */
    size_t get_connection_count() const;
    
    const ServerConfig& get_config() const { return config_; }
    FileStore& get_store() { return store_; }

private:
    struct Connection {
        socket_t socket;
        std::string peer_address;
    };
    
    ServerConfig config_;
    FileStore store_;
    std::atomic<bool> running_;
    socket_t server_socket_;
    int bound_port_;
    std::thread accept_thread_;
    CancellationToken cancel_token_;
    
    std::unordered_map<uint64_t, Connection> connections_;
    mutable std::mutex connections_mutex_;
    uint64_t next_connection_id_;
    
    void accept_loop();
    bool admit_connection(socket_t client_socket, const std::string& peer_address);
    void handle_connection(uint64_t connection_id, socket_t client_socket, const std::string& peer_address);
    
    /**
     * Handle one request frame
     * @return false if the connection must be closed
     */
    bool dispatch(socket_t client_socket, const Message& message);
    void unregister_connection(uint64_t connection_id);
};

} // namespace sharebox
