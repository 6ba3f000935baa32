#include "connection_handler.h"
#include "download_session.h"
#include "file_list_exchange.h"
#include "upload_session.h"
#include "sharebox_log_macros.h"
#include <exception>
#include <vector>

namespace sharebox {

FileServer::FileServer(const ServerConfig& config)
    : config_(config),
      store_(config.storage_directory),
      running_(false),
      server_socket_(INVALID_SOCKET_VALUE),
      bound_port_(0),
      next_connection_id_(1) {
}

FileServer::~FileServer() {
    stop();
}

bool FileServer::start() {
    if (running_.load()) {
        LOG_SERVER_WARN("FileServer is already running");
        return false;
    }
    
    LOG_SERVER_INFO("Starting FileServer on port " << config_.listen_port);
    
    // Initialize socket library first (required for all socket operations)
    if (!init_socket_library()) {
        LOG_SERVER_ERROR("Failed to initialize socket library");
        return false;
    }
    
    if (!store_.initialize()) {
        LOG_SERVER_ERROR("Failed to initialize storage directory " << store_.get_root());
        return false;
    }
    
    server_socket_ = create_tcp_server(config_.listen_port, config_.backlog);
    if (!is_valid_socket(server_socket_)) {
        LOG_SERVER_ERROR("Failed to create server socket on port " << config_.listen_port);
        return false;
    }
    bound_port_ = get_ephemeral_port(server_socket_);
    
    cancel_token_.reset();
    reset_shutdown();
    running_.store(true);
    
    accept_thread_ = std::thread(&FileServer::accept_loop, this);
    
    LOG_SERVER_INFO("FileServer started on port " << bound_port_ << ", serving " << store_.get_root());
    return true;
}

void FileServer::stop() {
    if (!running_.load()) {
        return;
    }
    
    LOG_SERVER_INFO("Stopping FileServer");
    running_.store(false);
    cancel_token_.cancel();
    shutdown_all_threads();
    
    // Wake the accept loop
    if (is_valid_socket(server_socket_)) {
        shutdown_socket(server_socket_);
    }
    
    if (accept_thread_.joinable()) {
        LOG_SERVER_DEBUG("Waiting for accept thread to finish");
        accept_thread_.join();
    }
    
    if (is_valid_socket(server_socket_)) {
        close_socket(server_socket_);
        server_socket_ = INVALID_SOCKET_VALUE;
    }
    
    // Wake every connection blocked in a read; each thread closes its own socket
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        LOG_SERVER_INFO("Closing " << connections_.size() << " connections");
        for (const auto& pair : connections_) {
            shutdown_socket(pair.second.socket);
        }
    }
    
    join_all_active_threads();
    
    LOG_SERVER_INFO("FileServer stopped");
}

size_t FileServer::get_connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void FileServer::accept_loop() {
    LOG_SERVER_INFO("Accept loop started");
    
    while (running_.load()) {
        socket_t client_socket = accept_client(server_socket_);
        if (!is_valid_socket(client_socket)) {
            if (running_.load()) {
                LOG_SERVER_ERROR("Failed to accept client connection");
            }
            break;
        }
        
        std::string peer_address = get_peer_address(client_socket);
        if (peer_address.empty()) {
            peer_address = "unknown";
        }
        
        cleanup_finished_threads();
        
        if (!admit_connection(client_socket, peer_address)) {
            close_socket(client_socket);
        }
    }
    
    LOG_SERVER_INFO("Accept loop ended");
}

bool FileServer::admit_connection(socket_t client_socket, const std::string& peer_address) {
    uint64_t connection_id = 0;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        
        if (!running_.load()) {
            return false;
        }
        
        if (static_cast<int>(connections_.size()) >= config_.max_connections) {
            LOG_SERVER_INFO("Connection limit reached (" << config_.max_connections << "), rejecting " << peer_address);
            if (!send_message(client_socket, MessageType::ERROR_MESSAGE, create_error_payload("Server busy"))) {
                LOG_SERVER_DEBUG("Failed to notify rejected client " << peer_address);
            }
            return false;
        }
        
        connection_id = next_connection_id_++;
        Connection connection;
        connection.socket = client_socket;
        connection.peer_address = peer_address;
        connections_[connection_id] = connection;
    }
    
    if (config_.receive_timeout_seconds > 0 &&
        !set_socket_receive_timeout(client_socket, config_.receive_timeout_seconds * 1000)) {
        LOG_SERVER_WARN("Failed to set receive timeout for " << peer_address);
    }
    
    LOG_SERVER_INFO("New connection from " << peer_address << " (id " << connection_id << ")");
    
    bool started = add_managed_thread([this, connection_id, client_socket, peer_address]() {
        handle_connection(connection_id, client_socket, peer_address);
    }, "connection-" + std::to_string(connection_id));
    
    if (!started) {
        unregister_connection(connection_id);
        return false;
    }
    return true;
}

void FileServer::handle_connection(uint64_t connection_id, socket_t client_socket, const std::string& peer_address) {
    LOG_SERVER_DEBUG("Started handling connection " << connection_id << " from " << peer_address);
    
    while (running_.load()) {
        FrameResult frame = receive_message(client_socket, config_.max_frame_size);
        if (!frame.ok()) {
            LOG_SERVER_INFO("Connection " << connection_id << " from " << peer_address << " ended: "
                            << frame_status_to_string(frame.status));
            break;
        }
        
        bool keep_open = true;
        try {
            keep_open = dispatch(client_socket, frame.message);
        } catch (const std::exception& e) {
            LOG_SERVER_ERROR("Error handling " << message_type_to_string(frame.message.type)
                             << " from " << peer_address << ": " << e.what());
            keep_open = send_message(client_socket, MessageType::ERROR_MESSAGE,
                                     create_error_payload(std::string("Server error: ") + e.what()));
        }
        
        if (!keep_open) {
            LOG_SERVER_INFO("Closing connection " << connection_id << " from " << peer_address);
            break;
        }
    }
    
    unregister_connection(connection_id);
    close_socket(client_socket);
    LOG_SERVER_DEBUG("Finished handling connection " << connection_id);
}

bool FileServer::dispatch(socket_t client_socket, const Message& message) {
    if (message.malformed) {
        LOG_SERVER_WARN("Malformed payload in " << message_type_to_string(message.type) << ", using defaults");
    }
    
    switch (static_cast<MessageType>(message.type)) {
        case MessageType::FILE_LIST_REQUEST: {
            LOG_SERVER_DEBUG("File list requested");
            return serve_file_list(client_socket, store_);
        }
        
        case MessageType::FILE_REQUEST: {
            std::string filename = get_string_field(message.payload, "filename");
            LOG_SERVER_INFO("File requested: " << filename);
            DownloadSender sender(client_socket, store_, config_.chunk_size, config_.max_frame_size, &cancel_token_);
            return sender.run(filename).connection_usable;
        }
        
        case MessageType::FILE_UPLOAD_REQUEST: {
            LOG_SERVER_INFO("Upload requested: " << get_string_field(message.payload, "filename"));
            UploadReceiver receiver(client_socket, store_, config_.max_frame_size, &cancel_token_);
            return receiver.run(message).connection_usable;
        }
        
        default:
            LOG_SERVER_WARN("Ignoring unexpected message: " << message_type_to_string(message.type));
            return true;
    }
}

void FileServer::unregister_connection(uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection_id);
}

} // namespace sharebox
