#include "client_session.h"
#include "download_session.h"
#include "upload_session.h"
#include "file_store.h"
#include "fs.h"
#include "sharebox_log_macros.h"

namespace sharebox {

namespace {
const char* const kBusyMessage = "Another operation is already in progress";
const char* const kNotConnectedMessage = "Not connected to server";
}

FileClient::FileClient(const ClientConfig& config)
    : config_(config), socket_(INVALID_SOCKET_VALUE), connected_(false), disconnect_requested_(false) {
}

FileClient::~FileClient() {
    disconnect();
}

bool FileClient::connect(const std::string& host, int port) {
    std::unique_lock<std::mutex> operation_lock(operation_mutex_, std::try_to_lock);
    if (!operation_lock.owns_lock()) {
        LOG_CLIENT_WARN("Cannot connect while an operation is in progress");
        return false;
    }
    
    close_connection();
    if (!init_socket_library()) {
        LOG_CLIENT_ERROR("Failed to initialize socket library");
        return false;
    }
    
    int timeout_ms = config_.timeout_seconds * 1000;
    LOG_CLIENT_INFO("Connecting to " << host << ":" << port);
    
    socket_t socket = create_tcp_client(host, port, timeout_ms);
    if (!is_valid_socket(socket)) {
        LOG_CLIENT_ERROR("Failed to connect to " << host << ":" << port);
        return false;
    }
    
    if (timeout_ms > 0 && !set_socket_receive_timeout(socket, timeout_ms)) {
        LOG_CLIENT_WARN("Failed to set receive timeout");
    }
    
    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        socket_ = socket;
    }
    connected_.store(true);
    
    LOG_CLIENT_INFO("Connected to " << host << ":" << port);
    return true;
}

void FileClient::disconnect() {
    std::unique_lock<std::mutex> operation_lock(operation_mutex_, std::try_to_lock);
    if (!operation_lock.owns_lock()) {
        // The running operation releases the socket itself when it returns
        std::lock_guard<std::mutex> lock(socket_mutex_);
        disconnect_requested_.store(true);
        if (is_valid_socket(socket_)) {
            LOG_CLIENT_INFO("Interrupting operation in progress");
            shutdown_socket(socket_);
        }
        return;
    }
    
    close_connection();
}

FileListResult FileClient::list_files() {
    FileListResult result;
    
    std::unique_lock<std::mutex> operation_lock(operation_mutex_, std::try_to_lock);
    if (!operation_lock.owns_lock()) {
        result.message = kBusyMessage;
        return result;
    }
    
    if (!check_connected()) {
        result.message = kNotConnectedMessage;
        return result;
    }
    
    result = request_file_list(get_socket(), config_.max_frame_size);
    after_operation(result.connection_usable);
    return result;
}

TransferResult FileClient::download_file(const std::string& filename, const std::string& destination,
                                         TransferProgressCallback progress, const CancellationToken* cancel) {
    std::unique_lock<std::mutex> operation_lock(operation_mutex_, std::try_to_lock);
    if (!operation_lock.owns_lock()) {
        return TransferResult(false, kBusyMessage);
    }
    
    if (!check_connected()) {
        return TransferResult(false, kNotConnectedMessage);
    }
    
    std::string destination_path = destination;
    if (destination_path.empty()) {
        std::string local_name = FileStore::sanitize_filename(filename);
        if (local_name.empty()) {
            return TransferResult(false, "Invalid filename: " + filename);
        }
        if (!create_directories(config_.download_directory)) {
            return TransferResult(false, "Cannot create download directory " + config_.download_directory);
        }
        destination_path = combine_paths(config_.download_directory, local_name);
    }
    
    LOG_CLIENT_INFO("Downloading " << filename << " to " << destination_path);
    
    DownloadReceiver receiver(get_socket(), destination_path, config_.max_frame_size, cancel, progress);
    TransferResult result = receiver.run(filename);
    after_operation(result.connection_usable);
    return result;
}

TransferResult FileClient::upload_file(const std::string& local_path,
                                       TransferProgressCallback progress, const CancellationToken* cancel) {
    std::unique_lock<std::mutex> operation_lock(operation_mutex_, std::try_to_lock);
    if (!operation_lock.owns_lock()) {
        return TransferResult(false, kBusyMessage);
    }
    
    if (!check_connected()) {
        return TransferResult(false, kNotConnectedMessage);
    }
    
    LOG_CLIENT_INFO("Uploading " << local_path);
    
    UploadSender sender(get_socket(), local_path, config_.chunk_size, config_.max_frame_size, cancel, progress);
    TransferResult result = config_.chunked_upload ? sender.run() : sender.run_single_frame();
    after_operation(result.connection_usable);
    return result;
}

socket_t FileClient::get_socket() const {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    return socket_;
}

// Finish a disconnect that arrived after the previous operation had already returned
bool FileClient::check_connected() {
    if (disconnect_requested_.load()) {
        close_connection();
    }
    return connected_.load();
}

void FileClient::close_connection() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (is_valid_socket(socket_)) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
        LOG_CLIENT_INFO("Disconnected from server");
    }
    connected_.store(false);
    disconnect_requested_.store(false);
}

void FileClient::after_operation(bool connection_usable) {
    if (disconnect_requested_.load()) {
        LOG_CLIENT_INFO("Completing disconnect requested during the operation");
        close_connection();
    } else if (!connection_usable) {
        LOG_CLIENT_WARN("Connection is no longer usable, disconnecting");
        close_connection();
    }
}

} // namespace sharebox
