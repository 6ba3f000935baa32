#include "file_list_exchange.h"
#include "logger.h"

#define LOG_LIST_DEBUG(message) LOG_DEBUG("list", message)
#define LOG_LIST_INFO(message)  LOG_INFO("list", message)
#define LOG_LIST_WARN(message)  LOG_WARN("list", message)

namespace sharebox {

nlohmann::json create_file_list_response_payload(const std::vector<FileEntry>& files) {
    nlohmann::json file_array = nlohmann::json::array();
    for (const auto& file : files) {
        nlohmann::json row;
        row["name"] = file.name;
        row["size"] = file.size;
        row["size_formatted"] = file.size_formatted;
        file_array.push_back(row);
    }
    
    nlohmann::json payload;
    payload["files"] = file_array;
    return payload;
}

std::vector<FileEntry> parse_file_list_payload(const nlohmann::json& payload) {
    std::vector<FileEntry> files;
    
    if (!payload.is_object()) {
        return files;
    }
    auto it = payload.find("files");
    if (it == payload.end() || !it->is_array()) {
        return files;
    }
    
    for (const auto& row : *it) {
        std::string name = get_string_field(row, "name");
        if (name.empty()) {
            continue;
        }
        uint64_t size = get_uint64_field(row, "size");
        std::string formatted = get_string_field(row, "size_formatted", FileStore::format_size(size));
        files.emplace_back(name, size, formatted);
    }
    
    return files;
}

bool serve_file_list(socket_t socket, const FileStore& store) {
    std::vector<FileEntry> files;
    if (!store.list_files(files)) {
        return send_message(socket, MessageType::ERROR_MESSAGE,
                            create_error_payload("Failed to list files"));
    }
    
    if (!send_message(socket, MessageType::FILE_LIST_RESPONSE, create_file_list_response_payload(files))) {
        return false;
    }
    
    LOG_LIST_INFO("Sent list of " << files.size() << " files to client");
    return true;
}

FileListResult request_file_list(socket_t socket, uint32_t max_frame_size) {
    FileListResult result;
    
    if (!send_message(socket, MessageType::FILE_LIST_REQUEST, create_file_list_request_payload())) {
        result.message = "Connection lost";
        result.connection_usable = false;
        return result;
    }
    
    FrameResult frame = receive_message(socket, max_frame_size);
    if (!frame.ok()) {
        result.message = frame.status == FrameStatus::TIMEOUT ? "Timed out waiting for file list" : "Connection lost";
        result.connection_usable = false;
        return result;
    }
    
    const Message& response = frame.message;
    if (response.is(MessageType::FILE_LIST_RESPONSE)) {
        if (response.malformed) {
            LOG_LIST_WARN("File list response was malformed, treating as empty");
        }
        result.success = true;
        result.files = parse_file_list_payload(response.payload);
        LOG_LIST_DEBUG("Received list of " << result.files.size() << " files");
        return result;
    }
    
    if (response.is(MessageType::ERROR_MESSAGE)) {
        result.message = "Server error: " + get_string_field(response.payload, "error", "Unknown error");
        return result;
    }
    
    result.message = "Unexpected response from server: " + message_type_to_string(response.type);
    result.connection_usable = false;
    return result;
}

} // namespace sharebox
