#pragma once

#include "file_store.h"
#include "protocol.h"
#include "socket.h"
#include <string>
#include <vector>

namespace sharebox {

/**
 * Client-side result of a file list request
 */
struct FileListResult {
    bool success;
    std::string message;
    bool connection_usable;
    std::vector<FileEntry> files;
    
    FileListResult() : success(false), connection_usable(true) {}
};

nlohmann::json create_file_list_response_payload(const std::vector<FileEntry>& files);

/**
 * Read the files array of a list response.
 * Rows that are not objects or lack a name are skipped.
 */
std::vector<FileEntry> parse_file_list_payload(const nlohmann::json& payload);

/**
 * Server side: answer a list request with the store contents, or an error frame
 * @return false if the response could not be written
 */
bool serve_file_list(socket_t socket, const FileStore& store);

/**
 * Client side: send a list request and wait for the response
 */
FileListResult request_file_list(socket_t socket, uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

} // namespace sharebox
