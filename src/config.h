#pragma once

#include "protocol.h"
#include <string>
#include <cstdint>

namespace sharebox {

/**
 * Settings for a FileServer
 */
struct ServerConfig {
    uint16_t listen_port;
    std::string storage_directory;
    int max_connections;            // Connections served concurrently; extra ones are refused
    int backlog;
    int receive_timeout_seconds;    // 0 disables the timeout
    uint32_t chunk_size;
    uint32_t max_frame_size;
    
    ServerConfig()
        : listen_port(9000), storage_directory("storage"), max_connections(32), backlog(5),
          receive_timeout_seconds(300), chunk_size(MAX_CHUNK_SIZE), max_frame_size(DEFAULT_MAX_FRAME_SIZE) {}
};

/**
 * Settings for a FileClient
 */
struct ClientConfig {
    std::string download_directory;
    int timeout_seconds;            // 0 disables the timeout
    uint32_t chunk_size;
    bool chunked_upload;            // false sends the whole file in one upload frame
    uint32_t max_frame_size;
    
    ClientConfig()
        : download_directory("downloads"), timeout_seconds(30), chunk_size(MAX_CHUNK_SIZE),
          chunked_upload(true), max_frame_size(DEFAULT_MAX_FRAME_SIZE) {}
};

// Configuration persistence
// Missing keys keep their current values; keys of the wrong type are logged and ignored.
// A missing or unparsable file returns false and leaves the config untouched.
bool load_server_config(const std::string& path, ServerConfig& config);
bool save_server_config(const std::string& path, const ServerConfig& config);
bool load_client_config(const std::string& path, ClientConfig& config);
bool save_client_config(const std::string& path, const ClientConfig& config);

// JSON conversion used by the load/save functions
nlohmann::json server_config_to_json(const ServerConfig& config);
nlohmann::json client_config_to_json(const ClientConfig& config);
void apply_server_config_json(const nlohmann::json& json, ServerConfig& config);
void apply_client_config_json(const nlohmann::json& json, ClientConfig& config);

} // namespace sharebox
