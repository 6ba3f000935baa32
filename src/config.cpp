#include "config.h"
#include "fs.h"
#include "logger.h"
#include <limits>

// Config module logging macros
#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace sharebox {

namespace {

// Read an unsigned key within [min_value, max_value]; anything else is ignored
template <typename T>
void read_unsigned(const nlohmann::json& json, const char* key, T& value, uint64_t min_value, uint64_t max_value) {
    if (!json.contains(key)) {
        return;
    }
    const nlohmann::json& field = json[key];
    if (!field.is_number_unsigned() && !(field.is_number_integer() && field.get<int64_t>() >= 0)) {
        LOG_CONFIG_WARN("Ignoring '" << key << "': expected a non-negative integer");
        return;
    }
    uint64_t parsed = field.get<uint64_t>();
    if (parsed < min_value || parsed > max_value) {
        LOG_CONFIG_WARN("Ignoring '" << key << "': " << parsed << " is out of range");
        return;
    }
    value = static_cast<T>(parsed);
}

void read_string(const nlohmann::json& json, const char* key, std::string& value) {
    if (!json.contains(key)) {
        return;
    }
    if (!json[key].is_string()) {
        LOG_CONFIG_WARN("Ignoring '" << key << "': expected a string");
        return;
    }
    value = json[key].get<std::string>();
}

void read_bool(const nlohmann::json& json, const char* key, bool& value) {
    if (!json.contains(key)) {
        return;
    }
    if (!json[key].is_boolean()) {
        LOG_CONFIG_WARN("Ignoring '" << key << "': expected a boolean");
        return;
    }
    value = json[key].get<bool>();
}

bool load_json_object(const std::string& path, nlohmann::json& json) {
    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No configuration file at " << path);
        return false;
    }
    
    std::string data;
    if (!read_file_text(path, data)) {
        LOG_CONFIG_ERROR("Failed to read configuration file " << path);
        return false;
    }
    
    try {
        json = nlohmann::json::parse(data);
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file " << path << ": " << e.what());
        return false;
    }
    
    if (!json.is_object()) {
        LOG_CONFIG_ERROR("Configuration file " << path << " does not contain a JSON object");
        return false;
    }
    return true;
}

bool save_json_object(const std::string& path, const nlohmann::json& json) {
    if (!create_file(path, json.dump(4))) {
        LOG_CONFIG_ERROR("Failed to write configuration file " << path);
        return false;
    }
    LOG_CONFIG_DEBUG("Saved configuration to " << path);
    return true;
}

const uint64_t kMaxInt = static_cast<uint64_t>(std::numeric_limits<int>::max());

} // namespace

nlohmann::json server_config_to_json(const ServerConfig& config) {
    nlohmann::json json;
    json["listen_port"] = config.listen_port;
    json["storage_directory"] = config.storage_directory;
    json["max_connections"] = config.max_connections;
    json["backlog"] = config.backlog;
    json["receive_timeout_seconds"] = config.receive_timeout_seconds;
    json["chunk_size"] = config.chunk_size;
    json["max_frame_size"] = config.max_frame_size;
    return json;
}

nlohmann::json client_config_to_json(const ClientConfig& config) {
    nlohmann::json json;
    json["download_directory"] = config.download_directory;
    json["timeout_seconds"] = config.timeout_seconds;
    json["chunk_size"] = config.chunk_size;
    json["chunked_upload"] = config.chunked_upload;
    json["max_frame_size"] = config.max_frame_size;
    return json;
}

void apply_server_config_json(const nlohmann::json& json, ServerConfig& config) {
    read_unsigned(json, "listen_port", config.listen_port, 0, 65535);
    read_string(json, "storage_directory", config.storage_directory);
    read_unsigned(json, "max_connections", config.max_connections, 1, kMaxInt);
    read_unsigned(json, "backlog", config.backlog, 1, kMaxInt);
    read_unsigned(json, "receive_timeout_seconds", config.receive_timeout_seconds, 0, kMaxInt);
    read_unsigned(json, "chunk_size", config.chunk_size, 1, MAX_CHUNK_SIZE);
    read_unsigned(json, "max_frame_size", config.max_frame_size, FRAME_HEADER_SIZE, std::numeric_limits<uint32_t>::max());
}

void apply_client_config_json(const nlohmann::json& json, ClientConfig& config) {
    read_string(json, "download_directory", config.download_directory);
    read_unsigned(json, "timeout_seconds", config.timeout_seconds, 0, kMaxInt);
    read_unsigned(json, "chunk_size", config.chunk_size, 1, MAX_CHUNK_SIZE);
    read_bool(json, "chunked_upload", config.chunked_upload);
    read_unsigned(json, "max_frame_size", config.max_frame_size, FRAME_HEADER_SIZE, std::numeric_limits<uint32_t>::max());
}

bool load_server_config(const std::string& path, ServerConfig& config) {
    nlohmann::json json;
    if (!load_json_object(path, json)) {
        return false;
    }
    apply_server_config_json(json, config);
    LOG_CONFIG_INFO("Loaded server configuration from " << path);
    return true;
}

bool save_server_config(const std::string& path, const ServerConfig& config) {
    return save_json_object(path, server_config_to_json(config));
}

bool load_client_config(const std::string& path, ClientConfig& config) {
    nlohmann::json json;
    if (!load_json_object(path, json)) {
        return false;
    }
    apply_client_config_json(json, config);
    LOG_CONFIG_INFO("Loaded client configuration from " << path);
    return true;
}

bool save_client_config(const std::string& path, const ClientConfig& config) {
    return save_json_object(path, client_config_to_json(config));
}

} // namespace sharebox
