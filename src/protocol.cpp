#include "protocol.h"
#include "base64.h"
#include "logger.h"
#include <algorithm>

// Protocol module logging macros
#define LOG_PROTOCOL_DEBUG(message) LOG_DEBUG("protocol", message)
#define LOG_PROTOCOL_INFO(message)  LOG_INFO("protocol", message)
#define LOG_PROTOCOL_WARN(message)  LOG_WARN("protocol", message)
#define LOG_PROTOCOL_ERROR(message) LOG_ERROR("protocol", message)

namespace sharebox {

namespace {

void write_u32_be(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(value & 0xFF);
}

uint32_t read_u32_be(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

} // anonymous namespace

bool is_known_message_type(uint32_t type) {
    return type >= static_cast<uint32_t>(MessageType::FILE_LIST_REQUEST) &&
           type <= static_cast<uint32_t>(MessageType::TRANSFER_COMPLETE);
}

std::string message_type_to_string(uint32_t type) {
    switch (static_cast<MessageType>(type)) {
        case MessageType::FILE_LIST_REQUEST: return "FILE_LIST_REQUEST";
        case MessageType::FILE_LIST_RESPONSE: return "FILE_LIST_RESPONSE";
        case MessageType::FILE_REQUEST: return "FILE_REQUEST";
        case MessageType::FILE_RESPONSE: return "FILE_RESPONSE";
        case MessageType::FILE_UPLOAD_REQUEST: return "FILE_UPLOAD_REQUEST";
        case MessageType::FILE_UPLOAD_RESPONSE: return "FILE_UPLOAD_RESPONSE";
        case MessageType::ERROR_MESSAGE: return "ERROR_MESSAGE";
        case MessageType::FILE_CHUNK: return "FILE_CHUNK";
        case MessageType::CHUNK_ACK: return "CHUNK_ACK";
        case MessageType::TRANSFER_COMPLETE: return "TRANSFER_COMPLETE";
    }
    return "UNKNOWN(" + std::to_string(type) + ")";
}

std::string frame_status_to_string(FrameStatus status) {
    switch (status) {
        case FrameStatus::OK: return "ok";
        case FrameStatus::END_OF_STREAM: return "end of stream";
        case FrameStatus::TIMEOUT: return "timeout";
        case FrameStatus::FRAME_ERROR: return "frame error";
    }
    return "unknown";
}

std::vector<uint8_t> encode_message(MessageType type, const nlohmann::json& payload) {
    // Invalid UTF-8 in strings is replaced rather than thrown on
    std::string serialized = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    
    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + serialized.size());
    write_u32_be(frame.data(), static_cast<uint32_t>(type));
    write_u32_be(frame.data() + 4, static_cast<uint32_t>(serialized.size()));
    std::copy(serialized.begin(), serialized.end(), frame.begin() + FRAME_HEADER_SIZE);
    
    return frame;
}

void parse_frame_header(const uint8_t* header, uint32_t& type, uint32_t& length) {
    type = read_u32_be(header);
    length = read_u32_be(header + 4);
}

Message decode_payload(uint32_t type, const uint8_t* data, size_t size) {
    Message message;
    message.type = type;
    
    if (size == 0) {
        return message;
    }
    
    nlohmann::json parsed = nlohmann::json::parse(data, data + size, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_PROTOCOL_WARN("Malformed payload for " << message_type_to_string(type)
                          << " (" << size << " bytes), substituting empty payload");
        message.malformed = true;
        return message;
    }
    
    message.payload = std::move(parsed);
    return message;
}

FrameResult receive_message(socket_t socket, uint32_t max_frame_size) {
    FrameResult result;
    
    uint8_t header[FRAME_HEADER_SIZE];
    ReceiveStatus status = receive_exact_bytes(socket, header, FRAME_HEADER_SIZE, READ_BUFFER_SIZE);
    if (status == ReceiveStatus::TIMEOUT) {
        result.status = FrameStatus::TIMEOUT;
        return result;
    }
    if (status != ReceiveStatus::OK) {
        result.status = FrameStatus::END_OF_STREAM;
        return result;
    }
    
    uint32_t type = 0;
    uint32_t length = 0;
    parse_frame_header(header, type, length);
    
    if (length > max_frame_size) {
        LOG_PROTOCOL_ERROR("Frame " << message_type_to_string(type) << " declares " << length
                           << " payload bytes, limit is " << max_frame_size);
        result.status = FrameStatus::FRAME_ERROR;
        return result;
    }
    
    std::vector<uint8_t> payload(length);
    if (length > 0) {
        status = receive_exact_bytes(socket, payload.data(), length, READ_BUFFER_SIZE);
        if (status == ReceiveStatus::TIMEOUT) {
            result.status = FrameStatus::TIMEOUT;
            return result;
        }
        if (status != ReceiveStatus::OK) {
            result.status = FrameStatus::END_OF_STREAM;
            return result;
        }
    }
    
    result.status = FrameStatus::OK;
    result.message = decode_payload(type, payload.data(), payload.size());
    
    LOG_PROTOCOL_DEBUG("Received " << message_type_to_string(type) << " (" << length << " bytes) on socket " << socket);
    return result;
}

bool send_message(socket_t socket, MessageType type, const nlohmann::json& payload) {
    std::vector<uint8_t> frame = encode_message(type, payload);
    if (!send_all(socket, frame.data(), frame.size())) {
        LOG_PROTOCOL_DEBUG("Failed to send " << message_type_to_string(static_cast<uint32_t>(type))
                           << " on socket " << socket);
        return false;
    }
    
    LOG_PROTOCOL_DEBUG("Sent " << message_type_to_string(static_cast<uint32_t>(type))
                       << " (" << frame.size() - FRAME_HEADER_SIZE << " bytes) on socket " << socket);
    return true;
}

//=============================================================================
// Payload builders
//=============================================================================

nlohmann::json create_file_list_request_payload() {
    return nlohmann::json::object();
}

nlohmann::json create_file_request_payload(const std::string& filename) {
    nlohmann::json payload;
    payload["filename"] = filename;
    return payload;
}

nlohmann::json create_file_metadata_payload(const std::string& filename, uint64_t file_size, uint64_t chunks) {
    nlohmann::json payload;
    payload["filename"] = filename;
    payload["file_size"] = file_size;
    payload["chunks"] = chunks;
    return payload;
}

nlohmann::json create_upload_request_payload(const std::string& filename, uint64_t file_size, uint64_t chunks) {
    return create_file_metadata_payload(filename, file_size, chunks);
}

nlohmann::json create_single_frame_upload_payload(const std::string& filename, const std::string& file_data_base64) {
    nlohmann::json payload;
    payload["filename"] = filename;
    payload["file_data"] = file_data_base64;
    return payload;
}

nlohmann::json create_upload_response_payload(bool success, const std::string& message) {
    nlohmann::json payload;
    payload["success"] = success;
    payload["message"] = message;
    return payload;
}

nlohmann::json create_error_payload(const std::string& error) {
    nlohmann::json payload;
    payload["error"] = error;
    return payload;
}

nlohmann::json create_chunk_payload(uint64_t chunk_id, uint64_t total_chunks, const uint8_t* data, size_t size) {
    nlohmann::json payload;
    payload["chunk_id"] = chunk_id;
    payload["total_chunks"] = total_chunks;
    payload["data"] = base64::encode(data, size);
    return payload;
}

nlohmann::json create_chunk_ack_payload(uint64_t chunk_id) {
    nlohmann::json payload;
    payload["chunk_id"] = chunk_id;
    return payload;
}

nlohmann::json create_transfer_complete_payload(bool success, const std::string& filename) {
    nlohmann::json payload;
    payload["success"] = success;
    payload["filename"] = filename;
    return payload;
}

//=============================================================================
// Field readers
//=============================================================================

std::string get_string_field(const nlohmann::json& payload, const char* key, const std::string& default_value) {
    if (!payload.is_object()) return default_value;
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return default_value;
    }
    return it->get<std::string>();
}

uint64_t get_uint64_field(const nlohmann::json& payload, const char* key, uint64_t default_value) {
    if (!payload.is_object()) return default_value;
    auto it = payload.find(key);
    if (it == payload.end()) {
        return default_value;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer()) {
        int64_t value = it->get<int64_t>();
        return value < 0 ? default_value : static_cast<uint64_t>(value);
    }
    return default_value;
}

bool get_bool_field(const nlohmann::json& payload, const char* key, bool default_value) {
    if (!payload.is_object()) return default_value;
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_boolean()) {
        return default_value;
    }
    return it->get<bool>();
}

bool has_field(const nlohmann::json& payload, const char* key) {
    return payload.is_object() && payload.find(key) != payload.end();
}

uint64_t calculate_chunk_count(uint64_t file_size, uint32_t chunk_size) {
    if (chunk_size == 0) {
        chunk_size = MAX_CHUNK_SIZE;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

} // namespace sharebox
