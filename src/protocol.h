#pragma once

#include "socket.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace sharebox {

// Wire frame: [type: uint32 BE][length: uint32 BE][payload: length bytes of JSON]
constexpr size_t FRAME_HEADER_SIZE = 8;

// Largest slice of file content carried by one chunk frame
constexpr uint32_t MAX_CHUNK_SIZE = 64 * 1024;

// Largest single recv() while filling a frame payload
constexpr size_t READ_BUFFER_SIZE = 8 * 1024;

// Frames declaring a larger payload are rejected before any allocation
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 64 * 1024 * 1024;

/**
 * Protocol message type codes
 */
enum class MessageType : uint32_t {
    FILE_LIST_REQUEST = 1,      // {}
    FILE_LIST_RESPONSE = 2,     // {files: [{name, size, size_formatted}]}
    FILE_REQUEST = 3,           // {filename}
    FILE_RESPONSE = 4,          // {filename, file_size, chunks}
    FILE_UPLOAD_REQUEST = 5,    // {filename, file_size, chunks} or {filename, file_data}
    FILE_UPLOAD_RESPONSE = 6,   // {success, message}
    ERROR_MESSAGE = 7,          // {error}
    FILE_CHUNK = 8,             // {chunk_id, total_chunks, data}
    CHUNK_ACK = 9,              // {chunk_id}
    TRANSFER_COMPLETE = 10      // {success, filename}
};

bool is_known_message_type(uint32_t type);
std::string message_type_to_string(uint32_t type);

/**
 * A decoded protocol message.
 * The raw type code is kept so that unknown codes can be reported.
 * When the payload bytes are not a JSON object, payload is an empty object
 * and malformed is set; readers use the get_*_field helpers with defaults.
 */
struct Message {
    uint32_t type;
    nlohmann::json payload;
    bool malformed;
    
    Message() : type(0), payload(nlohmann::json::object()), malformed(false) {}
    Message(MessageType t, const nlohmann::json& p)
        : type(static_cast<uint32_t>(t)), payload(p), malformed(false) {}
    
    bool is(MessageType t) const { return type == static_cast<uint32_t>(t); }
};

/**
 * Result of reading one frame from a stream
 */
enum class FrameStatus {
    OK,             // A complete frame was read
    END_OF_STREAM,  // Peer went away before a full header or payload (clean or abrupt)
    TIMEOUT,        // Receive timeout expired
    FRAME_ERROR     // Header declared a payload above the frame limit
};

struct FrameResult {
    FrameStatus status;
    Message message;
    
    FrameResult() : status(FrameStatus::END_OF_STREAM) {}
    bool ok() const { return status == FrameStatus::OK; }
};

std::string frame_status_to_string(FrameStatus status);

// Codec
/**
 * Serialize a payload and prefix it with the frame header
 * @param type Message type
 * @param payload JSON payload (serialized compactly)
 * @return Complete frame bytes
 */
std::vector<uint8_t> encode_message(MessageType type, const nlohmann::json& payload);

/**
 * Parse the 8-byte frame header
 * @param header Pointer to FRAME_HEADER_SIZE bytes
 * @param type Output message type code
 * @param length Output payload length
 */
void parse_frame_header(const uint8_t* header, uint32_t& type, uint32_t& length);

/**
 * Build a message from a type code and raw payload bytes (never throws)
 */
Message decode_payload(uint32_t type, const uint8_t* data, size_t size);

/**
 * Read exactly one frame from a socket (blocking)
 * @param socket Connected socket
 * @param max_frame_size Largest payload accepted
 * @return Frame status and decoded message
 */
FrameResult receive_message(socket_t socket, uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

/**
 * Encode and send one frame
 * @return true if the whole frame was written
 */
bool send_message(socket_t socket, MessageType type, const nlohmann::json& payload);

// Payload builders
nlohmann::json create_file_list_request_payload();
nlohmann::json create_file_request_payload(const std::string& filename);
nlohmann::json create_file_metadata_payload(const std::string& filename, uint64_t file_size, uint64_t chunks);
nlohmann::json create_upload_request_payload(const std::string& filename, uint64_t file_size, uint64_t chunks);
nlohmann::json create_single_frame_upload_payload(const std::string& filename, const std::string& file_data_base64);
nlohmann::json create_upload_response_payload(bool success, const std::string& message);
nlohmann::json create_error_payload(const std::string& error);
nlohmann::json create_chunk_payload(uint64_t chunk_id, uint64_t total_chunks, const uint8_t* data, size_t size);
nlohmann::json create_chunk_ack_payload(uint64_t chunk_id);
nlohmann::json create_transfer_complete_payload(bool success, const std::string& filename);

// Permissive field readers: a missing or wrongly typed field yields the default
std::string get_string_field(const nlohmann::json& payload, const char* key, const std::string& default_value = "");
uint64_t get_uint64_field(const nlohmann::json& payload, const char* key, uint64_t default_value = 0);
bool get_bool_field(const nlohmann::json& payload, const char* key, bool default_value = false);
bool has_field(const nlohmann::json& payload, const char* key);

/**
 * Number of chunks needed for a file: ceil(file_size / chunk_size)
 */
uint64_t calculate_chunk_count(uint64_t file_size, uint32_t chunk_size = MAX_CHUNK_SIZE);

} // namespace sharebox
