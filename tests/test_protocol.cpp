#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "protocol.h"
#include "file_list_exchange.h"
#include "socket.h"
#include <thread>
#include <string>
#include <vector>

using namespace sharebox;

class ProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
        
        socket_t listener = create_tcp_server(0);
        ASSERT_TRUE(is_valid_socket(listener));
        int port = get_ephemeral_port(listener);
        ASSERT_GT(port, 0);
        
        client_ = create_tcp_client("127.0.0.1", port, 2000);
        server_ = accept_client(listener);
        close_socket(listener);
        
        ASSERT_TRUE(is_valid_socket(client_));
        ASSERT_TRUE(is_valid_socket(server_));
        ASSERT_TRUE(set_socket_receive_timeout(server_, 5000));
        ASSERT_TRUE(set_socket_receive_timeout(client_, 5000));
    }
    
    void TearDown() override {
        close_socket(client_);
        close_socket(server_);
        cleanup_socket_library();
    }
    
    socket_t client_ = INVALID_SOCKET_VALUE;
    socket_t server_ = INVALID_SOCKET_VALUE;
};

TEST(ProtocolCodecTest, EncodeWritesBigEndianHeader) {
    nlohmann::json payload = create_file_request_payload("a.txt");
    std::vector<uint8_t> frame = encode_message(MessageType::FILE_REQUEST, payload);
    
    std::string body = payload.dump();
    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + body.size());
    
    EXPECT_EQ(frame[0], 0);
    EXPECT_EQ(frame[1], 0);
    EXPECT_EQ(frame[2], 0);
    EXPECT_EQ(frame[3], 3);
    
    uint32_t type = 0;
    uint32_t length = 0;
    parse_frame_header(frame.data(), type, length);
    EXPECT_EQ(type, 3u);
    EXPECT_EQ(length, body.size());
    EXPECT_EQ(std::string(frame.begin() + FRAME_HEADER_SIZE, frame.end()), body);
}

TEST(ProtocolCodecTest, ParseHeaderReadsLargeValues) {
    const uint8_t header[FRAME_HEADER_SIZE] = {0x00, 0x00, 0x00, 0x0A, 0x01, 0x02, 0x03, 0x04};
    uint32_t type = 0;
    uint32_t length = 0;
    parse_frame_header(header, type, length);
    EXPECT_EQ(type, 10u);
    EXPECT_EQ(length, 0x01020304u);
}

TEST(ProtocolCodecTest, DecodeValidPayload) {
    std::string body = "{\"filename\":\"report.pdf\"}";
    Message message = decode_payload(3, reinterpret_cast<const uint8_t*>(body.data()), body.size());
    
    EXPECT_TRUE(message.is(MessageType::FILE_REQUEST));
    EXPECT_FALSE(message.malformed);
    EXPECT_EQ(get_string_field(message.payload, "filename"), "report.pdf");
}

TEST(ProtocolCodecTest, DecodeMalformedPayloadYieldsEmptyObject) {
    std::string body = "{not json";
    Message message = decode_payload(3, reinterpret_cast<const uint8_t*>(body.data()), body.size());
    
    EXPECT_EQ(message.type, 3u);
    EXPECT_TRUE(message.malformed);
    EXPECT_TRUE(message.payload.is_object());
    EXPECT_TRUE(message.payload.empty());
}

TEST(ProtocolCodecTest, DecodeNonObjectPayloadIsMalformed) {
    std::string body = "[1,2,3]";
    Message message = decode_payload(1, reinterpret_cast<const uint8_t*>(body.data()), body.size());
    
    EXPECT_TRUE(message.malformed);
    EXPECT_TRUE(message.payload.is_object());
}

TEST(ProtocolCodecTest, DecodeEmptyPayloadIsEmptyObject) {
    Message message = decode_payload(1, nullptr, 0);
    
    EXPECT_FALSE(message.malformed);
    EXPECT_TRUE(message.payload.is_object());
    EXPECT_TRUE(message.payload.empty());
}

TEST(ProtocolCodecTest, MessageTypeNames) {
    EXPECT_TRUE(is_known_message_type(1));
    EXPECT_TRUE(is_known_message_type(10));
    EXPECT_FALSE(is_known_message_type(0));
    EXPECT_FALSE(is_known_message_type(11));
    
    EXPECT_EQ(message_type_to_string(8), "FILE_CHUNK");
    EXPECT_EQ(message_type_to_string(99), "UNKNOWN(99)");
}

TEST(ProtocolCodecTest, FieldReadersFallBackToDefaults) {
    nlohmann::json payload;
    payload["name"] = 42;
    payload["size"] = "big";
    payload["negative"] = -5;
    payload["flag"] = "yes";
    payload["count"] = 7;
    
    EXPECT_EQ(get_string_field(payload, "name", "fallback"), "fallback");
    EXPECT_EQ(get_string_field(payload, "missing"), "");
    EXPECT_EQ(get_uint64_field(payload, "size", 3), 3u);
    EXPECT_EQ(get_uint64_field(payload, "negative", 9), 9u);
    EXPECT_EQ(get_uint64_field(payload, "count"), 7u);
    EXPECT_FALSE(get_bool_field(payload, "flag"));
    EXPECT_TRUE(get_bool_field(payload, "flag", true));
    EXPECT_TRUE(has_field(payload, "count"));
    EXPECT_FALSE(has_field(payload, "missing"));
    
    nlohmann::json not_an_object = nlohmann::json::array();
    EXPECT_EQ(get_string_field(not_an_object, "name", "x"), "x");
    EXPECT_FALSE(has_field(not_an_object, "name"));
}

TEST(ProtocolCodecTest, ChunkCount) {
    EXPECT_EQ(calculate_chunk_count(0), 0u);
    EXPECT_EQ(calculate_chunk_count(1), 1u);
    EXPECT_EQ(calculate_chunk_count(MAX_CHUNK_SIZE), 1u);
    EXPECT_EQ(calculate_chunk_count(MAX_CHUNK_SIZE + 1), 2u);
    EXPECT_EQ(calculate_chunk_count(200000), 4u);
    EXPECT_EQ(calculate_chunk_count(10, 4), 3u);
}

TEST(ProtocolCodecTest, ChunkPayloadCarriesBase64) {
    const uint8_t data[] = {'h', 'i', '!'};
    nlohmann::json payload = create_chunk_payload(2, 5, data, sizeof(data));
    
    EXPECT_EQ(get_uint64_field(payload, "chunk_id"), 2u);
    EXPECT_EQ(get_uint64_field(payload, "total_chunks"), 5u);
    EXPECT_EQ(get_string_field(payload, "data"), "aGkh");
}

TEST_F(ProtocolTest, SendAndReceiveMessage) {
    ASSERT_TRUE(send_message(client_, MessageType::FILE_REQUEST, create_file_request_payload("notes.txt")));
    
    FrameResult frame = receive_message(server_);
    ASSERT_TRUE(frame.ok());
    EXPECT_TRUE(frame.message.is(MessageType::FILE_REQUEST));
    EXPECT_EQ(get_string_field(frame.message.payload, "filename"), "notes.txt");
}

TEST_F(ProtocolTest, EveryMessageTypeSurvivesEncodeAndDecode) {
    const uint8_t data[] = {0x00, 0xFF, 0x10, 0x80};
    std::vector<FileEntry> files;
    files.emplace_back("a.txt", 1536, "1.50 KB");
    files.emplace_back("empty.bin", 0, "0.00 B");
    
    struct Case {
        MessageType type;
        nlohmann::json payload;
    };
    const std::vector<Case> cases = {
        {MessageType::FILE_LIST_REQUEST, create_file_list_request_payload()},
        {MessageType::FILE_LIST_RESPONSE, create_file_list_response_payload(files)},
        {MessageType::FILE_REQUEST, create_file_request_payload("notes.txt")},
        {MessageType::FILE_RESPONSE, create_file_metadata_payload("notes.txt", 200000, 4)},
        {MessageType::FILE_UPLOAD_REQUEST, create_upload_request_payload("up.bin", 10, 1)},
        {MessageType::FILE_UPLOAD_REQUEST, create_single_frame_upload_payload("up.bin", "AAEC")},
        {MessageType::FILE_UPLOAD_RESPONSE, create_upload_response_payload(false, "Invalid filename: ..")},
        {MessageType::ERROR_MESSAGE, create_error_payload("File not found: x")},
        {MessageType::FILE_CHUNK, create_chunk_payload(3, 7, data, sizeof(data))},
        {MessageType::CHUNK_ACK, create_chunk_ack_payload(3)},
        {MessageType::TRANSFER_COMPLETE, create_transfer_complete_payload(true, "notes.txt")},
    };
    
    for (const auto& c : cases) {
        SCOPED_TRACE(message_type_to_string(static_cast<uint32_t>(c.type)));
        
        std::vector<uint8_t> frame = encode_message(c.type, c.payload);
        ASSERT_GE(frame.size(), FRAME_HEADER_SIZE);
        uint32_t type = 0;
        uint32_t length = 0;
        parse_frame_header(frame.data(), type, length);
        EXPECT_EQ(type, static_cast<uint32_t>(c.type));
        EXPECT_EQ(length, frame.size() - FRAME_HEADER_SIZE);
        
        Message decoded = decode_payload(type, frame.data() + FRAME_HEADER_SIZE, length);
        EXPECT_FALSE(decoded.malformed);
        EXPECT_EQ(decoded.payload, c.payload);
        
        ASSERT_TRUE(send_message(client_, c.type, c.payload));
        FrameResult received = receive_message(server_);
        ASSERT_TRUE(received.ok());
        EXPECT_TRUE(received.message.is(c.type));
        EXPECT_EQ(received.message.payload, c.payload);
    }
    
    std::vector<FileEntry> parsed = parse_file_list_payload(cases[1].payload);
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].name, "a.txt");
    EXPECT_EQ(parsed[0].size, 1536u);
    EXPECT_EQ(parsed[1].size_formatted, "0.00 B");
}

TEST_F(ProtocolTest, NonAsciiFilenameSurvives) {
    const std::string name = "r\xC3\xA9sum\xC3\xA9 \xE6\x96\x87\xE4\xBB\xB6.txt";
    ASSERT_TRUE(send_message(client_, MessageType::FILE_REQUEST, create_file_request_payload(name)));
    
    FrameResult frame = receive_message(server_);
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(get_string_field(frame.message.payload, "filename"), name);
}

TEST_F(ProtocolTest, BackToBackFramesStayAligned) {
    ASSERT_TRUE(send_message(client_, MessageType::FILE_LIST_REQUEST, create_file_list_request_payload()));
    ASSERT_TRUE(send_message(client_, MessageType::CHUNK_ACK, create_chunk_ack_payload(7)));
    ASSERT_TRUE(send_message(client_, MessageType::ERROR_MESSAGE, create_error_payload("boom")));
    
    FrameResult first = receive_message(server_);
    FrameResult second = receive_message(server_);
    FrameResult third = receive_message(server_);
    
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(third.ok());
    EXPECT_TRUE(first.message.is(MessageType::FILE_LIST_REQUEST));
    EXPECT_EQ(get_uint64_field(second.message.payload, "chunk_id"), 7u);
    EXPECT_EQ(get_string_field(third.message.payload, "error"), "boom");
}

TEST_F(ProtocolTest, LargeFrameIsReassembled) {
    std::vector<uint8_t> data(3 * MAX_CHUNK_SIZE);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 31);
    }
    
    std::thread sender([&]() {
        EXPECT_TRUE(send_message(client_, MessageType::FILE_CHUNK,
                                 create_chunk_payload(0, 1, data.data(), data.size())));
    });
    
    FrameResult frame = receive_message(server_);
    sender.join();
    
    ASSERT_TRUE(frame.ok());
    EXPECT_TRUE(frame.message.is(MessageType::FILE_CHUNK));
    EXPECT_EQ(get_string_field(frame.message.payload, "data").size(), ((data.size() + 2) / 3) * 4);
}

TEST_F(ProtocolTest, UnknownTypeIsDelivered) {
    std::string body = "{\"x\":1}";
    std::vector<uint8_t> frame = {0, 0, 0, 99, 0, 0, 0, static_cast<uint8_t>(body.size())};
    frame.insert(frame.end(), body.begin(), body.end());
    ASSERT_TRUE(send_all(client_, frame.data(), frame.size()));
    
    FrameResult result = receive_message(server_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message.type, 99u);
    EXPECT_FALSE(is_known_message_type(result.message.type));
}

TEST_F(ProtocolTest, MalformedFrameDoesNotBreakStream) {
    std::string garbage = "%%%";
    std::vector<uint8_t> frame = {0, 0, 0, 1, 0, 0, 0, static_cast<uint8_t>(garbage.size())};
    frame.insert(frame.end(), garbage.begin(), garbage.end());
    ASSERT_TRUE(send_all(client_, frame.data(), frame.size()));
    ASSERT_TRUE(send_message(client_, MessageType::FILE_REQUEST, create_file_request_payload("next")));
    
    FrameResult bad = receive_message(server_);
    ASSERT_TRUE(bad.ok());
    EXPECT_TRUE(bad.message.malformed);
    
    FrameResult good = receive_message(server_);
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(get_string_field(good.message.payload, "filename"), "next");
}

TEST_F(ProtocolTest, ClosedStreamReportsEndOfStream) {
    close_socket(client_);
    client_ = INVALID_SOCKET_VALUE;
    
    FrameResult frame = receive_message(server_);
    EXPECT_EQ(frame.status, FrameStatus::END_OF_STREAM);
}

TEST_F(ProtocolTest, PartialHeaderReportsEndOfStream) {
    const uint8_t partial[] = {0, 0, 0};
    ASSERT_TRUE(send_all(client_, partial, sizeof(partial)));
    close_socket(client_);
    client_ = INVALID_SOCKET_VALUE;
    
    FrameResult frame = receive_message(server_);
    EXPECT_EQ(frame.status, FrameStatus::END_OF_STREAM);
}

TEST_F(ProtocolTest, TruncatedPayloadReportsEndOfStream) {
    const uint8_t truncated[] = {0, 0, 0, 1, 0, 0, 0, 50, '{', '}'};
    ASSERT_TRUE(send_all(client_, truncated, sizeof(truncated)));
    close_socket(client_);
    client_ = INVALID_SOCKET_VALUE;
    
    FrameResult frame = receive_message(server_);
    EXPECT_EQ(frame.status, FrameStatus::END_OF_STREAM);
}

TEST_F(ProtocolTest, OversizedFrameIsRejected) {
    const uint8_t header[] = {0, 0, 0, 8, 0x00, 0x10, 0x00, 0x00};
    ASSERT_TRUE(send_all(client_, header, sizeof(header)));
    
    FrameResult frame = receive_message(server_, 1024);
    EXPECT_EQ(frame.status, FrameStatus::FRAME_ERROR);
}

TEST_F(ProtocolTest, SilentPeerTimesOut) {
    ASSERT_TRUE(set_socket_receive_timeout(server_, 200));
    
    FrameResult frame = receive_message(server_);
    EXPECT_EQ(frame.status, FrameStatus::TIMEOUT);
}
