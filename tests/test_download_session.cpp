#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "download_session.h"
#include "fs.h"
#include <memory>
#include <thread>
#include <string>
#include <vector>

using namespace sharebox;

class DownloadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
        
        root_ = "test_download_root";
        destination_ = "test_download_destination.bin";
        cleanup();
        ASSERT_TRUE(create_directories(root_));
        store_.reset(new FileStore(root_));
        
        socket_t listener = create_tcp_server(0);
        ASSERT_TRUE(is_valid_socket(listener));
        client_ = create_tcp_client("127.0.0.1", get_ephemeral_port(listener), 2000);
        server_ = accept_client(listener);
        close_socket(listener);
        ASSERT_TRUE(is_valid_socket(client_));
        ASSERT_TRUE(is_valid_socket(server_));
        set_socket_receive_timeout(client_, 5000);
        set_socket_receive_timeout(server_, 5000);
    }
    
    void TearDown() override {
        close_socket(client_);
        close_socket(server_);
        cleanup();
        cleanup_socket_library();
    }
    
    void cleanup() {
        std::vector<DirectoryEntry> entries;
        if (list_directory(root_.c_str(), entries)) {
            for (const auto& entry : entries) {
                delete_file(entry.path.c_str());
            }
        }
        delete_directory(root_.c_str());
        delete_file(destination_);
        delete_file(destination_ + ".part");
    }
    
    std::vector<uint8_t> store_file(const std::string& name, size_t size) {
        std::vector<uint8_t> content(size);
        for (size_t i = 0; i < size; ++i) {
            content[i] = static_cast<uint8_t>((i * 7 + 3) & 0xFF);
        }
        EXPECT_TRUE(create_file_binary(combine_paths(root_, name).c_str(), content.data(), content.size()));
        return content;
    }
    
    std::vector<uint8_t> read_destination() {
        int64_t size = get_file_size(destination_);
        std::vector<uint8_t> content(size > 0 ? static_cast<size_t>(size) : 0);
        if (!content.empty()) {
            EXPECT_TRUE(read_file_chunk(destination_, 0, content.data(), content.size()));
        }
        return content;
    }
    
    // Serve exactly one request with a DownloadSender
    TransferResult serve_one(uint32_t chunk_size = MAX_CHUNK_SIZE, const CancellationToken* cancel = nullptr) {
        FrameResult request = receive_message(server_);
        if (!request.ok() || !request.message.is(MessageType::FILE_REQUEST)) {
            return TransferResult(false, "no file request", false);
        }
        DownloadSender sender(server_, *store_, chunk_size, DEFAULT_MAX_FRAME_SIZE, cancel);
        return sender.run(get_string_field(request.message.payload, "filename"));
    }
    
    // Read the FILE_REQUEST a receiver sends before a scripted server replies
    void expect_file_request() {
        FrameResult request = receive_message(server_);
        ASSERT_TRUE(request.ok());
        ASSERT_TRUE(request.message.is(MessageType::FILE_REQUEST));
    }
    
    std::string root_;
    std::string destination_;
    std::unique_ptr<FileStore> store_;
    socket_t client_ = INVALID_SOCKET_VALUE;
    socket_t server_ = INVALID_SOCKET_VALUE;
};

TEST_F(DownloadSessionTest, DownloadsSmallFile) {
    std::vector<uint8_t> content = store_file("small.bin", 11);
    
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(); });
    
    std::vector<double> progress;
    DownloadReceiver receiver(client_, destination_, DEFAULT_MAX_FRAME_SIZE, nullptr,
                              [&](const Transfer& transfer) { progress.push_back(transfer.get_completion_percentage()); });
    TransferResult result = receiver.run("small.bin");
    server_thread.join();
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(server_result.success) << server_result.message;
    EXPECT_EQ(result.bytes_transferred, 11u);
    EXPECT_EQ(receiver.get_state(), TransferState::DONE);
    EXPECT_EQ(receiver.get_transfer().expected_chunks, 1u);
    EXPECT_THAT(progress, ::testing::ElementsAre(100.0));
    EXPECT_EQ(read_destination(), content);
}

TEST_F(DownloadSessionTest, DownloadsMultipleChunksInOrder) {
    std::vector<uint8_t> content = store_file("multi.bin", 4500);
    
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(1000); });
    
    std::vector<uint64_t> received;
    DownloadReceiver receiver(client_, destination_, DEFAULT_MAX_FRAME_SIZE, nullptr,
                              [&](const Transfer& transfer) { received.push_back(transfer.received_chunks); });
    TransferResult result = receiver.run("multi.bin");
    server_thread.join();
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(server_result.success);
    EXPECT_EQ(receiver.get_transfer().expected_chunks, 5u);
    EXPECT_THAT(received, ::testing::ElementsAre(1u, 2u, 3u, 4u, 5u));
    EXPECT_EQ(read_destination(), content);
}

TEST_F(DownloadSessionTest, DownloadsFileLargerThanOneChunk) {
    std::vector<uint8_t> content = store_file("large.bin", 2 * MAX_CHUNK_SIZE + 123);
    
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(); });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("large.bin");
    server_thread.join();
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(receiver.get_transfer().expected_chunks, 3u);
    EXPECT_EQ(read_destination(), content);
}

TEST_F(DownloadSessionTest, ZeroByteFileProducesEmptyFile) {
    store_file("empty.txt", 0);
    
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(); });
    
    std::vector<double> progress;
    DownloadReceiver receiver(client_, destination_, DEFAULT_MAX_FRAME_SIZE, nullptr,
                              [&](const Transfer& transfer) { progress.push_back(transfer.get_completion_percentage()); });
    TransferResult result = receiver.run("empty.txt");
    server_thread.join();
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(server_result.success);
    EXPECT_EQ(receiver.get_transfer().expected_chunks, 0u);
    EXPECT_THAT(progress, ::testing::ElementsAre(100.0));
    EXPECT_TRUE(file_exists(destination_));
    EXPECT_EQ(get_file_size(destination_), 0);
}

TEST_F(DownloadSessionTest, MissingFileIsReportedByName) {
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(); });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("nope.txt");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Server error: File not found: nope.txt");
    EXPECT_TRUE(result.connection_usable);
    EXPECT_FALSE(file_exists(destination_));
    
    EXPECT_FALSE(server_result.success);
    EXPECT_TRUE(server_result.connection_usable);
}

TEST_F(DownloadSessionTest, MissingFileKeepsExistingDestination) {
    ASSERT_TRUE(create_file(destination_, "precious local data"));
    
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(); });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("does_not_exist.txt");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.connection_usable);
    
    std::string content;
    ASSERT_TRUE(read_file_text(destination_, content));
    EXPECT_EQ(content, "precious local data");
    EXPECT_FALSE(file_exists(destination_ + ".part"));
}

TEST_F(DownloadSessionTest, AbortedTransferKeepsExistingDestination) {
    ASSERT_TRUE(create_file(destination_, "previous version"));
    
    std::thread server_thread([&]() {
        expect_file_request();
        const uint8_t data[] = {9, 9, 9, 9, 9};
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 10, 2));
        send_message(server_, MessageType::FILE_CHUNK, create_chunk_payload(0, 2, data, sizeof(data)));
        
        FrameResult ack = receive_message(server_);
        ASSERT_TRUE(ack.ok());
        EXPECT_TRUE(ack.message.is(MessageType::CHUNK_ACK));
        send_message(server_, MessageType::ERROR_MESSAGE, create_error_payload("disk failure"));
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Server error: disk failure");
    
    std::string content;
    ASSERT_TRUE(read_file_text(destination_, content));
    EXPECT_EQ(content, "previous version");
    EXPECT_FALSE(file_exists(destination_ + ".part"));
}

TEST_F(DownloadSessionTest, CompletedDownloadReplacesExistingDestination) {
    std::vector<uint8_t> content = store_file("fresh.bin", 300);
    ASSERT_TRUE(create_file(destination_, "stale content that is longer than nothing"));
    
    std::thread server_thread([&]() { serve_one(128); });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("fresh.bin");
    server_thread.join();
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(read_destination(), content);
    EXPECT_FALSE(file_exists(destination_ + ".part"));
}

TEST_F(DownloadSessionTest, TraversalNameIsConfinedToStore) {
    std::vector<uint8_t> content = store_file("secret.txt", 20);
    
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(); });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("../../secret.txt");
    server_thread.join();
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(read_destination(), content);
}

TEST_F(DownloadSessionTest, OutOfOrderChunkFailsReceiver) {
    std::string abort_reason;
    std::thread server_thread([&]() {
        expect_file_request();
        const uint8_t data[] = {1, 2, 3, 4, 5};
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 10, 2));
        send_message(server_, MessageType::FILE_CHUNK, create_chunk_payload(1, 2, data, sizeof(data)));
        
        FrameResult reply = receive_message(server_);
        ASSERT_TRUE(reply.ok());
        EXPECT_TRUE(reply.message.is(MessageType::ERROR_MESSAGE));
        abort_reason = get_string_field(reply.message.payload, "error");
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, ::testing::HasSubstr("expected chunk 0"));
    EXPECT_TRUE(result.connection_usable);
    EXPECT_EQ(abort_reason, result.message);
    EXPECT_EQ(receiver.get_state(), TransferState::FAILED);
    EXPECT_FALSE(file_exists(destination_));
}

TEST_F(DownloadSessionTest, UndecodableChunkFailsReceiver) {
    std::thread server_thread([&]() {
        expect_file_request();
        nlohmann::json chunk;
        chunk["chunk_id"] = 0;
        chunk["total_chunks"] = 1;
        chunk["data"] = "***not base64***";
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 4, 1));
        send_message(server_, MessageType::FILE_CHUNK, chunk);
        
        FrameResult reply = receive_message(server_);
        ASSERT_TRUE(reply.ok());
        EXPECT_TRUE(reply.message.is(MessageType::ERROR_MESSAGE));
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, ::testing::HasSubstr("Invalid data"));
}

TEST_F(DownloadSessionTest, ServerErrorMidTransferIsPropagated) {
    std::thread server_thread([&]() {
        expect_file_request();
        const uint8_t data[] = {9, 9, 9, 9, 9};
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 10, 2));
        send_message(server_, MessageType::FILE_CHUNK, create_chunk_payload(0, 2, data, sizeof(data)));
        
        FrameResult ack = receive_message(server_);
        ASSERT_TRUE(ack.ok());
        EXPECT_TRUE(ack.message.is(MessageType::CHUNK_ACK));
        EXPECT_EQ(get_uint64_field(ack.message.payload, "chunk_id", 99), 0u);
        
        send_message(server_, MessageType::ERROR_MESSAGE, create_error_payload("disk failure"));
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Server error: disk failure");
    EXPECT_TRUE(result.connection_usable);
    EXPECT_FALSE(file_exists(destination_));
}

TEST_F(DownloadSessionTest, LostConnectionMidTransfer) {
    std::thread server_thread([&]() {
        expect_file_request();
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 10, 2));
        close_socket(server_);
        server_ = INVALID_SOCKET_VALUE;
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Connection lost");
    EXPECT_FALSE(result.connection_usable);
}

TEST_F(DownloadSessionTest, StalledServerTimesOut) {
    ASSERT_TRUE(set_socket_receive_timeout(client_, 200));
    
    std::thread server_thread([&]() {
        expect_file_request();
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 10, 2));
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, ::testing::HasSubstr("Timed out"));
    EXPECT_FALSE(result.connection_usable);
}

TEST_F(DownloadSessionTest, InconsistentMetadataIsRejected) {
    std::thread server_thread([&]() {
        expect_file_request();
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 2, 5));
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.connection_usable);
}

TEST_F(DownloadSessionTest, EarlyCompletionIsIncomplete) {
    std::thread server_thread([&]() {
        expect_file_request();
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 10, 2));
        send_message(server_, MessageType::TRANSFER_COMPLETE, create_transfer_complete_payload(true, "x.bin"));
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, ::testing::HasSubstr("Incomplete transfer"));
}

TEST_F(DownloadSessionTest, MissingCompletionIsIncomplete) {
    std::thread server_thread([&]() {
        expect_file_request();
        const uint8_t data[] = {1, 2};
        send_message(server_, MessageType::FILE_RESPONSE, create_file_metadata_payload("x.bin", 2, 1));
        send_message(server_, MessageType::FILE_CHUNK, create_chunk_payload(0, 1, data, sizeof(data)));
        FrameResult ack = receive_message(server_);
        EXPECT_TRUE(ack.ok());
        send_message(server_, MessageType::FILE_LIST_RESPONSE, nlohmann::json::object());
    });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("x.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, ::testing::HasSubstr("Incomplete transfer"));
    EXPECT_FALSE(file_exists(destination_));
}

TEST_F(DownloadSessionTest, ClientCancellationLeavesConnectionUsable) {
    std::vector<uint8_t> content = store_file("cancel.bin", 1000);
    
    CancellationToken cancel;
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(100); });
    
    DownloadReceiver receiver(client_, destination_, DEFAULT_MAX_FRAME_SIZE, &cancel,
                              [&](const Transfer& transfer) {
                                  if (transfer.received_chunks == 3) {
                                      cancel.cancel();
                                  }
                              });
    TransferResult result = receiver.run("cancel.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Download cancelled");
    EXPECT_TRUE(result.connection_usable);
    EXPECT_TRUE(receiver.get_transfer().cancelled);
    EXPECT_EQ(receiver.get_transfer().received_chunks, 3u);
    EXPECT_FALSE(file_exists(destination_));
    
    EXPECT_FALSE(server_result.success);
    EXPECT_TRUE(server_result.connection_usable);
    EXPECT_THAT(server_result.message, ::testing::HasSubstr("Client aborted transfer"));
    
    // The stream is still aligned: a second download on it succeeds
    std::thread second_server([&]() { server_result = serve_one(100); });
    DownloadReceiver second(client_, destination_);
    TransferResult second_result = second.run("cancel.bin");
    second_server.join();
    
    ASSERT_TRUE(second_result.success) << second_result.message;
    EXPECT_EQ(read_destination(), content);
}

TEST_F(DownloadSessionTest, SenderCancellationAbortsWithError) {
    store_file("shutdown.bin", 500);
    
    CancellationToken cancel;
    cancel.cancel();
    TransferResult server_result;
    std::thread server_thread([&]() { server_result = serve_one(100, &cancel); });
    
    DownloadReceiver receiver(client_, destination_);
    TransferResult result = receiver.run("shutdown.bin");
    server_thread.join();
    
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.message, ::testing::HasSubstr("server shutting down"));
    EXPECT_FALSE(server_result.success);
    EXPECT_FALSE(server_result.connection_usable);
}

TEST_F(DownloadSessionTest, SenderRejectsWrongAcknowledgment) {
    store_file("ack.bin", 300);
    
    TransferResult server_result;
    std::thread server_thread([&]() {
        DownloadSender sender(server_, *store_, 100);
        server_result = sender.run("ack.bin");
    });
    
    FrameResult metadata = receive_message(client_);
    ASSERT_TRUE(metadata.ok());
    EXPECT_TRUE(metadata.message.is(MessageType::FILE_RESPONSE));
    EXPECT_EQ(get_uint64_field(metadata.message.payload, "chunks"), 3u);
    
    FrameResult chunk = receive_message(client_);
    ASSERT_TRUE(chunk.ok());
    EXPECT_TRUE(chunk.message.is(MessageType::FILE_CHUNK));
    ASSERT_TRUE(send_message(client_, MessageType::CHUNK_ACK, create_chunk_ack_payload(5)));
    
    FrameResult error = receive_message(client_);
    server_thread.join();
    
    ASSERT_TRUE(error.ok());
    EXPECT_TRUE(error.message.is(MessageType::ERROR_MESSAGE));
    EXPECT_FALSE(server_result.success);
    EXPECT_FALSE(server_result.connection_usable);
}

TEST_F(DownloadSessionTest, UnwritableDestinationFailsBeforeRequest) {
    DownloadReceiver receiver(client_, "test_download_missing_dir/sub/out.bin");
    TransferResult result = receiver.run("anything");
    
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.connection_usable);
    
    // Nothing was sent, so the server side has no pending frame
    ASSERT_TRUE(set_socket_receive_timeout(server_, 100));
    EXPECT_EQ(receive_message(server_).status, FrameStatus::TIMEOUT);
}
