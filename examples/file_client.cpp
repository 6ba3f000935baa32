/**
 * @file file_client.cpp
 * @brief Command line client for a sharebox server
 *
 * Demonstrates the FileClient API:
 *   - Connecting to a server
 *   - Listing the shared files
 *   - Downloading with a progress display
 *   - Uploading (chunked or single-frame)
 *
 * Usage:
 *   file_client <host> <port> list
 *   file_client <host> <port> get <filename> [destination]
 *   file_client <host> <port> put <local_path>
 *
 * Environment:
 *   SHAREBOX_CLIENT_CONFIG  Path to a client configuration file
 */

#include "client_session.h"
#include "config.h"
#include "logger.h"

#include <iostream>
#include <iomanip>
#include <string>
#include <cstdlib>

using namespace sharebox;

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <host> <port> <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  list                          List files on the server\n"
              << "  get <filename> [destination]  Download a file\n"
              << "  put <local_path>              Upload a file\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " 127.0.0.1 9000 list\n"
              << "  " << program << " 127.0.0.1 9000 get report.pdf\n"
              << "  " << program << " 127.0.0.1 9000 put ./notes.txt\n";
}

static void print_progress(const Transfer& transfer) {
    std::cout << "\r" << transfer.filename << ": " << std::fixed << std::setprecision(1)
              << transfer.get_completion_percentage() << "% (" << transfer.bytes_transferred
              << "/" << transfer.file_size << " bytes)" << std::flush;
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string host = argv[1];
    const int port = std::atoi(argv[2]);
    const std::string command = argv[3];
    if (port <= 0 || port > 65535) {
        std::cerr << "Error: invalid port\n";
        return 1;
    }

    Logger::getInstance().set_log_level(LogLevel::WARN);

    ClientConfig config;
    const char* config_path = std::getenv("SHAREBOX_CLIENT_CONFIG");
    if (config_path && !load_client_config(config_path, config)) {
        std::cerr << "Warning: could not load " << config_path << ", using defaults\n";
    }

    FileClient client(config);
    if (!client.connect(host, port)) {
        std::cerr << "Error: could not connect to " << host << ":" << port << "\n";
        return 1;
    }

    int exit_code = 0;

    if (command == "list" && argc == 4) {
        FileListResult result = client.list_files();
        if (!result.success) {
            std::cerr << "Error: " << result.message << "\n";
            exit_code = 1;
        } else if (result.files.empty()) {
            std::cout << "No files on server\n";
        } else {
            for (const auto& entry : result.files) {
                std::cout << std::left << std::setw(40) << entry.name << " " << entry.size_formatted << "\n";
            }
        }
    } else if (command == "get" && (argc == 5 || argc == 6)) {
        const std::string destination = argc == 6 ? argv[5] : "";
        TransferResult result = client.download_file(argv[4], destination, print_progress);
        std::cout << "\n" << result.message << "\n";
        exit_code = result.success ? 0 : 1;
    } else if (command == "put" && argc == 5) {
        TransferResult result = client.upload_file(argv[4], print_progress);
        std::cout << "\n" << result.message << "\n";
        exit_code = result.success ? 0 : 1;
    } else {
        print_usage(argv[0]);
        exit_code = 1;
    }

    client.disconnect();
    return exit_code;
}
