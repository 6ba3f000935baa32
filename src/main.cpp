#include "connection_handler.h"
#include "config.h"
#include "logger.h"
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <cstdlib>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [port] [storage_dir] [config.json]\n";
    std::cout << "  port:        Port to listen on (default: 9000)\n";
    std::cout << "  storage_dir: Directory holding the shared files (default: storage)\n";
    std::cout << "  config.json: Optional server configuration; port and storage_dir override it\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  SHAREBOX_LOG_LEVEL  DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << "                     # Serve ./storage on port 9000\n";
    std::cout << "  " << program_name << " 9100 /srv/shared     # Serve /srv/shared on port 9100\n";
}

int main(int argc, char* argv[]) {
    if (argc > 4 || (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
        print_usage(argv[0]);
        return argc > 4 ? 1 : 0;
    }
    
    sharebox::Logger::getInstance().set_log_level(sharebox::LogLevel::INFO);
    const char* level_name = std::getenv("SHAREBOX_LOG_LEVEL");
    if (level_name) {
        sharebox::LogLevel level = sharebox::LogLevel::INFO;
        if (sharebox::parse_log_level(level_name, level)) {
            sharebox::Logger::getInstance().set_log_level(level);
        } else {
            LOG_MAIN_WARN("Unknown log level '" << level_name << "', using INFO");
        }
    }
    
    sharebox::ServerConfig config;
    if (argc >= 4 && !sharebox::load_server_config(argv[3], config)) {
        LOG_MAIN_ERROR("Failed to load configuration from " << argv[3]);
        return 1;
    }
    
    if (argc >= 2) {
        int port = std::atoi(argv[1]);
        if (port < 0 || port > 65535 || (port == 0 && std::string(argv[1]) != "0")) {
            std::cerr << "Error: invalid port '" << argv[1] << "'\n";
            return 1;
        }
        config.listen_port = static_cast<uint16_t>(port);
    }
    if (argc >= 3) {
        config.storage_directory = argv[2];
    }
    
    // Register signal handler for Ctrl-C
    std::signal(SIGINT, signal_handler);
#ifndef _WIN32
    std::signal(SIGTERM, signal_handler);
#endif
    
    LOG_MAIN_INFO("=== sharebox server ===");
    
    sharebox::FileServer server(config);
    if (!server.start()) {
        LOG_MAIN_ERROR("Failed to start server on port " << config.listen_port);
        return 1;
    }
    
    std::cout << "Serving " << config.storage_directory << " on port " << server.get_port() << "\n";
    std::cout << "Press Ctrl+C to quit.\n";
    
    while (g_running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    
    LOG_MAIN_INFO("Shutting down...");
    server.stop();
    
    return 0;
}
