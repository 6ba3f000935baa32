#include "socket.h"
#include "logger.h"
#include <cstring>
#ifndef _WIN32
    #include <netdb.h>
    #include <fcntl.h>    // for O_NONBLOCK
    #include <errno.h>    // for errno
    #include <sys/select.h>
    #include <sys/time.h>
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

#ifdef MSG_NOSIGNAL
    #define SHAREBOX_SEND_FLAGS MSG_NOSIGNAL
#else
    #define SHAREBOX_SEND_FLAGS 0
#endif

namespace sharebox {

namespace {

int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

bool is_timeout_error(int error) {
#ifdef _WIN32
    return error == WSAETIMEDOUT || error == WSAEWOULDBLOCK;
#else
    return error == EAGAIN || error == EWOULDBLOCK;
#endif
}

bool is_interrupted_error(int error) {
#ifdef _WIN32
    return error == WSAEINTR;
#else
    return error == EINTR;
#endif
}

std::string format_sockaddr(const sockaddr_storage& addr) {
    char ip_str[INET6_ADDRSTRLEN];
    if (addr.ss_family == AF_INET) {
        const sockaddr_in* addr_in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
        return std::string(ip_str) + ":" + std::to_string(ntohs(addr_in->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        const sockaddr_in6* addr_in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &addr_in6->sin6_addr, ip_str, INET6_ADDRSTRLEN);
        std::string ip(ip_str);
        // Show IPv4-mapped peers of a dual stack socket as plain IPv4
        if (ip.compare(0, 7, "::ffff:") == 0 && ip.find('.') != std::string::npos) {
            return ip.substr(7) + ":" + std::to_string(ntohs(addr_in6->sin6_port));
        }
        return "[" + ip + "]:" + std::to_string(ntohs(addr_in6->sin6_port));
    }
    return "";
}

bool set_blocking_mode(socket_t socket, bool blocking) {
#ifdef _WIN32
    unsigned long mode = blocking ? 0 : 1;
    return ioctlsocket(socket, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(socket, F_SETFL, flags) != -1;
#endif
}

bool connect_with_timeout(socket_t socket, const sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    if (timeout_ms <= 0) {
        return connect(socket, addr, addr_len) != SOCKET_ERROR_VALUE;
    }
    
    if (!set_blocking_mode(socket, false)) {
        LOG_SOCKET_ERROR("Failed to set socket to non-blocking mode for connect");
        return false;
    }
    
    if (connect(socket, addr, addr_len) == SOCKET_ERROR_VALUE) {
        int error = last_socket_error();
#ifdef _WIN32
        bool in_progress = error == WSAEWOULDBLOCK;
#else
        bool in_progress = error == EINPROGRESS;
#endif
        if (!in_progress) {
            return false;
        }
        
        fd_set write_set;
        FD_ZERO(&write_set);
        FD_SET(socket, &write_set);
        timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        
        int ready = select(static_cast<int>(socket) + 1, nullptr, &write_set, nullptr, &tv);
        if (ready <= 0) {
            LOG_SOCKET_DEBUG("Connect timed out after " << timeout_ms << "ms");
            return false;
        }
        
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(socket, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len) == SOCKET_ERROR_VALUE || so_error != 0) {
            return false;
        }
    }
    
    return set_blocking_mode(socket, true);
}

} // anonymous namespace

// Socket Library Initialization
bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
    LOG_SOCKET_DEBUG("Windows Socket API initialized");
#endif
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
    LOG_SOCKET_DEBUG("Windows Socket API cleaned up");
#endif
}

// TCP Socket Functions
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);
    
    // Validate port number
    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }
    
    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    
    addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int status = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (status != 0) {
#ifdef _WIN32
        LOG_SOCKET_ERROR("Failed to resolve hostname " << host << ": " << WSAGetLastError());
#else
        LOG_SOCKET_ERROR("Failed to resolve hostname " << host << ": " << gai_strerror(status));
#endif
        return INVALID_SOCKET_VALUE;
    }
    
    socket_t client_socket = INVALID_SOCKET_VALUE;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        client_socket = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (client_socket == INVALID_SOCKET_VALUE) {
            continue;
        }
        
        if (connect_with_timeout(client_socket, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen), timeout_ms)) {
            break;
        }
        
        LOG_SOCKET_DEBUG("Connection attempt to " << host << ":" << port
                         << (ai->ai_family == AF_INET6 ? " over IPv6" : " over IPv4") << " failed");
        closesocket(client_socket);
        client_socket = INVALID_SOCKET_VALUE;
    }
    freeaddrinfo(result);
    
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Connection to " << host << ":" << port << " failed");
        return INVALID_SOCKET_VALUE;
    }
    
    LOG_SOCKET_INFO("Successfully connected to " << host << ":" << port);
    return client_socket;
}

socket_t create_tcp_server(int port, int backlog) {
    LOG_SOCKET_DEBUG("Creating TCP server socket (dual stack) on port " << port);
    
    // Validate port number
    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }
    
    bool dual_stack = true;
    socket_t server_socket = socket(AF_INET6, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_WARN("IPv6 unavailable, falling back to IPv4 server socket");
        dual_stack = false;
        server_socket = socket(AF_INET, SOCK_STREAM, 0);
        if (server_socket == INVALID_SOCKET_VALUE) {
            LOG_SOCKET_ERROR("Failed to create server socket");
            return INVALID_SOCKET_VALUE;
        }
    }

    // Set socket option to reuse address
    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, 
                   (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set server socket options");
        closesocket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    int bind_result;
    if (dual_stack) {
        // Disable IPv6-only mode to allow IPv4 connections
        int ipv6_only = 0;
        if (setsockopt(server_socket, IPPROTO_IPV6, IPV6_V6ONLY,
                       (char*)&ipv6_only, sizeof(ipv6_only)) == SOCKET_ERROR_VALUE) {
            LOG_SOCKET_WARN("Failed to disable IPv6-only mode, will be IPv6 only");
        }
        
        sockaddr_in6 server_addr;
        memset(&server_addr, 0, sizeof(server_addr));
        server_addr.sin6_family = AF_INET6;
        server_addr.sin6_addr = in6addr_any;
        server_addr.sin6_port = htons(static_cast<uint16_t>(port));
        bind_result = bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr));
    } else {
        sockaddr_in server_addr;
        memset(&server_addr, 0, sizeof(server_addr));
        server_addr.sin_family = AF_INET;
        server_addr.sin_addr.s_addr = INADDR_ANY;
        server_addr.sin_port = htons(static_cast<uint16_t>(port));
        bind_result = bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr));
    }
    
    if (bind_result == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port);
        closesocket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    // Listen for connections
    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket");
        closesocket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Server listening on port " << get_ephemeral_port(server_socket) << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);
    
    socket_t client_socket;
    do {
        client_socket = accept(server_socket, (struct sockaddr*)&client_addr, &client_addr_len);
    } while (client_socket == INVALID_SOCKET_VALUE && is_interrupted_error(last_socket_error()));
    
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_DEBUG("accept() returned no connection");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Client connected from " << format_sockaddr(client_addr));
    return client_socket;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);
    
    if (getpeername(socket, (struct sockaddr*)&peer_addr, &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get peer address for socket " << socket);
        return "";
    }
    
    return format_sockaddr(peer_addr);
}

bool send_all(socket_t socket, const uint8_t* data, size_t size) {
    size_t total_sent = 0;
    while (total_sent < size) {
        int bytes_sent = send(socket, (const char*)data + total_sent,
                              static_cast<int>(size - total_sent), SHAREBOX_SEND_FLAGS);
        if (bytes_sent == SOCKET_ERROR_VALUE) {
            if (is_interrupted_error(last_socket_error())) {
                continue;
            }
            LOG_SOCKET_DEBUG("Failed to send TCP data to socket " << socket << " (error: " << last_socket_error() << ")");
            return false;
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }
    return true;
}

int send_tcp_data(socket_t socket, const std::vector<uint8_t>& data) {
    LOG_SOCKET_DEBUG("Sending " << data.size() << " bytes to TCP socket " << socket);
    
    if (!send_all(socket, data.data(), data.size())) {
        LOG_SOCKET_ERROR("Failed to send TCP data to socket " << socket);
        return -1;
    }
    
    return static_cast<int>(data.size());
}

ReceiveStatus receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes, size_t max_read_size) {
    size_t total_received = 0;
    
    while (total_received < num_bytes) {
        size_t to_read = num_bytes - total_received;
        if (max_read_size > 0 && to_read > max_read_size) {
            to_read = max_read_size;
        }
        
        int bytes_received = recv(socket, (char*)buffer + total_received, static_cast<int>(to_read), 0);
        if (bytes_received == 0) {
            LOG_SOCKET_DEBUG("Connection closed by peer on socket " << socket
                             << " (" << total_received << "/" << num_bytes << " bytes)");
            return ReceiveStatus::CLOSED;
        }
        
        if (bytes_received == SOCKET_ERROR_VALUE) {
            int error = last_socket_error();
            if (is_interrupted_error(error)) {
                continue;
            }
            if (is_timeout_error(error)) {
                LOG_SOCKET_DEBUG("Receive timed out on socket " << socket);
                return ReceiveStatus::TIMEOUT;
            }
            // Resets and shutdowns are reported the same way as an orderly close
            LOG_SOCKET_DEBUG("Receive failed on socket " << socket << " (error: " << error << ")");
            return ReceiveStatus::CLOSED;
        }
        
        total_received += static_cast<size_t>(bytes_received);
    }
    
    return ReceiveStatus::OK;
}

bool set_socket_receive_timeout(socket_t socket, int timeout_ms) {
#ifdef _WIN32
    DWORD timeout = static_cast<DWORD>(timeout_ms);
    int result = setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    int result = setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv));
#endif
    if (result == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set receive timeout on socket " << socket);
        return false;
    }
    
    LOG_SOCKET_DEBUG("Receive timeout on socket " << socket << " set to " << timeout_ms << "ms");
    return true;
}

// Common Socket Functions
void close_socket(socket_t socket, bool force) {
    if (!is_valid_socket(socket)) {
        return;
    }
    
    if (force) {
        shutdown_socket(socket);
    }
    LOG_SOCKET_DEBUG("Closing socket " << socket);
    closesocket(socket);
}

void shutdown_socket(socket_t socket) {
    if (!is_valid_socket(socket)) {
        return;
    }
#ifdef _WIN32
    shutdown(socket, SD_BOTH);
#else
    shutdown(socket, SHUT_RDWR);
#endif
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

int get_ephemeral_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket, (struct sockaddr*)&addr, &addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get bound address of socket " << socket);
        return 0;
    }
    
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

} // namespace sharebox
