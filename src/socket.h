#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace sharebox {

/**
 * Outcome of a blocking receive
 */
enum class ReceiveStatus {
    OK,             // All requested bytes were received
    CLOSED,         // Peer closed or reset the connection before all bytes arrived
    TIMEOUT         // The socket receive timeout expired
};

// Socket Library Initialization
/**
 * Initialize the socket library
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// TCP Socket Functions
/**
 * Create a TCP client socket and connect to a server.
 * Every address the host resolves to (IPv6 and IPv4) is tried in order.
 * @param host The hostname or IP address to connect to
 * @param port The port number to connect to
 * @param timeout_ms Connection timeout in milliseconds (0 for blocking)
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms = 0);

/**
 * Create a TCP server socket and bind to a port using dual stack (IPv6 with IPv4 support).
 * Falls back to an IPv4-only socket when IPv6 is unavailable.
 * @param port The port number to bind to (0 for an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server(int port, int backlog = 5);

/**
 * Accept a client connection on a server socket
 * @param server_socket The server socket handle
 * @return Client socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Get the peer address (IP:port) from a connected socket
 * @param socket The connected socket handle
 * @return Peer address string in format "IP:port", or empty string on error
 */
std::string get_peer_address(socket_t socket);

/**
 * Send all bytes through a TCP socket, looping over partial sends
 * @param socket The socket handle
 * @param data Pointer to the data
 * @param size Number of bytes to send
 * @return true if every byte was sent
 */
bool send_all(socket_t socket, const uint8_t* data, size_t size);

/**
 * Send data through a TCP socket
 * @param socket The socket handle
 * @param data The binary data to send
 * @return Number of bytes sent, or -1 on error
 */
int send_tcp_data(socket_t socket, const std::vector<uint8_t>& data);

/**
 * Receive exact number of bytes from a TCP socket (blocking until complete).
 * Reads are issued in pieces of at most max_read_size bytes.
 * @param socket The socket handle
 * @param buffer Destination, must hold num_bytes
 * @param num_bytes Number of bytes to receive
 * @param max_read_size Upper bound for a single recv call
 * @return OK, CLOSED when the stream ended early, TIMEOUT when the receive timeout expired
 */
ReceiveStatus receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes,
                                  size_t max_read_size = 8192);

/**
 * Set the receive timeout of a socket
 * @param socket The socket handle
 * @param timeout_ms Timeout in milliseconds (0 disables the timeout)
 * @return true if successful, false otherwise
 */
bool set_socket_receive_timeout(socket_t socket, int timeout_ms);

// Common Socket Functions
/**
 * Close a socket
 * @param socket The socket handle to close
 * @param force Shut down both directions first so that threads blocked on it wake up
 */
void close_socket(socket_t socket, bool force = false);

/**
 * Shut down both directions of a socket without releasing the handle.
 * Blocked accept/recv calls on the socket return immediately.
 * @param socket The socket handle
 */
void shutdown_socket(socket_t socket);

/**
 * Check if a socket is valid
 * @param socket The socket handle to check
 * @return true if valid, false otherwise
 */
bool is_valid_socket(socket_t socket);

/**
 * Get the port that a socket is bound to
 * @param socket The socket handle
 * @return The bound port, or 0 on error
 */
int get_ephemeral_port(socket_t socket);

} // namespace sharebox
