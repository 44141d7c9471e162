#pragma once

// ============================================================
// tcp_socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <string>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote
    void connect(const std::string& ip, u16 port);

    // Server: bind + listen (port 0 picks an ephemeral port)
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 16);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Send header + two payload segments in one gathered write
    void write_frame(u16 type, u16 flags,
                     const void* part1, size_t len1,
                     const void* part2, size_t len2);

    // Read next frame; returns false on clean close before a header
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    // Apply TCP performance tuning
    void tune();

    // shutdown(2) one or both directions; errors are ignored
    void shutdown_write();
    void shutdown_both();

    void close();

    std::string peer_addr() const;
    u16 local_port() const;

private:
    socket_t fd_{ARKDROP_INVALID_SOCKET};

    void apply_socket_opts();
};
