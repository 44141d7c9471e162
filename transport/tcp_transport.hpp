#pragma once

// ============================================================
// tcp_transport.hpp -- Mux frames over a single TCP socket
// ============================================================

#include "stream_mux.hpp"
#include "tcp_socket.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Wire format per mux frame: FrameHeader{type, flags=0, payload_len}
// followed by the stream id (u32, big-endian) and the frame body.
// A reader thread demultiplexes incoming frames into the mux.
class TcpConnection : public StreamMux {
public:
    TcpConnection(Side side, TcpSocket sock);
    ~TcpConnection() override;

    // Dial a listening peer.
    static std::shared_ptr<TcpConnection> connect(const std::string& ip, u16 port);

    // Start the reader thread; called once by the factories.
    void start();

protected:
    void send_frame(MuxFrameType type, u32 sid, const u8* payload, size_t len) override;
    void on_local_close() override;

private:
    void reader_loop();

    TcpSocket   sock_;
    std::mutex  write_mutex_;
    std::thread reader_;
};

class TcpListener {
public:
    // Port 0 binds an ephemeral port; see port().
    explicit TcpListener(const std::string& ip = "127.0.0.1", u16 port = 0);

    u16 port() const { return port_; }

    // Block until one peer connects.
    std::shared_ptr<TcpConnection> accept();

    void close() { sock_.close(); }

private:
    TcpSocket sock_;
    u16       port_{0};
};
