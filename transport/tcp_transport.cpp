// ============================================================
// tcp_transport.cpp -- Mux frames over a single TCP socket
// ============================================================

#include "tcp_transport.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include <cstring>

TcpConnection::TcpConnection(Side side, TcpSocket sock)
    : StreamMux(side, sock.peer_addr())
    , sock_(std::move(sock)) {}

TcpConnection::~TcpConnection() {
    sock_.shutdown_both();
    if (reader_.joinable()) reader_.join();
}

std::shared_ptr<TcpConnection> TcpConnection::connect(const std::string& ip, u16 port) {
    TcpSocket sock;
    sock.connect(ip, port);
    auto conn = std::make_shared<TcpConnection>(Side::DIALER, std::move(sock));
    conn->start();
    LOG_INFO("Connected to " + conn->peer_addr());
    return conn;
}

void TcpConnection::start() {
    if (reader_.joinable()) return;
    reader_ = std::thread([this] { reader_loop(); });
}

void TcpConnection::send_frame(MuxFrameType type, u32 sid, const u8* payload, size_t len) {
    u32 be = proto::hton32(sid);
    std::lock_guard<std::mutex> lock(write_mutex_);
    try {
        sock_.write_frame((u16)type, 0, &be, 4, payload, len);
    } catch (const ConnectionLost&) {
        // A write racing a close reports the close, not the broken pipe.
        check_open();
        throw;
    }
}

// After our CLOSE frame nothing else goes out; the peer reads EOF.
void TcpConnection::on_local_close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    sock_.shutdown_write();
}

void TcpConnection::reader_loop() {
    FrameHeader hdr{};
    std::vector<u8> payload;
    try {
        for (;;) {
            if (!sock_.read_frame(hdr, payload)) {
                on_link_lost("peer disconnected");
                return;
            }
            if (payload.size() < 4) {
                throw DecodeError("mux frame without stream id");
            }
            u32 be;
            std::memcpy(&be, payload.data(), 4);
            MuxFrameType type = (MuxFrameType)hdr.msg_type;
            on_frame(type, proto::ntoh32(be), payload.data() + 4, payload.size() - 4);

            if (type == MuxFrameType::MF_CLOSE) {
                std::lock_guard<std::mutex> lock(write_mutex_);
                sock_.shutdown_write();
            }
        }
    } catch (const std::exception& e) {
        on_link_lost(e.what());
    }
}

// ---- TcpListener ----

TcpListener::TcpListener(const std::string& ip, u16 port) {
    sock_.bind_and_listen(ip, port);
    port_ = sock_.local_port();
    LOG_DEBUG("Listening on " + ip + ":" + std::to_string(port_));
}

std::shared_ptr<TcpConnection> TcpListener::accept() {
    TcpSocket client = sock_.accept();
    auto conn = std::make_shared<TcpConnection>(StreamMux::Side::LISTENER, std::move(client));
    conn->start();
    LOG_INFO("Accepted connection from " + conn->peer_addr());
    return conn;
}
