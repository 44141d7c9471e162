// ============================================================
// tcp_socket.cpp -- TcpSocket implementation
// ============================================================

#include "tcp_socket.hpp"
#include "../common/errors.hpp"
#include "../common/protocol_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/uio.h>

// SO_SNDBUF / SO_RCVBUF = 1 MB
static constexpr int SOCKET_BUF_SIZE = 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == ARKDROP_INVALID_SOCKET) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != ARKDROP_INVALID_SOCKET) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = ARKDROP_INVALID_SOCKET;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = ARKDROP_INVALID_SOCKET;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
}

void TcpSocket::connect(const std::string& ip, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument("Invalid IP address: " + ip);
    }
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == ARKDROP_SOCKET_ERROR) {
        throw ConnectionLost("connect() to " + ip + ":" + std::to_string(port) +
                             " failed: " + socket_error_str(last_socket_error()));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == ARKDROP_SOCKET_ERROR) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == ARKDROP_SOCKET_ERROR) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == ARKDROP_INVALID_SOCKET) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    TcpSocket s(client);
    s.tune();
    return s;
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw ConnectionLost("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t received = ::recv(fd_, p, remaining, 0);
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw ConnectionLost("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

void TcpSocket::write_frame(u16 type, u16 flags,
                            const void* part1, size_t len1,
                            const void* part2, size_t len2) {
    if (len1 + len2 > MAX_MESSAGE_LEN) {
        throw std::length_error("frame payload too large: " + std::to_string(len1 + len2));
    }
    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = type;
    hdr.flags       = flags;
    hdr.payload_len = (u32)(len1 + len2);
    proto::encode_header(hdr, hdr_buf);

    // writev: merge header + payload into one syscall, handle partial sends
    const char* bases[3] = { reinterpret_cast<const char*>(hdr_buf),
                             static_cast<const char*>(part1),
                             static_cast<const char*>(part2) };
    size_t lens[3] = { 8, part1 ? len1 : 0, part2 ? len2 : 0 };
    size_t total = lens[0] + lens[1] + lens[2];
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[3];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 3; ++i) {
            if (skip >= lens[i]) { skip -= lens[i]; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(bases[i] + skip);
            cur[cur_cnt].iov_len  = lens[i] - skip;
            skip = 0;
            ++cur_cnt;
        }
        msghdr msg{};
        msg.msg_iov    = cur;
        msg.msg_iovlen = (size_t)cur_cnt;
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ConnectionLost("sendmsg failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
}

bool TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf) {
    u8 hdr_buf[8];
    if (!recv_all(hdr_buf, 8)) return false;
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_MESSAGE_LEN) {
        throw DecodeError("frame payload too large: " + std::to_string(hdr.payload_len));
    }
    payload_buf.resize(hdr.payload_len);
    if (hdr.payload_len > 0) {
        if (!recv_all(payload_buf.data(), hdr.payload_len)) {
            throw ConnectionLost("peer closed inside a frame");
        }
    }
    return true;
}

void TcpSocket::shutdown_write() {
    if (fd_ != ARKDROP_INVALID_SOCKET) ::shutdown(fd_, SHUT_WR);
}

void TcpSocket::shutdown_both() {
    if (fd_ != ARKDROP_INVALID_SOCKET) ::shutdown(fd_, SHUT_RDWR);
}

void TcpSocket::close() {
    if (fd_ != ARKDROP_INVALID_SOCKET) {
        ARKDROP_CLOSE_SOCKET(fd_);
        fd_ = ARKDROP_INVALID_SOCKET;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in self{};
    socklen_t len = sizeof(self);
    if (getsockname(fd_, (sockaddr*)&self, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(self.sin_port);
}
