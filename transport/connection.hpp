#pragma once

// ============================================================
// connection.hpp -- Stream-oriented connection interface
// ============================================================

#include "../common/platform.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Writing half of a stream. Not thread-safe: one writer per stream.
class SendStream {
public:
    virtual ~SendStream() = default;

    virtual u32 id() const = 0;

    // Blocks while the peer's flow control window is full. Throws
    // StreamStopped if the peer stopped reading, or the connection's close
    // error once it is closed.
    virtual void write_all(const u8* data, size_t len) = 0;

    // Mark the end of the stream. No-op if the peer already stopped it.
    virtual void finish() = 0;

    // Block until the peer has read through the end of the stream
    // (returns nullopt) or stopped it (returns the stop code).
    virtual std::optional<u32> stopped() = 0;

    void write_all(const std::vector<u8>& data) { write_all(data.data(), data.size()); }
};

// Reading half of a stream. Not thread-safe: one reader per stream.
class RecvStream {
public:
    virtual ~RecvStream() = default;

    virtual u32 id() const = 0;

    // Read up to len bytes; blocks until at least one byte is available.
    // Returns 0 once the peer finished the stream and all data was read.
    virtual size_t read(u8* buf, size_t len) = 0;

    // Tell the peer we no longer read this stream.
    virtual void stop(u32 code) = 0;

    // Fill buf completely. Returns the bytes read before a clean end
    // (less than len only when the stream finished early).
    size_t read_full(u8* buf, size_t len) {
        size_t got = 0;
        while (got < len) {
            size_t n = read(buf + got, len - got);
            if (n == 0) break;
            got += n;
        }
        return got;
    }
};

struct BiStream {
    std::unique_ptr<SendStream> send;
    std::unique_ptr<RecvStream> recv;
};

// An established connection between two peers, shared by every task of a
// session. All methods are thread-safe. Once closed (locally, by the peer
// or by losing the link) every blocking call fails with ConnectionClosed
// or ConnectionLost.
class Connection {
public:
    virtual ~Connection() = default;

    virtual BiStream open_bi() = 0;
    virtual BiStream accept_bi() = 0;
    virtual std::unique_ptr<SendStream> open_uni() = 0;
    virtual std::unique_ptr<RecvStream> accept_uni() = 0;

    // Application close. The first close wins; later calls are no-ops.
    virtual void close(u32 code, const std::string& reason) = 0;

    virtual bool is_closed() const = 0;
    virtual std::string peer_addr() const = 0;
};
