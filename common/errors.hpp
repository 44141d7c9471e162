#pragma once

// ============================================================
// errors.hpp -- Exception taxonomy for arkdrop sessions
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <stdexcept>
#include <string>
#include <exception>

// Root of every error raised by the transfer core.
class DropError : public std::runtime_error {
public:
    explicit DropError(const std::string& msg) : std::runtime_error(msg) {}
};

// Payload bytes do not decode into the expected message.
class DecodeError : public DropError {
public:
    explicit DecodeError(const std::string& msg)
        : DropError("decode error: " + msg) {}
};

// The peer finished its send side before a declared length arrived.
class TruncatedStream : public DropError {
public:
    TruncatedStream(size_t expected, size_t got)
        : DropError("truncated stream: expected " + std::to_string(expected) +
                    " bytes, got " + std::to_string(got))
        , expected_(expected), got_(got) {}

    size_t expected() const { return expected_; }
    size_t got() const { return got_; }

private:
    size_t expected_;
    size_t got_;
};

// Well-formed messages that break the session's rules
// (unknown file id, checksum mismatch, overrun, incomplete transfer).
class ProtocolError : public DropError {
public:
    explicit ProtocolError(const std::string& msg)
        : DropError("protocol error: " + msg) {}
};

// The connection was closed with an application close frame.
// Code 200 with reason "finished" is the graceful termination signal.
class ConnectionClosed : public DropError {
public:
    ConnectionClosed(u32 code, const std::string& reason, bool by_peer)
        : DropError(std::string(by_peer ? "connection closed by peer" : "connection closed") +
                    " (code=" + std::to_string(code) + ", reason=\"" + reason + "\")")
        , code_(code), reason_(reason), by_peer_(by_peer) {}

    u32 code() const { return code_; }
    const std::string& reason() const { return reason_; }
    bool by_peer() const { return by_peer_; }

    bool is_graceful() const {
        return code_ == ARKDROP_CLOSE_FINISHED && reason_ == ARKDROP_FINISHED_REASON;
    }

private:
    u32 code_;
    std::string reason_;
    bool by_peer_;
};

// The connection went away without a close frame (I/O failure, reset).
class ConnectionLost : public DropError {
public:
    explicit ConnectionLost(const std::string& msg)
        : DropError("connection lost: " + msg) {}
};

// The peer stopped reading a stream we are still writing.
class StreamStopped : public DropError {
public:
    StreamStopped(u32 stream_id, u32 code)
        : DropError("stream " + std::to_string(stream_id) +
                    " stopped by peer (code=" + std::to_string(code) + ")")
        , code_(code) {}

    u32 code() const { return code_; }

private:
    u32 code_;
};

// The peer abandoned a stream before finishing it.
class StreamReset : public DropError {
public:
    explicit StreamReset(u32 stream_id)
        : DropError("stream " + std::to_string(stream_id) + " reset by peer") {}
};

// A receiver handler has already consumed its single connection.
class NotAllowed : public DropError {
public:
    explicit NotAllowed(const std::string& msg) : DropError("not allowed: " + msg) {}
};

// A send bubble was started twice.
class AlreadyRunning : public DropError {
public:
    AlreadyRunning() : DropError("already running") {}
};

namespace errors {

// Human-readable text of a captured exception.
inline std::string describe(const std::exception_ptr& ep) {
    if (!ep) return "ok";
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    }
}

} // namespace errors
