#pragma once

// ============================================================
// protocol_io.hpp -- Byte-order handling and field codecs
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <vector>
#include <string>
#include <stdexcept>
#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u32 hton32(u32 v) { return htobe32(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

// ---- 4-byte length prefix ----

inline void encode_len(u32 len, u8 buf[4]) {
    u32 be = hton32(len);
    std::memcpy(buf, &be, 4);
}

inline u32 decode_len(const u8 buf[4]) {
    u32 be;
    std::memcpy(&be, buf, 4);
    return ntoh32(be);
}

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Structured payload writer (big-endian, length-prefixed strings) ----

class WireWriter {
public:
    WireWriter() { buf_.reserve(256); }

    void put_u8(u8 v) { buf_.push_back(v); }

    void put_u32(u32 v) {
        u32 be = hton32(v);
        append(&be, 4);
    }

    void put_u64(u64 v) {
        u64 be = hton64(v);
        append(&be, 8);
    }

    void put_bool(bool v) { put_u8(v ? 1 : 0); }

    void put_bytes(const u8* data, size_t len) {
        if (len > MAX_MESSAGE_LEN) {
            throw std::length_error("field too large: " + std::to_string(len));
        }
        put_u32((u32)len);
        append(data, len);
    }

    void put_bytes(const std::vector<u8>& v) { put_bytes(v.data(), v.size()); }

    void put_string(const std::string& s) {
        put_bytes(reinterpret_cast<const u8*>(s.data()), s.size());
    }

    // Message preamble: magic, version, kind.
    void put_preamble(MessageKind kind) {
        put_u32(ARKDROP_MAGIC);
        put_u8(ARKDROP_VERSION);
        put_u8((u8)kind);
    }

    const std::vector<u8>& data() const { return buf_; }
    std::vector<u8> take() { return std::move(buf_); }

private:
    void append(const void* p, size_t len) {
        const u8* b = static_cast<const u8*>(p);
        buf_.insert(buf_.end(), b, b + len);
    }

    std::vector<u8> buf_;
};

// ---- Structured payload reader; every short read is a DecodeError ----

class WireReader {
public:
    WireReader(const u8* data, size_t len) : data_(data), len_(len) {}
    explicit WireReader(const std::vector<u8>& v) : WireReader(v.data(), v.size()) {}

    u8 get_u8() {
        need(1, "u8");
        return data_[pos_++];
    }

    u32 get_u32() {
        need(4, "u32");
        u32 be;
        std::memcpy(&be, data_ + pos_, 4);
        pos_ += 4;
        return ntoh32(be);
    }

    u64 get_u64() {
        need(8, "u64");
        u64 be;
        std::memcpy(&be, data_ + pos_, 8);
        pos_ += 8;
        return ntoh64(be);
    }

    bool get_bool() {
        u8 v = get_u8();
        if (v > 1) throw DecodeError("invalid bool value " + std::to_string(v));
        return v == 1;
    }

    std::vector<u8> get_bytes() {
        u32 n = get_u32();
        need(n, "byte field");
        std::vector<u8> out(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return out;
    }

    std::string get_string() {
        u32 n = get_u32();
        need(n, "string field");
        std::string out(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return out;
    }

    void expect_preamble(MessageKind kind) {
        u32 magic = get_u32();
        if (magic != ARKDROP_MAGIC) throw DecodeError("bad magic");
        u8 version = get_u8();
        if (version != ARKDROP_VERSION) {
            throw DecodeError("unsupported version " + std::to_string(version));
        }
        u8 k = get_u8();
        if (k != (u8)kind) {
            throw DecodeError("unexpected message kind " + std::to_string(k));
        }
    }

    // All bytes must be consumed by a complete message.
    void expect_end() const {
        if (pos_ != len_) {
            throw DecodeError(std::to_string(len_ - pos_) + " trailing bytes");
        }
    }

    size_t remaining() const { return len_ - pos_; }

private:
    void need(size_t n, const char* what) const {
        if (len_ - pos_ < n) {
            throw DecodeError(std::string("short ") + what + ": need " +
                              std::to_string(n) + ", have " + std::to_string(len_ - pos_));
        }
    }

    const u8* data_;
    size_t    len_;
    size_t    pos_{0};
};

} // namespace proto
