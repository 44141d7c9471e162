// ============================================================
// framing.cpp -- Length-prefixed messages and chunk envelopes
// ============================================================

#include "framing.hpp"
#include "compress.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "protocol_io.hpp"
#include <algorithm>
#include <stdexcept>

namespace framing {

void write_message(SendStream& stream, const std::vector<u8>& payload) {
    if (payload.size() > MAX_MESSAGE_LEN) {
        throw std::length_error("message too large: " + std::to_string(payload.size()));
    }
    std::vector<u8> frame(4 + payload.size());
    proto::encode_len((u32)payload.size(), frame.data());
    std::copy(payload.begin(), payload.end(), frame.begin() + 4);
    stream.write_all(frame);
}

bool read_message(RecvStream& stream, std::vector<u8>& payload) {
    u8 prefix[4];
    size_t got = stream.read_full(prefix, 4);
    if (got == 0) return false;
    if (got < 4) throw TruncatedStream(4, got);

    u32 len = proto::decode_len(prefix);
    if (len > MAX_MESSAGE_LEN) {
        throw DecodeError("message length " + std::to_string(len) + " exceeds limit");
    }
    payload.resize(len);
    got = stream.read_full(payload.data(), len);
    if (got < len) throw TruncatedStream(len, got);
    return true;
}

std::vector<u8> read_required(RecvStream& stream) {
    std::vector<u8> payload;
    if (!read_message(stream, payload)) throw TruncatedStream(4, 0);
    return payload;
}

// ---- Chunks ----

ChunkProjection project_chunk(const std::string& id, std::vector<u8> raw, bool allow_compress) {
    ChunkProjection c;
    c.id       = id;
    c.raw_len  = raw.size();
    c.checksum = hash::xxh3_32(raw.data(), raw.size());
    if (allow_compress && !raw.empty()) {
        std::vector<u8> packed = compress::compress_to_vec(raw.data(), raw.size());
        if (packed.size() < raw.size()) {
            c.flags |= CHUNK_COMPRESSED;
            c.data = std::move(packed);
            return c;
        }
    }
    c.data = std::move(raw);
    return c;
}

std::vector<u8> unpack_chunk(const ChunkProjection& chunk) {
    std::vector<u8> raw;
    if (chunk.compressed()) {
        if (chunk.raw_len > MAX_CHUNK_SIZE) {
            throw ProtocolError("compressed chunk claims " + std::to_string(chunk.raw_len) + " bytes");
        }
        raw = compress::decompress_to_vec(chunk.data.data(), chunk.data.size(), (size_t)chunk.raw_len);
    } else {
        if (chunk.raw_len != chunk.data.size()) {
            throw ProtocolError("chunk length mismatch for file " + chunk.id);
        }
        raw = chunk.data;
    }
    u32 actual = hash::xxh3_32(raw.data(), raw.size());
    if (actual != chunk.checksum) {
        throw ProtocolError("checksum mismatch for file " + chunk.id);
    }
    return raw;
}

std::vector<u8> encode_chunk(const ChunkProjection& chunk) {
    proto::WireWriter w;
    w.put_preamble(MessageKind::MK_CHUNK);
    w.put_string(chunk.id);
    w.put_u8(chunk.flags);
    w.put_u64(chunk.raw_len);
    w.put_u32(chunk.checksum);
    w.put_bytes(chunk.data);
    return w.take();
}

ChunkProjection decode_chunk(const std::vector<u8>& payload) {
    proto::WireReader r(payload);
    r.expect_preamble(MessageKind::MK_CHUNK);
    ChunkProjection c;
    c.id       = r.get_string();
    c.flags    = r.get_u8();
    c.raw_len  = r.get_u64();
    c.checksum = r.get_u32();
    c.data     = r.get_bytes();
    r.expect_end();
    if (c.flags & ~(u8)CHUNK_COMPRESSED) {
        throw DecodeError("unknown chunk flags " + std::to_string(c.flags));
    }
    return c;
}

void write_chunk_message(SendStream& stream, const ChunkProjection& chunk) {
    write_message(stream, encode_chunk(chunk));
}

bool read_chunk_message(RecvStream& stream, ChunkProjection& chunk) {
    std::vector<u8> payload;
    if (!read_message(stream, payload)) return false;
    chunk = decode_chunk(payload);
    return true;
}

} // namespace framing
