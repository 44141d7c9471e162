#pragma once

// ============================================================
// framing.hpp -- Length-prefixed messages and chunk envelopes
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "../transport/connection.hpp"
#include <string>
#include <vector>

// One unit of file data on a per-file stream.
struct ChunkProjection {
    std::string     id;         // FileDescriptor id
    std::vector<u8> data;       // raw bytes, or a zstd frame if compressed
    u8              flags{0};   // ChunkFlags
    u64             raw_len{0}; // length once decompressed
    u32             checksum{0};// xxh3_32 of the raw bytes

    bool compressed() const { return (flags & CHUNK_COMPRESSED) != 0; }
};

namespace framing {

// ---- Length-prefixed messages ----

// Write a 4-byte big-endian length followed by the payload.
void write_message(SendStream& stream, const std::vector<u8>& payload);

// Read one message. Returns false when the stream ended cleanly before the
// first prefix byte. Throws TruncatedStream if it ends inside the prefix
// or body, and DecodeError if the prefix exceeds MAX_MESSAGE_LEN.
bool read_message(RecvStream& stream, std::vector<u8>& payload);

// Like read_message, but a clean end is a TruncatedStream as well.
std::vector<u8> read_required(RecvStream& stream);

// ---- Chunks ----

// Build the envelope for raw bytes; the payload is zstd-compressed only
// when allowed and when that makes it smaller.
ChunkProjection project_chunk(const std::string& id, std::vector<u8> raw, bool allow_compress);

// Recover the raw bytes and verify the checksum. Throws ProtocolError.
std::vector<u8> unpack_chunk(const ChunkProjection& chunk);

std::vector<u8> encode_chunk(const ChunkProjection& chunk);
ChunkProjection decode_chunk(const std::vector<u8>& payload);

void write_chunk_message(SendStream& stream, const ChunkProjection& chunk);

// Returns false at the normal end of a per-file stream.
bool read_chunk_message(RecvStream& stream, ChunkProjection& chunk);

} // namespace framing
