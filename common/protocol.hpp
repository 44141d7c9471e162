#pragma once

// protocol.hpp -- Wire protocol definitions for arkdrop

#include "platform.hpp"
#include <cstring>

// Magic number: "ADX1"
static constexpr u32 ARKDROP_MAGIC   = 0x41445831u;
static constexpr u8  ARKDROP_VERSION = 1;

// Upper bound for one length-prefixed message (handshake or chunk).
static constexpr u32 MAX_MESSAGE_LEN = 64u * 1024u * 1024u;
// Largest chunk a peer may propose; leaves room for the chunk envelope
// (and a zstd expansion) well under MAX_MESSAGE_LEN.
static constexpr u64 MAX_CHUNK_SIZE  = 32u * 1024u * 1024u;

static constexpr u64 DEFAULT_CHUNK_SIZE       = 512u * 1024u;
static constexpr u32 DEFAULT_PARALLEL_STREAMS = 4;

// ---- Connection close codes ----
// 200/"finished" is the graceful termination signal; anything else is a failure.
static constexpr u32 ARKDROP_CLOSE_FINISHED = 200;
static constexpr u32 ARKDROP_CLOSE_FAILED   = 1;
static constexpr u32 ARKDROP_CLOSE_CANCELLED = 2;
#define ARKDROP_FINISHED_REASON  "finished"
#define ARKDROP_FAILED_REASON    "receive failed"
#define ARKDROP_CANCELLED_REASON "cancelled"

// Stream stop code used once a handshake half has been consumed.
static constexpr u32 ARKDROP_STOP_DONE = 0;

// ---- Chunk flags ----
enum ChunkFlags : u8 {
    CHUNK_COMPRESSED = 0x01,  // data is a zstd frame of raw_len bytes
};

// ---- Control message kinds (first byte after magic/version) ----
enum class MessageKind : u8 {
    MK_SENDER_HANDSHAKE   = 0x01,
    MK_RECEIVER_HANDSHAKE = 0x02,
    MK_CHUNK              = 0x10,
};

// ---- Stream multiplexer frames (transport layer) ----
enum class MuxFrameType : u16 {
    MF_OPEN_BI  = 0x0001,
    MF_OPEN_UNI = 0x0002,
    MF_DATA     = 0x0003,
    MF_FIN      = 0x0004,  // sender finished its half
    MF_STOP     = 0x0005,  // receiver no longer reads the stream
    MF_DONE     = 0x0006,  // receiver has read everything up to FIN
    MF_RESET    = 0x0007,  // sender abandoned its half before FIN
    MF_WINDOW   = 0x0008,  // receiver consumed bytes; grants that much credit
    MF_CLOSE    = 0x00FF,  // application close (code + reason)
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// Largest DATA payload carried by one mux frame.
static constexpr u32 MAX_MUX_DATA = 256u * 1024u;

// Per-stream flow control window: a writer may have at most this many
// bytes sent but not yet consumed by the reader. The reader returns credit
// in MF_WINDOW frames once half a window has been consumed.
static constexpr u32 MUX_STREAM_WINDOW = 8u * MAX_MUX_DATA;
