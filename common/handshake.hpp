#pragma once

// ============================================================
// handshake.hpp -- Handshake model, negotiation and message codecs
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <vector>
#include <optional>

// Identity of one peer, exchanged during the handshake and never persisted.
struct Profile {
    std::string id;
    std::string name;
    std::optional<std::string> avatar_b64;
};

// One offered file (sender -> receiver). The id is the only key chunks
// carry, so it must be unique within a session.
struct FileDescriptor {
    std::string id;
    std::string name;
    u64 len{0};
};

// Transfer parameters one peer is comfortable with.
struct ProposedConfig {
    u64  chunk_size{DEFAULT_CHUNK_SIZE};
    u32  parallel_streams{DEFAULT_PARALLEL_STREAMS};
    bool compression{false};

    // 512 KiB chunks, 4 streams
    static ProposedConfig balanced() { return ProposedConfig{}; }

    // 512 KiB chunks, 8 streams
    static ProposedConfig high_performance() {
        return ProposedConfig{512u * 1024u, 8, false};
    }

    // 64 KiB chunks, 2 streams
    static ProposedConfig low_bandwidth() {
        return ProposedConfig{64u * 1024u, 2, false};
    }

    // Throws std::invalid_argument for a zero/oversized chunk size or
    // zero parallel streams.
    void validate() const;
};

// The single configuration both peers use for one connection.
struct NegotiatedConfig {
    u64  chunk_size{0};
    u32  parallel_streams{0};
    bool compression{false};

    bool operator==(const NegotiatedConfig& o) const {
        return chunk_size == o.chunk_size &&
               parallel_streams == o.parallel_streams &&
               compression == o.compression;
    }
    bool operator!=(const NegotiatedConfig& o) const { return !(*this == o); }
};

// Each parameter is the minimum of both proposals; compression only when
// both peers ask for it. Pure and commutative.
NegotiatedConfig negotiate(const ProposedConfig& local, const ProposedConfig& remote);

struct SenderHandshake {
    Profile profile;
    std::vector<FileDescriptor> files;
    ProposedConfig config;
};

struct ReceiverHandshake {
    Profile profile;
    ProposedConfig config;
};

namespace proto {

std::vector<u8> encode_sender_handshake(const SenderHandshake& h);
SenderHandshake decode_sender_handshake(const std::vector<u8>& payload);

std::vector<u8> encode_receiver_handshake(const ReceiverHandshake& h);
ReceiverHandshake decode_receiver_handshake(const std::vector<u8>& payload);

} // namespace proto
