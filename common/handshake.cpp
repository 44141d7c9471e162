// ============================================================
// handshake.cpp -- Negotiation and handshake message codecs
// ============================================================

#include "handshake.hpp"
#include "protocol_io.hpp"
#include <algorithm>
#include <stdexcept>

void ProposedConfig::validate() const {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (chunk_size > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk_size " + std::to_string(chunk_size) +
                                    " exceeds limit " + std::to_string(MAX_CHUNK_SIZE));
    }
    if (parallel_streams == 0) {
        throw std::invalid_argument("parallel_streams must be at least 1");
    }
}

NegotiatedConfig negotiate(const ProposedConfig& local, const ProposedConfig& remote) {
    NegotiatedConfig n;
    n.chunk_size       = std::min(local.chunk_size, remote.chunk_size);
    n.parallel_streams = std::min(local.parallel_streams, remote.parallel_streams);
    n.compression      = local.compression && remote.compression;
    return n;
}

namespace {

void put_profile(proto::WireWriter& w, const Profile& p) {
    w.put_string(p.id);
    w.put_string(p.name);
    w.put_bool(p.avatar_b64.has_value());
    if (p.avatar_b64) w.put_string(*p.avatar_b64);
}

Profile get_profile(proto::WireReader& r) {
    Profile p;
    p.id   = r.get_string();
    p.name = r.get_string();
    if (r.get_bool()) p.avatar_b64 = r.get_string();
    return p;
}

void put_config(proto::WireWriter& w, const ProposedConfig& c) {
    w.put_u64(c.chunk_size);
    w.put_u32(c.parallel_streams);
    w.put_bool(c.compression);
}

// A peer proposing zero values is as broken as an undecodable payload.
ProposedConfig get_config(proto::WireReader& r) {
    ProposedConfig c;
    c.chunk_size       = r.get_u64();
    c.parallel_streams = r.get_u32();
    c.compression      = r.get_bool();
    if (c.chunk_size == 0 || c.parallel_streams == 0) {
        throw DecodeError("config proposes zero chunk_size or parallel_streams");
    }
    return c;
}

} // namespace

namespace proto {

std::vector<u8> encode_sender_handshake(const SenderHandshake& h) {
    WireWriter w;
    w.put_preamble(MessageKind::MK_SENDER_HANDSHAKE);
    put_profile(w, h.profile);
    w.put_u32((u32)h.files.size());
    for (const auto& f : h.files) {
        w.put_string(f.id);
        w.put_string(f.name);
        w.put_u64(f.len);
    }
    put_config(w, h.config);
    return w.take();
}

SenderHandshake decode_sender_handshake(const std::vector<u8>& payload) {
    WireReader r(payload);
    r.expect_preamble(MessageKind::MK_SENDER_HANDSHAKE);

    SenderHandshake h;
    h.profile = get_profile(r);
    u32 count = r.get_u32();
    // Each descriptor needs at least 16 bytes; reject absurd counts before reserving.
    if ((u64)count * 16 > r.remaining()) {
        throw DecodeError("file count " + std::to_string(count) + " exceeds payload");
    }
    h.files.reserve(count);
    for (u32 i = 0; i < count; ++i) {
        FileDescriptor f;
        f.id   = r.get_string();
        f.name = r.get_string();
        f.len  = r.get_u64();
        h.files.push_back(std::move(f));
    }
    h.config = get_config(r);
    r.expect_end();
    return h;
}

std::vector<u8> encode_receiver_handshake(const ReceiverHandshake& h) {
    WireWriter w;
    w.put_preamble(MessageKind::MK_RECEIVER_HANDSHAKE);
    put_profile(w, h.profile);
    put_config(w, h.config);
    return w.take();
}

ReceiverHandshake decode_receiver_handshake(const std::vector<u8>& payload) {
    WireReader r(payload);
    r.expect_preamble(MessageKind::MK_RECEIVER_HANDSHAKE);

    ReceiverHandshake h;
    h.profile = get_profile(r);
    h.config  = get_config(r);
    r.expect_end();
    return h;
}

} // namespace proto
