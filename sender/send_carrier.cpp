// ============================================================
// send_carrier.cpp -- Sender handshake and parallel file streaming
// ============================================================

#include "send_carrier.hpp"
#include "../common/errors.hpp"
#include "../common/framing.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/task_set.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

SendCarrier::SendCarrier(std::shared_ptr<Connection> conn,
                         Profile profile,
                         std::vector<LocalFile> files,
                         ProposedConfig config,
                         const SendRegistry& subscribers,
                         TransferStats& stats)
    : conn_(std::move(conn))
    , profile_(std::move(profile))
    , files_(std::move(files))
    , config_(config)
    , subs_(subscribers)
    , stats_(stats)
{}

void SendCarrier::log(const std::string& msg) {
    LOG_DEBUG(msg);
    subs_.publish([&](SendSubscriber& s) { s.log(msg); });
}

// ---- Greeting ----

void SendCarrier::greet() {
    log("Greeting receiver at " + conn_->peer_addr());
    BiStream bi = conn_->open_bi();

    SenderHandshake hs;
    hs.profile = profile_;
    hs.config  = config_;
    hs.files.reserve(files_.size());
    for (const auto& f : files_) hs.files.push_back(f.desc);
    framing::write_message(*bi.send, proto::encode_sender_handshake(hs));

    ReceiverHandshake reply = proto::decode_receiver_handshake(framing::read_required(*bi.recv));
    receiver_   = reply.profile;
    negotiated_ = negotiate(config_, reply.config);
    greeted_    = true;

    bi.send->finish();
    bi.recv->stop(ARKDROP_STOP_DONE);

    log("Negotiated with " + receiver_.name + ": chunk_size=" +
        std::to_string(negotiated_.chunk_size) + ", parallel_streams=" +
        std::to_string(negotiated_.parallel_streams) +
        (negotiated_.compression ? ", zstd" : ""));
    subs_.publish([&](SendSubscriber& s) { s.on_connecting(receiver_); });
}

// ---- Streaming ----

void SendCarrier::send_files() {
    if (!greeted_) throw std::logic_error("send_files before greet");

    stats_.files_total = (u32)files_.size();
    TaskSet tasks;
    std::exception_ptr first;

    for (const auto& f : files_) {
        if (first) break;
        const LocalFile* file = &f;
        tasks.spawn([this, file] { send_one(*file); });

        // Gate: a full set waits for one task before the next spawn.
        if (tasks.size() >= negotiated_.parallel_streams) {
            std::exception_ptr err = tasks.join_next();
            if (err && !first) first = err;
        }
    }

    std::exception_ptr err = tasks.drain();
    if (err && !first) first = err;

    if (first) {
        log("Transfer failed: " + errors::describe(first));
        std::rethrow_exception(first);
    }
    log("All " + std::to_string(files_.size()) + " file(s) sent: " + stats_.summary());
}

void SendCarrier::publish_progress(const LocalFile& file, u64 sent) {
    SendingEvent ev;
    ev.id        = file.desc.id;
    ev.name      = file.desc.name;
    ev.sent      = sent;
    ev.remaining = file.desc.len > sent ? file.desc.len - sent : 0;
    subs_.publish([&](SendSubscriber& s) { s.on_sending(ev); });
}

void SendCarrier::send_one(const LocalFile& file) {
    StreamSlot slot(stats_);
    std::unique_ptr<SendStream> stream = conn_->open_uni();
    publish_progress(file, 0);

    hash::StreamHasher64 digest;
    u64 sent = 0;
    for (;;) {
        std::vector<u8> raw = file.source->read_chunk(negotiated_.chunk_size);
        if (raw.empty()) break;

        digest.update(raw.data(), raw.size());
        size_t raw_len = raw.size();
        ChunkProjection chunk = framing::project_chunk(file.desc.id, std::move(raw),
                                                       negotiated_.compression);
        framing::write_chunk_message(*stream, chunk);

        sent += raw_len;
        stats_.bytes_raw  += raw_len;
        stats_.bytes_wire += chunk.data.size();
        ++stats_.chunks;
        publish_progress(file, sent);
    }

    stream->finish();
    std::optional<u32> code = stream->stopped();
    if (code) throw StreamStopped(stream->id(), *code);

    ++stats_.files_done;
    LOG_DEBUG("Sent " + file.desc.name + " (" + utils::format_bytes(sent) +
              ", xxh3=" + hash::to_hex(digest.digest()) + ")");
}

// ---- Finished ----

void SendCarrier::finish() {
    conn_->close(ARKDROP_CLOSE_FINISHED, ARKDROP_FINISHED_REASON);
}
