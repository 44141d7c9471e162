// ============================================================
// receive_carrier.cpp -- Receiver handshake and stream demultiplexing
// ============================================================

#include "receive_carrier.hpp"
#include "../common/errors.hpp"
#include "../common/framing.hpp"
#include "../common/logger.hpp"
#include "../common/task_set.hpp"
#include "../common/utils.hpp"
#include <set>
#include <stdexcept>

ReceiveCarrier::ReceiveCarrier(std::shared_ptr<Connection> conn,
                               Profile profile,
                               ProposedConfig config,
                               const ReceiveRegistry& subscribers,
                               TransferStats& stats)
    : conn_(std::move(conn))
    , profile_(std::move(profile))
    , config_(config)
    , subs_(subscribers)
    , stats_(stats)
{}

void ReceiveCarrier::log(const std::string& msg) {
    LOG_DEBUG(msg);
    subs_.publish([&](ReceiveSubscriber& s) { s.log(msg); });
}

// ---- Greeting ----

void ReceiveCarrier::greet() {
    BiStream bi = conn_->accept_bi();
    sender_ = proto::decode_sender_handshake(framing::read_required(*bi.recv));

    std::set<std::string> ids;
    for (const auto& f : sender_.files) {
        if (!ids.insert(f.id).second) {
            throw ProtocolError("duplicate file id " + f.id + " in handshake");
        }
    }
    negotiated_ = negotiate(config_, sender_.config);

    ReceiverHandshake reply;
    reply.profile = profile_;
    reply.config  = config_;
    framing::write_message(*bi.send, proto::encode_receiver_handshake(reply));
    try {
        bi.recv->stop(ARKDROP_STOP_DONE);
        bi.send->finish();
        bi.send->stopped();
    } catch (const ConnectionClosed& e) {
        // A sender with nothing to send may read the reply and close with
        // 200/"finished" before we wind the stream down.
        if (!e.is_graceful()) throw;
        LOG_DEBUG("Sender closed right after the handshake reply");
    }

    u32 empty_files = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& f : sender_.files) {
            progress_[f.id] = FileProgress{f.name, f.len, 0};
            if (f.len == 0) ++empty_files;
        }
    }
    stats_.files_total = (u32)sender_.files.size();
    stats_.files_done  = empty_files;
    greeted_ = true;

    u64 total = 0;
    for (const auto& f : sender_.files) total += f.len;
    log("Sender " + sender_.profile.name + " offers " + std::to_string(sender_.files.size()) +
        " file(s), " + utils::format_bytes(total) + "; chunk_size=" +
        std::to_string(negotiated_.chunk_size) + ", parallel_streams=" +
        std::to_string(negotiated_.parallel_streams));

    ConnectingEvent ev{sender_.profile, sender_.files};
    subs_.publish([&](ReceiveSubscriber& s) { s.on_connecting(ev); });
}

// ---- Receiving ----

void ReceiveCarrier::fail(std::exception_ptr err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (first_error_) return;
        first_error_ = err;
    }
    LOG_WARN("Receive failed: " + errors::describe(err));
    // Unblocks the accept loop and every file task.
    conn_->close(ARKDROP_CLOSE_FAILED, ARKDROP_FAILED_REASON);
}

void ReceiveCarrier::receive_files() {
    if (!greeted_) throw std::logic_error("receive_files before greet");

    TaskSet tasks;
    for (;;) {
        std::unique_ptr<RecvStream> accepted;
        try {
            accepted = conn_->accept_uni();
        } catch (const ConnectionClosed& e) {
            if (e.is_graceful()) {
                log("Sender finished, draining " + std::to_string(tasks.size()) + " stream(s)");
            } else {
                fail(std::current_exception());
            }
            break;
        } catch (const std::exception&) {
            fail(std::current_exception());
            break;
        }

        std::shared_ptr<RecvStream> stream(std::move(accepted));
        tasks.spawn([this, stream] {
            StreamSlot slot(stats_);
            try {
                receive_one(*stream);
            } catch (const ConnectionClosed& e) {
                // The sender's graceful close can overtake our last read;
                // missing bytes are caught by the completeness check.
                if (!e.is_graceful()) fail(std::current_exception());
            } catch (const std::exception&) {
                fail(std::current_exception());
            }
        });

        std::exception_ptr reaped;
        while (tasks.try_join_next(reaped)) {}
    }
    tasks.drain();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (first_error_) std::rethrow_exception(first_error_);
        for (const auto& kv : progress_) {
            const FileProgress& fp = kv.second;
            if (fp.received != fp.expected) {
                throw ProtocolError("incomplete transfer: " + fp.name + " received " +
                                    std::to_string(fp.received) + " of " +
                                    std::to_string(fp.expected) + " bytes");
            }
        }
    }
    log("All " + std::to_string(progress_.size()) + " file(s) received: " + stats_.summary());
}

void ReceiveCarrier::receive_one(RecvStream& stream) {
    ChunkProjection chunk;
    std::string file_id;
    while (framing::read_chunk_message(stream, chunk)) {
        if (file_id.empty()) {
            file_id = chunk.id;
        } else if (chunk.id != file_id) {
            throw ProtocolError("stream " + std::to_string(stream.id()) +
                                " switched from file " + file_id + " to " + chunk.id);
        }
        if (chunk.raw_len > negotiated_.chunk_size) {
            throw ProtocolError("chunk of " + std::to_string(chunk.raw_len) +
                                " bytes exceeds negotiated chunk_size");
        }

        std::vector<u8> raw = framing::unpack_chunk(chunk);
        if (raw.empty()) continue;

        bool completed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = progress_.find(chunk.id);
            if (it == progress_.end()) {
                throw ProtocolError("chunk for unknown file id " + chunk.id);
            }
            FileProgress& fp = it->second;
            if (fp.received + raw.size() > fp.expected) {
                throw ProtocolError("file " + fp.name + " overruns its declared length of " +
                                    std::to_string(fp.expected) + " bytes");
            }
            fp.received += raw.size();
            completed = fp.received == fp.expected;
        }

        stats_.bytes_raw  += raw.size();
        stats_.bytes_wire += chunk.data.size();
        ++stats_.chunks;

        ReceivingEvent ev{chunk.id, raw};
        subs_.publish([&](ReceiveSubscriber& s) { s.on_receiving(ev); });

        if (completed) {
            ++stats_.files_done;
            LOG_DEBUG("Received file " + chunk.id);
        }
    }
}

// ---- Finished ----

void ReceiveCarrier::finish(bool ok) {
    if (ok) {
        conn_->close(ARKDROP_CLOSE_FINISHED, ARKDROP_FINISHED_REASON);
    } else {
        conn_->close(ARKDROP_CLOSE_FAILED, ARKDROP_FAILED_REASON);
    }
}
