// ============================================================
// stream_mux.cpp -- Stream state machine over mux frames
// ============================================================

#include "stream_mux.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace {

class MuxSendStream : public SendStream {
public:
    MuxSendStream(std::shared_ptr<StreamMux> mux, u32 sid)
        : mux_(std::move(mux)), sid_(sid) {}
    ~MuxSendStream() override { mux_->release_send(sid_); }

    using SendStream::write_all;

    u32 id() const override { return sid_; }
    void write_all(const u8* data, size_t len) override { mux_->stream_write(sid_, data, len); }
    void finish() override { mux_->stream_finish(sid_); }
    std::optional<u32> stopped() override { return mux_->stream_stopped(sid_); }

private:
    std::shared_ptr<StreamMux> mux_;
    u32 sid_;
};

class MuxRecvStream : public RecvStream {
public:
    MuxRecvStream(std::shared_ptr<StreamMux> mux, u32 sid)
        : mux_(std::move(mux)), sid_(sid) {}
    ~MuxRecvStream() override { mux_->release_recv(sid_); }

    u32 id() const override { return sid_; }
    size_t read(u8* buf, size_t len) override { return mux_->stream_read(sid_, buf, len); }
    void stop(u32 code) override { mux_->stream_stop(sid_, code); }

private:
    std::shared_ptr<StreamMux> mux_;
    u32 sid_;
};

std::vector<u8> encode_u32(u32 v) {
    std::vector<u8> out(4);
    u32 be = proto::hton32(v);
    std::memcpy(out.data(), &be, 4);
    return out;
}

u32 decode_u32(const u8* p, size_t len) {
    if (len < 4) return 0;
    u32 be;
    std::memcpy(&be, p, 4);
    return proto::ntoh32(be);
}

} // namespace

StreamMux::StreamMux(Side side, std::string peer_addr)
    : side_(side), peer_addr_(std::move(peer_addr)) {}

u32 StreamMux::allocate_id() {
    return (next_seq_++ << 1) | (u32)side_;
}

StreamMux::StreamState& StreamMux::state_locked(u32 sid) {
    auto it = streams_.find(sid);
    if (it == streams_.end()) {
        throw std::logic_error("unknown stream " + std::to_string(sid));
    }
    return it->second;
}

void StreamMux::throw_closed_locked() const {
    if (close_kind_ == CloseKind::CLOSED) {
        throw ConnectionClosed(close_code_, close_reason_, closed_by_peer_);
    }
    if (close_kind_ == CloseKind::LOST) {
        throw ConnectionLost(close_reason_);
    }
}

void StreamMux::check_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_closed_locked();
}

bool StreamMux::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_kind_ != CloseKind::OPEN;
}

size_t StreamMux::stream_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.size();
}

size_t StreamMux::buffered_bytes(u32 sid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(sid);
    if (it == streams_.end()) return 0;
    size_t n = 0;
    for (const auto& frame : it->second.inbox) n += frame.size();
    return n - it->second.inbox_off;
}

// ---- Opening and accepting ----

BiStream StreamMux::open_bi() {
    u32 sid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_closed_locked();
        sid = allocate_id();
        streams_[sid].halves = 2;
    }
    auto self = shared_from_this();
    BiStream bi{std::make_unique<MuxSendStream>(self, sid),
                std::make_unique<MuxRecvStream>(self, sid)};
    send_frame(MuxFrameType::MF_OPEN_BI, sid, nullptr, 0);
    return bi;
}

std::unique_ptr<SendStream> StreamMux::open_uni() {
    u32 sid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_closed_locked();
        sid = allocate_id();
        streams_[sid].halves = 1;
    }
    auto stream = std::make_unique<MuxSendStream>(shared_from_this(), sid);
    send_frame(MuxFrameType::MF_OPEN_UNI, sid, nullptr, 0);
    return stream;
}

BiStream StreamMux::accept_bi() {
    u32 sid;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return !pending_bi_.empty() || close_kind_ != CloseKind::OPEN;
        });
        throw_closed_locked();
        sid = pending_bi_.front();
        pending_bi_.pop_front();
    }
    auto self = shared_from_this();
    return BiStream{std::make_unique<MuxSendStream>(self, sid),
                    std::make_unique<MuxRecvStream>(self, sid)};
}

std::unique_ptr<RecvStream> StreamMux::accept_uni() {
    u32 sid;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return !pending_uni_.empty() || close_kind_ != CloseKind::OPEN;
        });
        throw_closed_locked();
        sid = pending_uni_.front();
        pending_uni_.pop_front();
    }
    return std::make_unique<MuxRecvStream>(shared_from_this(), sid);
}

// ---- Send half ----

void StreamMux::stream_write(u32 sid, const u8* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        size_t n;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this, sid] {
                const StreamState& st = state_locked(sid);
                return st.send_credit > 0 || st.peer_stopped || close_kind_ != CloseKind::OPEN;
            });
            throw_closed_locked();
            StreamState& st = state_locked(sid);
            if (st.peer_stopped) throw StreamStopped(sid, st.stop_code);
            if (st.fin_sent) throw std::logic_error("write after finish on stream " + std::to_string(sid));
            n = (size_t)std::min<u64>({(u64)(len - off), (u64)MAX_MUX_DATA, st.send_credit});
            st.send_credit -= n;
        }
        send_frame(MuxFrameType::MF_DATA, sid, data + off, n);
        off += n;
    }
}

void StreamMux::stream_finish(u32 sid) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_closed_locked();
        StreamState& st = state_locked(sid);
        if (st.fin_sent || st.peer_stopped) return;
        st.fin_sent = true;
    }
    send_frame(MuxFrameType::MF_FIN, sid, nullptr, 0);
}

std::optional<u32> StreamMux::stream_stopped(u32 sid) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, sid] {
        const StreamState& st = state_locked(sid);
        return st.peer_done || st.peer_stopped || close_kind_ != CloseKind::OPEN;
    });
    const StreamState& st = state_locked(sid);
    if (st.peer_stopped) return st.stop_code;
    if (st.peer_done) return std::nullopt;
    throw_closed_locked();
    return std::nullopt;
}

// ---- Receive half ----

size_t StreamMux::stream_read(u32 sid, u8* buf, size_t len) {
    if (len == 0) return 0;
    size_t n = 0;
    u64 grant = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this, sid] {
            const StreamState& st = state_locked(sid);
            return !st.inbox.empty() || st.fin_received || st.reset_received ||
                   st.recv_stopped || close_kind_ != CloseKind::OPEN;
        });
        throw_closed_locked();
        StreamState& st = state_locked(sid);
        if (st.recv_stopped) return 0;

        if (!st.inbox.empty()) {
            std::vector<u8>& front = st.inbox.front();
            n = std::min(len, front.size() - st.inbox_off);
            std::memcpy(buf, front.data() + st.inbox_off, n);
            st.inbox_off += n;
            if (st.inbox_off == front.size()) {
                st.inbox.pop_front();
                st.inbox_off = 0;
            }
            // Credit goes back in batches of half a window.
            st.consumed_uncredited += n;
            if (st.consumed_uncredited >= MUX_STREAM_WINDOW / 2 && !st.fin_received) {
                grant = st.consumed_uncredited;
                st.consumed_uncredited = 0;
                st.recv_outstanding -= grant;
            }
        } else {
            if (st.reset_received) throw StreamReset(sid);
            if (st.done_sent) return 0;
            st.done_sent = true;
        }
    }
    if (n > 0) {
        if (grant > 0) send_credit_frame(sid, grant);
        return n;
    }
    // First observation of the end: acknowledge so the writer's stopped() resolves.
    send_frame(MuxFrameType::MF_DONE, sid, nullptr, 0);
    return 0;
}

void StreamMux::send_credit_frame(u32 sid, u64 grant) {
    std::vector<u8> payload = encode_u32((u32)grant);
    try {
        send_frame(MuxFrameType::MF_WINDOW, sid, payload.data(), payload.size());
    } catch (const std::exception& e) {
        // The bytes were already consumed; the close surfaces on the next call.
        LOG_DEBUG("stream " + std::to_string(sid) + " credit not delivered: " + e.what());
    }
}

void StreamMux::stream_stop(u32 sid, u32 code) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_kind_ != CloseKind::OPEN) return;
        StreamState& st = state_locked(sid);
        if (st.recv_stopped) return;
        st.recv_stopped = true;
        st.inbox.clear();
        st.inbox_off = 0;
        if (st.done_sent) return;
    }
    cv_.notify_all();
    std::vector<u8> payload = encode_u32(code);
    send_frame(MuxFrameType::MF_STOP, sid, payload.data(), payload.size());
}

// ---- Release ----

void StreamMux::release_locked(u32 sid) {
    auto it = streams_.find(sid);
    if (it == streams_.end()) return;
    if (--it->second.halves <= 0) streams_.erase(it);
}

// A send half dropped before finish() abandons the stream.
void StreamMux::release_send(u32 sid) {
    bool reset = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(sid);
        if (it == streams_.end()) return;
        StreamState& st = it->second;
        if (close_kind_ == CloseKind::OPEN && !st.fin_sent && !st.peer_stopped) {
            st.fin_sent = true;
            reset = true;
        }
        release_locked(sid);
    }
    if (!reset) return;
    try {
        send_frame(MuxFrameType::MF_RESET, sid, nullptr, 0);
    } catch (const std::exception& e) {
        LOG_DEBUG("stream " + std::to_string(sid) + " reset not delivered: " + e.what());
    }
}

// A receive half dropped before the end tells the writer to stop.
void StreamMux::release_recv(u32 sid) {
    bool stop = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(sid);
        if (it == streams_.end()) return;
        StreamState& st = it->second;
        if (close_kind_ == CloseKind::OPEN && !st.recv_stopped && !st.done_sent) {
            st.recv_stopped = true;
            stop = true;
        }
        release_locked(sid);
    }
    if (!stop) return;
    try {
        std::vector<u8> payload = encode_u32(ARKDROP_STOP_DONE);
        send_frame(MuxFrameType::MF_STOP, sid, payload.data(), payload.size());
    } catch (const std::exception& e) {
        LOG_DEBUG("stream " + std::to_string(sid) + " stop not delivered: " + e.what());
    }
}

// ---- Connection close ----

void StreamMux::close(u32 code, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_kind_ != CloseKind::OPEN) return;
        close_kind_     = CloseKind::CLOSED;
        close_code_     = code;
        close_reason_   = reason;
        closed_by_peer_ = false;
    }
    cv_.notify_all();
    LOG_DEBUG("closing connection to " + peer_addr_ + " (code=" +
              std::to_string(code) + ", reason=" + reason + ")");

    std::vector<u8> payload = encode_u32(code);
    payload.insert(payload.end(), reason.begin(), reason.end());
    try {
        send_frame(MuxFrameType::MF_CLOSE, 0, payload.data(), payload.size());
    } catch (const std::exception& e) {
        LOG_DEBUG("close frame to " + peer_addr_ + " not delivered: " + e.what());
    }
    on_local_close();
}

// ---- Link side ----

void StreamMux::on_frame(MuxFrameType type, u32 sid, const u8* payload, size_t len) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_kind_ != CloseKind::OPEN) return;

        switch (type) {
        case MuxFrameType::MF_OPEN_BI:
        case MuxFrameType::MF_OPEN_UNI: {
            // Ids with our own side bit can only be opened by us.
            if ((sid & 1u) == (u32)side_ || streams_.count(sid)) {
                LOG_WARN("ignoring open of invalid stream id " + std::to_string(sid));
                return;
            }
            bool bi = type == MuxFrameType::MF_OPEN_BI;
            streams_[sid].halves = bi ? 2 : 1;
            (bi ? pending_bi_ : pending_uni_).push_back(sid);
            break;
        }
        case MuxFrameType::MF_DATA: {
            auto it = streams_.find(sid);
            if (it == streams_.end() || it->second.recv_stopped || len == 0) return;
            StreamState& st = it->second;
            st.recv_outstanding += len;
            if (st.recv_outstanding > MUX_STREAM_WINDOW) {
                // The peer ignored our window; the link can no longer be trusted.
                close_kind_   = CloseKind::LOST;
                close_reason_ = "stream " + std::to_string(sid) + " exceeded its flow control window";
                LOG_WARN("link to " + peer_addr_ + " lost: " + close_reason_);
                break;
            }
            st.inbox.emplace_back(payload, payload + len);
            break;
        }
        case MuxFrameType::MF_WINDOW: {
            auto it = streams_.find(sid);
            if (it == streams_.end()) return;
            it->second.send_credit += decode_u32(payload, len);
            break;
        }
        case MuxFrameType::MF_FIN: {
            auto it = streams_.find(sid);
            if (it == streams_.end()) return;
            it->second.fin_received = true;
            break;
        }
        case MuxFrameType::MF_RESET: {
            auto it = streams_.find(sid);
            if (it == streams_.end()) return;
            it->second.reset_received = true;
            break;
        }
        case MuxFrameType::MF_STOP: {
            auto it = streams_.find(sid);
            if (it == streams_.end()) return;
            it->second.peer_stopped = true;
            it->second.stop_code = decode_u32(payload, len);
            break;
        }
        case MuxFrameType::MF_DONE: {
            auto it = streams_.find(sid);
            if (it == streams_.end()) return;
            it->second.peer_done = true;
            break;
        }
        case MuxFrameType::MF_CLOSE: {
            close_kind_     = CloseKind::CLOSED;
            close_code_     = decode_u32(payload, len);
            close_reason_   = len > 4 ? std::string((const char*)payload + 4, len - 4) : std::string();
            closed_by_peer_ = true;
            LOG_DEBUG("connection closed by " + peer_addr_ + " (code=" +
                      std::to_string(close_code_) + ", reason=" + close_reason_ + ")");
            break;
        }
        default:
            LOG_WARN("ignoring unknown mux frame type " + std::to_string((u16)type));
            return;
        }
    }
    cv_.notify_all();
}

void StreamMux::on_link_lost(const std::string& why) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_kind_ != CloseKind::OPEN) return;
        close_kind_   = CloseKind::LOST;
        close_reason_ = why;
    }
    LOG_DEBUG("link to " + peer_addr_ + " lost: " + why);
    cv_.notify_all();
}
