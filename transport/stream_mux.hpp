#pragma once

// ============================================================
// stream_mux.hpp -- Logical streams multiplexed over one link
// ============================================================

#include "connection.hpp"
#include "../common/protocol.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Connection implementation shared by every transport. The link below only
// has to deliver mux frames in order (send_frame / on_frame); the mux keeps
// per-stream state, accept queues and the connection close state.
//
// Stream ids carry the opener's side in the low bit so both peers can open
// streams without coordination.
class StreamMux : public Connection, public std::enable_shared_from_this<StreamMux> {
public:
    enum class Side : u32 { DIALER = 0, LISTENER = 1 };

    ~StreamMux() override = default;

    BiStream open_bi() override;
    BiStream accept_bi() override;
    std::unique_ptr<SendStream> open_uni() override;
    std::unique_ptr<RecvStream> accept_uni() override;
    void close(u32 code, const std::string& reason) override;
    bool is_closed() const override;
    std::string peer_addr() const override { return peer_addr_; }

    Side side() const { return side_; }

    // Number of live stream states (for leak checks).
    size_t stream_count() const;

    // Bytes received on a stream that its reader has not consumed yet.
    size_t buffered_bytes(u32 sid) const;

    // ---- Used by the stream halves ----
    void stream_write(u32 sid, const u8* data, size_t len);
    void stream_finish(u32 sid);
    std::optional<u32> stream_stopped(u32 sid);
    size_t stream_read(u32 sid, u8* buf, size_t len);
    void stream_stop(u32 sid, u32 code);
    void release_send(u32 sid);
    void release_recv(u32 sid);

protected:
    StreamMux(Side side, std::string peer_addr);

    // ---- Link side ----
    // Deliver one frame received from the peer. Never calls send_frame.
    void on_frame(MuxFrameType type, u32 sid, const u8* payload, size_t len);
    // The link failed or the peer vanished without a close frame.
    void on_link_lost(const std::string& why);

    // Throws the close error if the connection is no longer open.
    void check_open() const;

    // Transmit one frame to the peer. Called without the mux lock held.
    virtual void send_frame(MuxFrameType type, u32 sid, const u8* payload, size_t len) = 0;
    // Runs once, after the CLOSE frame of a local close was sent.
    virtual void on_local_close() {}

private:
    struct StreamState {
        int  halves{0};             // local halves still alive

        // inbound: peer writes, we read
        std::deque<std::vector<u8>> inbox;
        size_t inbox_off{0};
        u64  recv_outstanding{0};   // received but not yet credited back
        u64  consumed_uncredited{0};
        bool fin_received{false};
        bool reset_received{false};
        bool recv_stopped{false};
        bool done_sent{false};

        // outbound: we write, peer reads
        bool fin_sent{false};
        u64  send_credit{MUX_STREAM_WINDOW};
        bool peer_done{false};
        bool peer_stopped{false};
        u32  stop_code{0};
    };

    enum class CloseKind { OPEN, CLOSED, LOST };

    u32 allocate_id();
    StreamState& state_locked(u32 sid);
    void throw_closed_locked() const;
    void release_locked(u32 sid);
    void send_credit_frame(u32 sid, u64 grant);

    Side        side_;
    std::string peer_addr_;

    mutable std::mutex          mutex_;
    std::condition_variable     cv_;
    std::map<u32, StreamState>  streams_;
    std::deque<u32>             pending_bi_;
    std::deque<u32>             pending_uni_;
    u32                         next_seq_{0};

    CloseKind   close_kind_{CloseKind::OPEN};
    u32         close_code_{0};
    std::string close_reason_;
    bool        closed_by_peer_{false};
};
