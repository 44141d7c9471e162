#pragma once

// ============================================================
// memory_transport.hpp -- In-process connected endpoint pair
// ============================================================

#include "stream_mux.hpp"
#include <memory>
#include <mutex>
#include <utility>

class MemoryConnection;

// Shared between the two endpoints of one pair.
struct MemoryWire {
    std::mutex                       mutex;
    std::weak_ptr<MemoryConnection>  ends[2];
    bool                             severed{false};
};

// One endpoint. Frames are handed straight to the peer endpoint on the
// calling thread, so per-stream ordering follows call order.
class MemoryConnection : public StreamMux {
public:
    MemoryConnection(Side side, std::shared_ptr<MemoryWire> wire);

    // Sever the link without a close frame; both ends see ConnectionLost.
    void drop();

protected:
    void send_frame(MuxFrameType type, u32 sid, const u8* payload, size_t len) override;

private:
    void deliver(MuxFrameType type, u32 sid, const u8* payload, size_t len) {
        on_frame(type, sid, payload, len);
    }
    void lose(const std::string& why) { on_link_lost(why); }

    std::shared_ptr<MemoryWire> wire_;
};

class MemoryTransport {
public:
    // Two connected endpoints: first is the dialing side, second the
    // listening side.
    static std::pair<std::shared_ptr<MemoryConnection>, std::shared_ptr<MemoryConnection>> pair();
};
