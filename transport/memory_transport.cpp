// ============================================================
// memory_transport.cpp -- In-process connected endpoint pair
// ============================================================

#include "memory_transport.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

MemoryConnection::MemoryConnection(Side side, std::shared_ptr<MemoryWire> wire)
    : StreamMux(side, side == Side::DIALER ? "memory:listener" : "memory:dialer")
    , wire_(std::move(wire)) {}

void MemoryConnection::send_frame(MuxFrameType type, u32 sid, const u8* payload, size_t len) {
    std::shared_ptr<MemoryConnection> peer;
    {
        std::lock_guard<std::mutex> lock(wire_->mutex);
        // Frames on a severed wire vanish, like packets on a dead link.
        if (wire_->severed) return;
        peer = wire_->ends[side() == Side::DIALER ? 1 : 0].lock();
    }
    if (!peer) {
        check_open();
        throw ConnectionLost("peer endpoint destroyed");
    }
    peer->deliver(type, sid, payload, len);
}

void MemoryConnection::drop() {
    std::shared_ptr<MemoryConnection> a, b;
    {
        std::lock_guard<std::mutex> lock(wire_->mutex);
        if (wire_->severed) return;
        wire_->severed = true;
        a = wire_->ends[0].lock();
        b = wire_->ends[1].lock();
    }
    LOG_DEBUG("memory link dropped");
    if (a) a->lose("link dropped");
    if (b) b->lose("link dropped");
}

std::pair<std::shared_ptr<MemoryConnection>, std::shared_ptr<MemoryConnection>>
MemoryTransport::pair() {
    auto wire = std::make_shared<MemoryWire>();
    auto dialer   = std::make_shared<MemoryConnection>(StreamMux::Side::DIALER, wire);
    auto listener = std::make_shared<MemoryConnection>(StreamMux::Side::LISTENER, wire);
    {
        std::lock_guard<std::mutex> lock(wire->mutex);
        wire->ends[0] = dialer;
        wire->ends[1] = listener;
    }
    return {dialer, listener};
}
