#pragma once

// ============================================================
// receive_types.hpp -- Receiver-side events and observers
// ============================================================

#include "../common/platform.hpp"
#include "../common/handshake.hpp"
#include "../common/subscriber_registry.hpp"
#include <string>
#include <vector>

// One chunk of an incoming file, already verified.
struct ReceivingEvent {
    const std::string&     id;
    const std::vector<u8>& data;
};

// The sender and what it offers, published once after the handshake.
struct ConnectingEvent {
    const Profile&                      sender;
    const std::vector<FileDescriptor>&  files;
};

// Callbacks run on the session thread and on file-task threads. A
// callback that throws fails the file it was called for.
class ReceiveSubscriber {
public:
    virtual ~ReceiveSubscriber() = default;

    virtual std::string id() const = 0;

    virtual void log(const std::string& message) { (void)message; }
    virtual void on_connecting(const ConnectingEvent& event) { (void)event; }
    virtual void on_receiving(const ReceivingEvent& event) { (void)event; }
    // Every declared file arrived in full.
    virtual void on_finished() {}
};

using ReceiveRegistry = SubscriberRegistry<ReceiveSubscriber>;
