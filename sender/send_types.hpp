#pragma once

// ============================================================
// send_types.hpp -- Sender-side events and observers
// ============================================================

#include "../common/platform.hpp"
#include "../common/handshake.hpp"
#include "../common/data_source.hpp"
#include "../common/subscriber_registry.hpp"
#include <memory>
#include <string>

// Progress of one outgoing file.
struct SendingEvent {
    std::string id;
    std::string name;
    u64 sent{0};
    u64 remaining{0};
};

// Callbacks run on session and file-task threads; keep them cheap.
class SendSubscriber {
public:
    virtual ~SendSubscriber() = default;

    virtual std::string id() const = 0;

    virtual void log(const std::string& message) { (void)message; }
    virtual void on_sending(const SendingEvent& event) { (void)event; }
    virtual void on_connecting(const Profile& receiver) { (void)receiver; }
};

using SendRegistry = SubscriberRegistry<SendSubscriber>;

// A local file with the id it is offered under.
struct LocalFile {
    FileDescriptor desc;
    std::shared_ptr<DataSource> source;
};
