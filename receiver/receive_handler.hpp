#pragma once

// ============================================================
// receive_handler.hpp -- Single-use receiver protocol handler
// ============================================================

#include "receive_types.hpp"
#include "../common/transfer_stats.hpp"
#include "../transport/connection.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Accepts exactly one connection over its lifetime and runs the receive
// session for it on the calling thread.
class ReceiveHandler {
public:
    // An empty profile id is replaced by a generated one. Throws
    // std::invalid_argument for an invalid config.
    ReceiveHandler(Profile profile, ProposedConfig config);

    ReceiveHandler(const ReceiveHandler&) = delete;
    ReceiveHandler& operator=(const ReceiveHandler&) = delete;

    // Run the whole session; returns once every file arrived and the
    // sender closed gracefully, otherwise throws the first real failure.
    // Every connection after the first is rejected with NotAllowed before
    // anything is read from it.
    void accept(std::shared_ptr<Connection> conn);

    // Flip the finished flag; in-flight work is left to the connection.
    void shutdown() { finished_.store(true); }

    // Close the active connection with the cancellation code.
    void cancel();

    bool is_consumed() const { return consumed_.load(); }
    bool is_finished() const { return finished_.load(); }

    const Profile& profile() const { return profile_; }
    const TransferStats& stats() const { return stats_; }

    void subscribe(std::shared_ptr<ReceiveSubscriber> sub) { subs_.subscribe(std::move(sub)); }
    void unsubscribe(const std::string& id) { subs_.unsubscribe(id); }

private:
    Profile          profile_;
    ProposedConfig   config_;
    ReceiveRegistry  subs_;
    TransferStats    stats_;

    std::atomic<bool> consumed_{false};
    std::atomic<bool> finished_{false};

    std::mutex                   conn_mutex_;
    std::shared_ptr<Connection>  active_;
};
