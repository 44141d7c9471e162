#pragma once

// ============================================================
// send_bubble.hpp -- Caller-facing sender session
// ============================================================

#include "send_types.hpp"
#include "../common/transfer_stats.hpp"
#include "../transport/connection.hpp"
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Offers a set of files over one connection. start() runs the session on a
// background thread exactly once; wait() joins it and rethrows its error.
// cancel() tears the connection down, which fails every pending operation.
class SendBubble {
public:
    // An empty profile id is replaced by a generated one. Throws
    // std::invalid_argument for an invalid config or a file without source.
    SendBubble(Profile profile,
               std::vector<SendFile> files,
               ProposedConfig config,
               std::shared_ptr<Connection> conn);
    ~SendBubble();

    SendBubble(const SendBubble&) = delete;
    SendBubble& operator=(const SendBubble&) = delete;

    // Throws AlreadyRunning on every call but the first.
    void start();

    // Block until the session ends; rethrows its failure.
    void wait();

    // Close the connection with the cancellation code.
    void cancel();

    bool is_running() const { return running_.load() && !finished_.load(); }
    bool is_finished() const { return finished_.load(); }

    const Profile& profile() const { return profile_; }
    const std::vector<FileDescriptor>& files() const { return descriptors_; }
    const TransferStats& stats() const { return stats_; }

    void subscribe(std::shared_ptr<SendSubscriber> sub) { subs_.subscribe(std::move(sub)); }
    void unsubscribe(const std::string& id) { subs_.unsubscribe(id); }

private:
    void run();

    Profile                      profile_;
    std::vector<LocalFile>       files_;
    std::vector<FileDescriptor>  descriptors_;
    ProposedConfig               config_;
    std::shared_ptr<Connection>  conn_;

    SendRegistry                 subs_;
    TransferStats                stats_;

    std::atomic<bool>            running_{false};
    std::atomic<bool>            finished_{false};
    std::thread                  worker_;
    std::mutex                   join_mutex_;
    std::exception_ptr           error_;
};
