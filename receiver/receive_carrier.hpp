#pragma once

// ============================================================
// receive_carrier.hpp -- Receiver protocol state machine
// ============================================================

#include "receive_types.hpp"
#include "../common/handshake.hpp"
#include "../common/transfer_stats.hpp"
#include "../transport/connection.hpp"
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Greeting -> Receiving -> Finished over one accepted connection.
class ReceiveCarrier {
public:
    ReceiveCarrier(std::shared_ptr<Connection> conn,
                   Profile profile,
                   ProposedConfig config,
                   const ReceiveRegistry& subscribers,
                   TransferStats& stats);

    // Accept the sender's bidirectional stream and answer its handshake.
    void greet();

    // Accept per-file streams until the sender closes gracefully, then
    // check every declared file arrived in full. Rethrows the first real
    // failure after all file tasks finished.
    void receive_files();

    // Close with 200 "finished" on success, 1 "receive failed" otherwise.
    void finish(bool ok);

    const NegotiatedConfig& negotiated() const { return negotiated_; }
    const SenderHandshake& sender() const { return sender_; }

private:
    struct FileProgress {
        std::string name;
        u64 expected{0};
        u64 received{0};
    };

    void receive_one(RecvStream& stream);
    void fail(std::exception_ptr err);
    void log(const std::string& msg);

    std::shared_ptr<Connection> conn_;
    Profile                     profile_;
    ProposedConfig              config_;
    const ReceiveRegistry&      subs_;
    TransferStats&              stats_;

    SenderHandshake             sender_;
    NegotiatedConfig            negotiated_;
    bool                        greeted_{false};

    std::mutex                          mutex_;
    std::map<std::string, FileProgress> progress_;
    std::exception_ptr                  first_error_;
};
