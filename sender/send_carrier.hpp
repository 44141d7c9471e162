#pragma once

// ============================================================
// send_carrier.hpp -- Sender protocol state machine
// ============================================================

#include "send_types.hpp"
#include "../common/handshake.hpp"
#include "../common/transfer_stats.hpp"
#include "../transport/connection.hpp"
#include <memory>
#include <string>
#include <vector>

// Greeting -> Streaming -> Finished over one connection. The owner calls
// greet() and send_files() and must call finish() on every path.
class SendCarrier {
public:
    SendCarrier(std::shared_ptr<Connection> conn,
                Profile profile,
                std::vector<LocalFile> files,
                ProposedConfig config,
                const SendRegistry& subscribers,
                TransferStats& stats);

    // Handshake on a fresh bidirectional stream; fixes negotiated().
    void greet();

    // One unidirectional stream per file, at most parallel_streams at once.
    // Rethrows the first file failure after every spawned task finished.
    void send_files();

    // Close with the graceful termination code. Idempotent.
    void finish();

    const NegotiatedConfig& negotiated() const { return negotiated_; }
    const Profile& receiver() const { return receiver_; }

private:
    void send_one(const LocalFile& file);
    void log(const std::string& msg);
    void publish_progress(const LocalFile& file, u64 sent);

    std::shared_ptr<Connection> conn_;
    Profile                     profile_;
    std::vector<LocalFile>      files_;
    ProposedConfig              config_;
    const SendRegistry&         subs_;
    TransferStats&              stats_;

    NegotiatedConfig            negotiated_;
    Profile                     receiver_;
    bool                        greeted_{false};
};
