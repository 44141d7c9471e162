// ============================================================
// receive_handler.cpp -- Single-use receiver protocol handler
// ============================================================

#include "receive_handler.hpp"
#include "receive_carrier.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

ReceiveHandler::ReceiveHandler(Profile profile, ProposedConfig config)
    : profile_(std::move(profile))
    , config_(config)
{
    config_.validate();
    if (profile_.id.empty()) profile_.id = utils::generate_id();
}

void ReceiveHandler::accept(std::shared_ptr<Connection> conn) {
    if (!conn) throw std::invalid_argument("ReceiveHandler::accept needs a connection");

    bool expected = false;
    if (!consumed_.compare_exchange_strong(expected, true)) {
        throw NotAllowed("handler already accepted a connection");
    }
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        active_ = conn;
    }
    LOG_INFO("Accepted transfer from " + conn->peer_addr());

    stats_.mark_start();
    ReceiveCarrier carrier(conn, profile_, config_, subs_, stats_);
    std::exception_ptr err;
    try {
        carrier.greet();
        carrier.receive_files();
    } catch (...) {
        err = std::current_exception();
    }
    stats_.mark_end();
    finished_.store(true);
    carrier.finish(!err);

    if (err) {
        std::string msg = "Receive session failed: " + errors::describe(err);
        LOG_ERROR(msg);
        subs_.publish([&](ReceiveSubscriber& s) { s.log(msg); });
        std::rethrow_exception(err);
    }

    LOG_INFO("Receive session finished: " + stats_.summary());
    subs_.publish([](ReceiveSubscriber& s) { s.on_finished(); });
}

void ReceiveHandler::cancel() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        conn = active_;
    }
    if (!conn) return;
    LOG_INFO("Cancelling receive from " + conn->peer_addr());
    conn->close(ARKDROP_CLOSE_CANCELLED, ARKDROP_CANCELLED_REASON);
}
