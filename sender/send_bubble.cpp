// ============================================================
// send_bubble.cpp -- Caller-facing sender session
// ============================================================

#include "send_bubble.hpp"
#include "send_carrier.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <set>
#include <stdexcept>

SendBubble::SendBubble(Profile profile,
                       std::vector<SendFile> files,
                       ProposedConfig config,
                       std::shared_ptr<Connection> conn)
    : profile_(std::move(profile))
    , config_(config)
    , conn_(std::move(conn))
{
    if (!conn_) throw std::invalid_argument("SendBubble needs a connection");
    config_.validate();
    if (profile_.id.empty()) profile_.id = utils::generate_id();

    files_.reserve(files.size());
    descriptors_.reserve(files.size());
    std::set<std::string> ids;
    for (auto& f : files) {
        if (!f.source) throw std::invalid_argument("file " + f.name + " has no data source");
        LocalFile lf;
        lf.desc.id   = f.id.empty() ? utils::generate_id() : f.id;
        if (!ids.insert(lf.desc.id).second) {
            throw std::invalid_argument("duplicate file id " + lf.desc.id);
        }
        lf.desc.name = f.name;
        lf.desc.len  = f.source->len();
        lf.source    = std::move(f.source);
        descriptors_.push_back(lf.desc);
        files_.push_back(std::move(lf));
    }
}

SendBubble::~SendBubble() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_.joinable()) {
        if (!finished_.load()) cancel();
        worker_.join();
    }
}

void SendBubble::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw AlreadyRunning();
    }
    LOG_INFO("Sending " + std::to_string(files_.size()) + " file(s) to " + conn_->peer_addr());
    worker_ = std::thread([this] { run(); });
}

void SendBubble::run() {
    stats_.mark_start();
    SendCarrier carrier(conn_, profile_, files_, config_, subs_, stats_);
    try {
        carrier.greet();
        carrier.send_files();
    } catch (...) {
        error_ = std::current_exception();
    }
    carrier.finish();
    stats_.mark_end();
    finished_.store(true);

    if (error_) {
        LOG_ERROR("Send session failed: " + errors::describe(error_));
    } else {
        LOG_INFO("Send session finished: " + stats_.summary());
    }
}

void SendBubble::wait() {
    if (!running_.load()) throw std::logic_error("SendBubble::wait before start");
    {
        std::lock_guard<std::mutex> lock(join_mutex_);
        if (worker_.joinable()) worker_.join();
    }
    if (error_) std::rethrow_exception(error_);
}

void SendBubble::cancel() {
    LOG_INFO("Cancelling send to " + conn_->peer_addr());
    conn_->close(ARKDROP_CLOSE_CANCELLED, ARKDROP_CANCELLED_REASON);
}
