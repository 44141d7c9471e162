#pragma once

// ============================================================
// sink_subscriber.hpp -- Routes receiver events into a DataSink
// ============================================================

#include "receive_types.hpp"
#include "../common/data_sink.hpp"
#include <memory>
#include <stdexcept>
#include <string>

class SinkSubscriber : public ReceiveSubscriber {
public:
    SinkSubscriber(std::string id, std::shared_ptr<DataSink> sink)
        : id_(std::move(id)), sink_(std::move(sink)) {
        if (!sink_) throw std::invalid_argument("SinkSubscriber needs a sink");
    }

    std::string id() const override { return id_; }

    void on_connecting(const ConnectingEvent& event) override { sink_->begin(event.files); }

    void on_receiving(const ReceivingEvent& event) override {
        sink_->write(event.id, event.data.data(), event.data.size());
    }

    void on_finished() override { sink_->end(); }

    DataSink& sink() { return *sink_; }

private:
    std::string               id_;
    std::shared_ptr<DataSink> sink_;
};
