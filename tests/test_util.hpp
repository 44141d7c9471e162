#pragma once

// ============================================================
// test_util.hpp -- Shared fixtures for the arkdrop tests
// ============================================================

#include "common/data_source.hpp"
#include "common/framing.hpp"
#include "common/handshake.hpp"
#include "common/protocol_io.hpp"
#include "receiver/receive_types.hpp"
#include "sender/send_types.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace testing_util {

inline std::vector<u8> bytes_of(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

inline std::vector<u8> random_bytes(size_t n, u32 seed) {
    std::mt19937 rng(seed);
    std::vector<u8> out(n);
    for (auto& b : out) b = (u8)(rng() & 0xFF);
    return out;
}

// Compresses well: long runs of a short pattern.
inline std::vector<u8> repetitive_bytes(size_t n) {
    std::vector<u8> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = (u8)("arkdrop-"[i % 8]);
    return out;
}

inline ProposedConfig config_of(u64 chunk, u32 streams, bool compression = false) {
    ProposedConfig c;
    c.chunk_size       = chunk;
    c.parallel_streams = streams;
    c.compression      = compression;
    return c;
}

inline Profile profile_of(const std::string& id, const std::string& name) {
    Profile p;
    p.id   = id;
    p.name = name;
    return p;
}

class RecordingReceiver : public ReceiveSubscriber {
public:
    explicit RecordingReceiver(std::string id = "recorder") : id_(std::move(id)) {}

    std::string id() const override { return id_; }

    void log(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        logs.push_back(message);
    }
    void on_connecting(const ConnectingEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex);
        sender = event.sender;
        files  = event.files;
        ++connecting_count;
    }
    void on_receiving(const ReceivingEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex);
        chunks[event.id].push_back(event.data);
    }
    void on_finished() override { finished = true; }

    std::vector<u8> joined(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<u8> out;
        for (const auto& c : chunks[id]) out.insert(out.end(), c.begin(), c.end());
        return out;
    }

    std::mutex mutex;
    std::vector<std::string> logs;
    Profile sender;
    std::vector<FileDescriptor> files;
    int connecting_count{0};
    std::map<std::string, std::vector<std::vector<u8>>> chunks;
    std::atomic<bool> finished{false};

private:
    std::string id_;
};

// Records progress and tracks how many files are between their first
// (sent == 0) and last (remaining == 0) progress event.
class RecordingSender : public SendSubscriber {
public:
    explicit RecordingSender(std::string id = "recorder") : id_(std::move(id)) {}

    std::string id() const override { return id_; }

    void log(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        logs.push_back(message);
    }
    void on_connecting(const Profile& p) override {
        std::lock_guard<std::mutex> lock(mutex);
        receiver = p;
        ++connecting_count;
    }
    void on_sending(const SendingEvent& ev) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(ev);
        if (ev.sent == 0) {
            ++open_files;
            peak_open = std::max(peak_open, open_files);
        }
        if (ev.remaining == 0) --open_files;
    }

    std::vector<SendingEvent> events_for(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<SendingEvent> out;
        for (const auto& e : events) if (e.id == id) out.push_back(e);
        return out;
    }

    std::mutex mutex;
    std::vector<std::string> logs;
    std::vector<SendingEvent> events;
    Profile receiver;
    int connecting_count{0};
    int open_files{0};
    int peak_open{0};

private:
    std::string id_;
};

// A memory source that sleeps before every chunk, keeping file tasks
// alive long enough to overlap.
class SlowSource : public DataSource {
public:
    SlowSource(std::vector<u8> data, std::chrono::milliseconds delay)
        : inner_(std::move(data)), delay_(delay) {}

    u64 len() const override { return inner_.len(); }
    std::optional<u8> read() override { return inner_.read(); }
    std::vector<u8> read_chunk(u64 size) override {
        std::this_thread::sleep_for(delay_);
        return inner_.read_chunk(size);
    }

private:
    MemorySource inner_;
    std::chrono::milliseconds delay_;
};

// Plays the sender's side of the handshake by hand.
inline NegotiatedConfig greet_as_sender(Connection& conn,
                                        const std::vector<FileDescriptor>& files,
                                        const ProposedConfig& config) {
    BiStream bi = conn.open_bi();
    SenderHandshake hs;
    hs.profile = profile_of("sender-id", "sender");
    hs.files   = files;
    hs.config  = config;
    framing::write_message(*bi.send, proto::encode_sender_handshake(hs));
    ReceiverHandshake reply = proto::decode_receiver_handshake(framing::read_required(*bi.recv));
    bi.send->finish();
    bi.recv->stop(ARKDROP_STOP_DONE);
    return negotiate(config, reply.config);
}

// Sends raw bytes of one file on a fresh stream as a single chunk.
inline void send_file_chunk(Connection& conn, const std::string& id, const std::vector<u8>& data) {
    auto stream = conn.open_uni();
    framing::write_chunk_message(*stream, framing::project_chunk(id, data, false));
    stream->finish();
    stream->stopped();
}

// Fresh empty directory under the system temp dir.
inline std::filesystem::path temp_dir(const std::string& tag) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("arkdrop-" + tag + "-" + std::to_string(rd()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace testing_util
