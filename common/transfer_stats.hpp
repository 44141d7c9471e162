#pragma once

// ============================================================
// transfer_stats.hpp -- Live counters for one transfer session
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <atomic>
#include <cstdio>
#include <string>

// Updated from file tasks, read from any thread.
struct TransferStats {
    std::atomic<u64> bytes_raw{0};      // file bytes moved
    std::atomic<u64> bytes_wire{0};     // chunk payload bytes after compression
    std::atomic<u32> chunks{0};
    std::atomic<u32> files_done{0};
    std::atomic<u32> files_total{0};
    std::atomic<u32> active_streams{0};
    std::atomic<u32> peak_streams{0};
    std::atomic<u64> start_ms{0};
    std::atomic<u64> end_ms{0};

    void mark_start() { start_ms = utils::now_ms(); }
    void mark_end()   { end_ms = utils::now_ms(); }

    void stream_opened() {
        u32 now = ++active_streams;
        u32 peak = peak_streams.load();
        while (now > peak && !peak_streams.compare_exchange_weak(peak, now)) {}
    }
    void stream_closed() { --active_streams; }

    double elapsed_sec() const {
        u64 s = start_ms.load();
        if (s == 0) return 0.0;
        u64 e = end_ms.load();
        if (e == 0) e = utils::now_ms();
        return e > s ? (double)(e - s) / 1000.0 : 0.0;
    }

    // e.g. "2/2 files, 1.50 MB in 0.8s (1.87 MB/s), 1.20 MB on wire"
    std::string summary() const {
        double secs = elapsed_sec();
        u64 raw = bytes_raw.load();
        std::string s = std::to_string(files_done.load()) + "/" +
                        std::to_string(files_total.load()) + " files, " +
                        utils::format_bytes(raw);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fs", secs);
        s += std::string(" in ") + buf;
        if (secs > 0.0) s += " (" + utils::format_speed((double)raw / secs) + ")";
        s += ", " + utils::format_bytes(bytes_wire.load()) + " on wire";
        return s;
    }
};

// Keeps active_streams balanced on every exit path of a file task.
class StreamSlot {
public:
    explicit StreamSlot(TransferStats& stats) : stats_(stats) { stats_.stream_opened(); }
    ~StreamSlot() { stats_.stream_closed(); }

    StreamSlot(const StreamSlot&) = delete;
    StreamSlot& operator=(const StreamSlot&) = delete;

private:
    TransferStats& stats_;
};
