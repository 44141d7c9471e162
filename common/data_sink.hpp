#pragma once

// ============================================================
// data_sink.hpp -- Push-based byte consumers for the receiver
// ============================================================

#include "platform.hpp"
#include "handshake.hpp"
#include "file_io.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Receives the bytes of several files at once. Chunks of one file arrive
// in order; chunks of different files interleave arbitrarily and may come
// from different threads.
class DataSink {
public:
    virtual ~DataSink() = default;

    // Once, with the sender's file list, before any write.
    virtual void begin(const std::vector<FileDescriptor>& files) = 0;

    // Append len bytes to file id.
    virtual void write(const std::string& id, const u8* data, size_t len) = 0;

    // Once, after every file was received in full.
    virtual void end() = 0;
};

// Collects each file's bytes in memory.
class MemorySink : public DataSink {
public:
    void begin(const std::vector<FileDescriptor>& files) override;
    void write(const std::string& id, const u8* data, size_t len) override;
    void end() override;

    std::vector<u8> bytes(const std::string& id) const;
    std::vector<FileDescriptor> files() const;
    bool ended() const;

private:
    mutable std::mutex                      mutex_;
    std::vector<FileDescriptor>             files_;
    std::map<std::string, std::vector<u8>>  data_;
    bool                                    ended_{false};
};

// Writes one file per descriptor under a root directory. Files are
// preallocated to their declared length and filled through mmap.
class DirectorySink : public DataSink {
public:
    explicit DirectorySink(const std::string& root_dir);
    ~DirectorySink() override;

    void begin(const std::vector<FileDescriptor>& files) override;
    void write(const std::string& id, const u8* data, size_t len) override;
    void end() override;

    // Path chosen for a file id (empty if unknown).
    std::string path_of(const std::string& id) const;

private:
    struct Target {
        std::unique_ptr<file_io::MmapWriter> writer;
        u64 offset{0};
    };

    fs::path                        root_;
    mutable std::mutex              mutex_;
    std::map<std::string, Target>   targets_;
};
