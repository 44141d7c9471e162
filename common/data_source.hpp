#pragma once

// ============================================================
// data_source.hpp -- Pull-based byte providers for the sender
// ============================================================

#include "platform.hpp"
#include "file_io.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Sequential reader over a fixed-length byte sequence. Reads advance a
// shared cursor; implementations are safe to call from several threads.
class DataSource {
public:
    virtual ~DataSource() = default;

    // Total number of bytes the source will yield.
    virtual u64 len() const = 0;

    // Next single byte, or nullopt at the end.
    virtual std::optional<u8> read() = 0;

    // Up to size bytes from the cursor; empty at the end or when size is 0.
    virtual std::vector<u8> read_chunk(u64 size) = 0;
};

// Owns its bytes in memory.
class MemorySource : public DataSource {
public:
    explicit MemorySource(std::vector<u8> data) : data_(std::move(data)) {}
    explicit MemorySource(const std::string& text) : data_(text.begin(), text.end()) {}

    u64 len() const override { return data_.size(); }
    std::optional<u8> read() override;
    std::vector<u8> read_chunk(u64 size) override;

private:
    std::vector<u8> data_;
    std::mutex      mutex_;
    u64             pos_{0};
};

// Read-only mapping of a file on disk. The length is fixed at open time.
class FileSource : public DataSource {
public:
    explicit FileSource(const std::string& path);

    u64 len() const override { return reader_.size(); }
    std::optional<u8> read() override;
    std::vector<u8> read_chunk(u64 size) override;

    const std::string& path() const { return path_; }

private:
    std::string          path_;
    file_io::MmapReader  reader_;
    std::mutex           mutex_;
    u64                  pos_{0};
};

// A file offered by the sender: display name plus where its bytes come from.
struct SendFile {
    std::string id;     // empty: the session generates one
    std::string name;
    std::shared_ptr<DataSource> source;

    static SendFile from_path(const std::string& path);
    static SendFile from_bytes(const std::string& name, std::vector<u8> data);
};
