#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped file I/O
// ============================================================

#include "platform.hpp"
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const u8* data() const { return data_; }
    u64 size() const { return size_; }

    void close();

private:
    const u8* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- MmapWriter: preallocated file written through a shared mapping ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create a new file (fails if it exists), preallocate it to size, then mmap.
    void open(const std::string& path, u64 size);

    // Write data at given offset; throws if it would pass the end
    void write_at(u64 offset, const void* data, size_t len);

    // Flush and unmap
    void close();

    bool is_open() const { return fd_ >= 0; }
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    u8*  data_{nullptr};
    u64  size_{0};
    int  fd_{-1};
    std::string path_;
};

// ---- Utility functions ----

// Join a peer-supplied file name under root_dir. Rejects empty names,
// absolute paths and any ".." component. Throws std::invalid_argument.
fs::path safe_join(const fs::path& root_dir, const std::string& name);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

} // namespace file_io
