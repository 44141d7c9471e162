// ============================================================
// data_source.cpp -- Memory and mmap-backed data sources
// ============================================================

#include "data_source.hpp"
#include <algorithm>

namespace {

// Copy the next window of [base, base+total) and advance the cursor.
std::vector<u8> take_window(const u8* base, u64 total, u64& pos, u64 size) {
    if (size == 0 || pos >= total) return {};
    u64 n = std::min(size, total - pos);
    std::vector<u8> out(base + pos, base + pos + n);
    pos += n;
    return out;
}

} // namespace

// ---- MemorySource ----

std::optional<u8> MemorySource::read() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pos_ >= data_.size()) return std::nullopt;
    return data_[pos_++];
}

std::vector<u8> MemorySource::read_chunk(u64 size) {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_window(data_.data(), data_.size(), pos_, size);
}

// ---- FileSource ----

FileSource::FileSource(const std::string& path)
    : path_(path), reader_(path) {}

std::optional<u8> FileSource::read() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pos_ >= reader_.size()) return std::nullopt;
    return reader_.data()[pos_++];
}

std::vector<u8> FileSource::read_chunk(u64 size) {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_window(reader_.data(), reader_.size(), pos_, size);
}

// ---- SendFile ----

SendFile SendFile::from_path(const std::string& path) {
    SendFile f;
    f.name   = fs::path(path).filename().string();
    f.source = std::make_shared<FileSource>(path);
    return f;
}

SendFile SendFile::from_bytes(const std::string& name, std::vector<u8> data) {
    SendFile f;
    f.name   = name;
    f.source = std::make_shared<MemorySource>(std::move(data));
    return f;
}
