// ============================================================
// data_sink.cpp -- Memory and directory data sinks
// ============================================================

#include "data_sink.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <set>

// ---- MemorySink ----

void MemorySink::begin(const std::vector<FileDescriptor>& files) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_ = files;
    data_.clear();
    for (const auto& f : files) data_.emplace(f.id, std::vector<u8>());
    ended_ = false;
}

void MemorySink::write(const std::string& id, const u8* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(id);
    if (it == data_.end()) {
        throw ProtocolError("sink has no file with id " + id);
    }
    it->second.insert(it->second.end(), data, data + len);
}

void MemorySink::end() {
    std::lock_guard<std::mutex> lock(mutex_);
    ended_ = true;
}

std::vector<u8> MemorySink::bytes(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(id);
    return it == data_.end() ? std::vector<u8>() : it->second;
}

std::vector<FileDescriptor> MemorySink::files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_;
}

bool MemorySink::ended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_;
}

// ---- DirectorySink ----

DirectorySink::DirectorySink(const std::string& root_dir)
    : root_(fs::path(root_dir).lexically_normal()) {}

DirectorySink::~DirectorySink() = default;

void DirectorySink::begin(const std::vector<FileDescriptor>& files) {
    std::lock_guard<std::mutex> lock(mutex_);
    fs::create_directories(root_);

    std::set<std::string> used;
    for (const auto& f : files) {
        fs::path path;
        try {
            path = file_io::safe_join(root_, f.name);
        } catch (const std::invalid_argument& e) {
            throw ProtocolError(std::string("unsafe file name: ") + e.what());
        }

        // A name already taken, by this offer or by a file on disk, becomes
        // "name (n).ext"; existing files are never overwritten.
        std::string candidate = path.string();
        auto taken = [&](const std::string& p) {
            return used.count(p) != 0 || fs::exists(fs::symlink_status(p));
        };
        for (int n = 1; taken(candidate); ++n) {
            fs::path alt = path.parent_path() /
                (path.stem().string() + " (" + std::to_string(n) + ")" + path.extension().string());
            candidate = alt.string();
        }
        used.insert(candidate);

        Target t;
        t.writer = std::make_unique<file_io::MmapWriter>();
        t.writer->open(candidate, f.len);
        targets_[f.id] = std::move(t);
        LOG_DEBUG("Receiving " + f.name + " (" + utils::format_bytes(f.len) + ") into " + candidate);
    }
}

void DirectorySink::write(const std::string& id, const u8* data, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(id);
    if (it == targets_.end()) {
        throw ProtocolError("sink has no file with id " + id);
    }
    Target& t = it->second;
    if (t.offset + len > t.writer->size()) {
        throw ProtocolError("file " + id + " overruns its declared length");
    }
    t.writer->write_at(t.offset, data, len);
    t.offset += len;
}

void DirectorySink::end() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : targets_) {
        kv.second.writer->close();
    }
    LOG_INFO("Wrote " + std::to_string(targets_.size()) + " file(s) under " + root_.string());
}

std::string DirectorySink::path_of(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(id);
    return it == targets_.end() ? std::string() : it->second.writer->path();
}
