// ============================================================
// file_io.cpp -- Memory-mapped file I/O implementation
// ============================================================

#include "file_io.hpp"
#include "logger.hpp"
#include <algorithm>
#include <iterator>
#include <cstring>
#include <stdexcept>
#include <string>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + socket_error_str(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    madvise(p, std::min((size_t)size_, (size_t)4*1024*1024), MADV_WILLNEED);
    data_ = static_cast<const u8*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    close();
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    if (is_open()) throw std::logic_error("MmapWriter already open: " + path_);
    path_ = file_path;

    ensure_parent_dirs(file_path);

    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_EXCL, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + socket_error_str(errno));
    }
    size_ = size;
    if (size == 0) return;

    int rc = posix_fallocate(fd_, 0, (off_t)size);
    if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
        int err = errno;
        close();
        throw std::runtime_error("Cannot size file " + file_path + ": " + socket_error_str(err));
    }

    void* p = mmap(nullptr, (size_t)size, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        close();
        throw std::runtime_error("mmap(write) failed: " + file_path);
    }
    data_ = static_cast<u8*>(p);
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw std::out_of_range("MmapWriter::write_at out of bounds for " + path_);
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
    if (data_ && size_ > 0) {
        if (msync(data_, (size_t)size_, MS_SYNC) != 0) {
            LOG_WARN("msync failed for " + path_ + ": " + socket_error_str(errno));
        }
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
}

// ============================================================
// Utility functions
// ============================================================

fs::path file_io::safe_join(const fs::path& root_dir, const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Empty file name");
    }
    fs::path rel(name);
    if (rel.is_absolute() || name[0] == '/' || name[0] == '\\') {
        throw std::invalid_argument("Absolute path rejected: " + name);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw std::invalid_argument("Path traversal rejected: " + name);
        }
    }

    fs::path root = root_dir.lexically_normal();
    fs::path full = (root / rel).lexically_normal();

    // Verify result is still under root_dir
    auto mismatch = std::mismatch(root.begin(), root.end(), full.begin(), full.end());
    bool under_root = mismatch.first == root.end() ||
                      (std::next(mismatch.first) == root.end() && mismatch.first->empty());
    // "." or "dir/." normalise to a directory path with a trailing separator.
    if (!under_root || full == root || !full.has_filename()) {
        throw std::invalid_argument("Path escapes root directory: " + name);
    }
    return full;
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}
