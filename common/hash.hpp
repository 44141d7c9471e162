#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for chunk integrity
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <string>
#include <stdexcept>

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// Compute xxh3_32 (lower 32 bits of xxh3_64) of a memory buffer
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

// Streaming xxh3_64 over one file's chunks, in stream order
class StreamHasher64 {
public:
    StreamHasher64() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher64() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher64(const StreamHasher64&) = delete;
    StreamHasher64& operator=(const StreamHasher64&) = delete;

    void reset() {
        XXH3_64bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_64bits_update(state_, data, len);
    }

    u64 digest() const {
        return XXH3_64bits_digest(state_);
    }

private:
    XXH3_state_t* state_;
};

// 16 lowercase hex digits
inline std::string to_hex(u64 v) {
    static const char digits[] = "0123456789abcdef";
    std::string s(16, '0');
    for (int i = 15; i >= 0; --i) {
        s[(size_t)i] = digits[v & 0xF];
        v >>= 4;
    }
    return s;
}

} // namespace hash
