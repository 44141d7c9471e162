#pragma once

// ============================================================
// compress.hpp -- zstd compression wrapper for chunk payloads
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

// Returns the maximum compressed size for a given input size
inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

// Compress to a resizable buffer; returns compressed data
inline std::vector<u8> compress_to_vec(const void* src, size_t src_len) {
    size_t cap = max_compressed_size(src_len);
    std::vector<u8> buf(cap);
    size_t result = ZSTD_compress(buf.data(), cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(result));
    }
    buf.resize(result);
    return buf;
}

// Decompress a frame that must expand to exactly original_size bytes.
// Corrupt input is reported as a ProtocolError: it came off the wire.
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len, size_t original_size) {
    std::vector<u8> buf(original_size);
    size_t result = ZSTD_decompress(buf.data(), original_size, src, src_len);
    if (ZSTD_isError(result)) {
        throw ProtocolError(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(result));
    }
    if (result != original_size) {
        throw ProtocolError("ZSTD frame expanded to " + std::to_string(result) +
                            " bytes, expected " + std::to_string(original_size));
    }
    return buf;
}

} // namespace compress
