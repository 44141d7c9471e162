#pragma once

// ============================================================
// platform.hpp -- POSIX socket/OS abstraction and portable types
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <netdb.h>

using socket_t = int;
#define ARKDROP_INVALID_SOCKET (-1)
#define ARKDROP_SOCKET_ERROR   (-1)
#define ARKDROP_CLOSE_SOCKET(s) ::close(s)

inline int last_socket_error() { return errno; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
