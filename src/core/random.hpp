// src/core/random.hpp
// Cryptographically strong randomness for frame masks and handshake keys
//
// Backed by OpenSSL RAND_bytes. Masking keys must be unpredictable
// (RFC 6455 section 5.3).

#pragma once

#include <array>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include <openssl/rand.h>

namespace tinyws {

/**
 * Fill buffer with bytes from the OpenSSL CSPRNG
 *
 * @param out Output buffer
 * @param len Number of bytes
 * @throws std::runtime_error if RAND_bytes() fails (unseeded RNG)
 */
inline void secure_random_bytes(uint8_t* out, size_t len) {
    while (len > 0) {
        int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(out, chunk) != 1) {
            throw std::runtime_error("RAND_bytes() failed");
        }
        out += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

template<size_t N>
inline std::array<uint8_t, N> secure_random_array() {
    std::array<uint8_t, N> out;
    secure_random_bytes(out.data(), out.size());
    return out;
}

} // namespace tinyws
