/**
 * LMS Utility Functions (RFC 8554 Section 3)
 *
 * Byte-string encodings and the coefficient/checksum helpers shared by
 * LM-OTS and LMS.
 */

#ifndef LMS_UTILS_HPP
#define LMS_UTILS_HPP

#include "params.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>
#include <span>
#include <stdexcept>

namespace lms {

/**
 * u32str(x): append x as 4 bytes, big-endian
 */
inline void append_u32(std::vector<uint8_t>& out, uint32_t x) {
    out.push_back(static_cast<uint8_t>(x >> 24));
    out.push_back(static_cast<uint8_t>(x >> 16));
    out.push_back(static_cast<uint8_t>(x >> 8));
    out.push_back(static_cast<uint8_t>(x));
}

/**
 * u16str(x): append x as 2 bytes, big-endian
 */
inline void append_u16(std::vector<uint8_t>& out, uint16_t x) {
    out.push_back(static_cast<uint8_t>(x >> 8));
    out.push_back(static_cast<uint8_t>(x));
}

inline void append(std::vector<uint8_t>& dest, std::span<const uint8_t> src) {
    dest.insert(dest.end(), src.begin(), src.end());
}

/**
 * Read a big-endian 32-bit value at offset.
 *
 * @throws std::out_of_range if fewer than 4 bytes remain
 */
[[nodiscard]] inline uint32_t load_u32(std::span<const uint8_t> data, size_t offset) {
    if (offset + 4 > data.size()) {
        throw std::out_of_range("Not enough bytes for u32 field");
    }
    return (static_cast<uint32_t>(data[offset]) << 24) |
           (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) |
           static_cast<uint32_t>(data[offset + 3]);
}

/**
 * coef(S, i, w) (RFC 8554 Section 3.1.3)
 *
 * Returns the i-th w-bit value of S, counting from the most significant
 * bits of the first byte.
 *
 * @throws std::out_of_range if the coefficient lies past the end of S
 */
[[nodiscard]] uint32_t coef(std::span<const uint8_t> S, size_t i, size_t w);

/**
 * Cksm(S) (RFC 8554 Section 4.4)
 *
 * S is the n-byte message hash Q.
 */
[[nodiscard]] uint16_t checksum(const LmotsParams& params, std::span<const uint8_t> S);

/**
 * Byte array comparison that always examines every byte.
 */
[[nodiscard]] inline bool ct_equal(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }

    volatile uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff = static_cast<uint8_t>(diff | (a[i] ^ b[i]));
    }

    return diff == 0;
}

/**
 * Generate cryptographically secure random bytes
 * (Implementation in utils.cpp)
 */
[[nodiscard]] std::vector<uint8_t> random_bytes(size_t n);

} // namespace lms

#endif // LMS_UTILS_HPP
