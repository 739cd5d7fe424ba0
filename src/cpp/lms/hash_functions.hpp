/**
 * LMS Hash Function (RFC 8554 Section 3.2, SP 800-208 Section 4.2)
 *
 * SHA-256 for n=32 and SHA-256/192 (SHA-256 truncated to 24 bytes) for n=24.
 */

#ifndef LMS_HASH_FUNCTIONS_HPP
#define LMS_HASH_FUNCTIONS_HPP

#include <vector>
#include <span>
#include <cstdint>
#include <cstddef>

// Avoid pulling OpenSSL headers into every translation unit
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace lms {

/**
 * Incremental hash with an n-byte output.
 *
 * The context is reset after every final() so one instance can be reused
 * for the many short hashes of a Winternitz chain.
 */
class HashFunction {
public:
    explicit HashFunction(size_t n);
    ~HashFunction();

    // Prevent copying
    HashFunction(const HashFunction&) = delete;
    HashFunction& operator=(const HashFunction&) = delete;

    HashFunction& update(std::span<const uint8_t> data);
    HashFunction& update_u32(uint32_t x);
    HashFunction& update_u16(uint16_t x);
    HashFunction& update_u8(uint8_t x);

    /**
     * Finish the hash and write n bytes to out.
     */
    void final(std::span<uint8_t> out);

    [[nodiscard]] std::vector<uint8_t> final();

    [[nodiscard]] size_t n() const noexcept { return n_; }

private:
    void reset();

    EVP_MD_CTX* ctx_;
    size_t n_;
};

} // namespace lms

#endif // LMS_HASH_FUNCTIONS_HPP
