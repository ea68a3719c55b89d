// *****************************************************************************
// Content Hash Header
// *****************************************************************************

#ifndef __CONTENT_HASH_H__
#define __CONTENT_HASH_H__

// Section 1: Includes
// C++ Standard Library
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

// System Includes
#include <sys/types.h>

// Project Includes
#include <sha2.h>

// Section 2: Defines and Macros
constexpr size_t CONTENT_HASH_HEX_LENGTH = SHA256_DIGEST_LENGTH * 2;

// Section 3: Class Definition
/**
 * SHA-256 over file content. Identical bytes always give the same digest,
 * the manifest carries the lowercase hex form.
 */
class ContentHash
{
public:
    using Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

    ContentHash();

    /**
     * Hashes a complete buffer in one go
     * @param data Content to hash
     */
    explicit ContentHash(std::string_view data);

    virtual ~ContentHash() = default;

    /**
     * Feeds more content, may be called any number of times before finish()
     */
    void update(const void *data, size_t size);

    /**
     * Finalizes the digest, further update() calls are ignored
     */
    const Digest &finish();

    [[nodiscard]] std::string to_string();

    /**
     * Convenience for the common "hash this buffer" case
     * @return lowercase hex digest
     */
    static std::string hex(std::string_view data);

private:
    SHA2_CTX mCtx;
    Digest mDigest{};
    bool mFinished = false;
};

#endif // __CONTENT_HASH_H__
