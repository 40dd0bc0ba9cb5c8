#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gitcl {

/**
 * @brief Strategy interface for the object-id hash algorithm
 *
 * Git object ids, tree entries, packfile trailers and patch ids are all
 * computed through this interface.
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    /// Reset hasher to initial state
    virtual void reset() = 0;

    /// Update hash with raw bytes
    virtual void update(const uint8_t* data, size_t len) = 0;

    /// Update hash with string
    virtual void update(const std::string& data) = 0;

    /// Finalize and return digest bytes (hasher is reset afterwards)
    virtual std::vector<uint8_t> digest() = 0;

    /// Get hash algorithm name (e.g., "sha1")
    virtual const char* name() const = 0;

    /// Get digest size in bytes (20 for SHA-1)
    virtual size_t digestSize() const = 0;

    /// Finalize and return the digest as lowercase hex
    std::string hexDigest() { return toHex(digest()); }

    /// Convert binary hash to lowercase hex string
    static std::string toHex(const std::vector<uint8_t>& bytes);

    /// Convert hex string to raw bytes; returns false on odd length or non-hex input
    static bool fromHex(const std::string& hex, std::vector<uint8_t>& out);
};

class HasherFactory {
public:
    /// SHA-1, the object format git and Gerrit exchange
    static std::unique_ptr<IHasher> createDefault();
};

}
