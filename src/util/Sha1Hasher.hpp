#pragma once

#include "util/IHasher.hpp"
#include <cstdint>

namespace gitcl {

/**
 * @brief SHA-1 hash implementation
 *
 * Produces the 160-bit (20-byte) digests git uses as object ids.
 * Streaming: update() may be called any number of times before digest().
 */
class Sha1Hasher : public IHasher {
public:
    Sha1Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "sha1"; }
    size_t digestSize() const override { return 20; }

private:
    void transform(const uint8_t* chunk);

    uint32_t state[5];      // Hash state (A, B, C, D, E)
    uint64_t bitlen;        // Total bits processed in full blocks
    uint8_t buffer[64];     // Pending block buffer
    size_t bufferLen;       // Current buffer fill
};

}
