#pragma once

#include "crypto/util/hash.hpp"

#include <cstdint>
#include <vector>

namespace sm::transfer {

// Plaintext handed to the cipher: version | sha256(plaintext) | plaintext.
// The digest only becomes readable after decryption.
struct Payload {
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 1 + crypto::DIGEST_SIZE;

    crypto::DigestValue digest;
    std::vector<uint8_t> plaintext;

    static std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext, const crypto::DigestValue& digest);

    // Throws CipherError when the decrypted bytes are not a payload.
    static Payload open(const std::vector<uint8_t>& decrypted);
};

}
