#pragma once

#include "crypto/util/encrypt.hpp"

#include <memory>
#include <vector>

namespace sm::crypto {

class Passphrase;

class Cipher {
public:
    virtual ~Cipher() = default;

    virtual std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) const = 0;

    // Throws CipherError on wrong passphrase or corrupt input.
    virtual std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext) const = 0;
};

// Argon2id + XChaCha20-Poly1305 under a passphrase held for the run.
class PassphraseCipher final : public Cipher {
public:
    PassphraseCipher(std::shared_ptr<const Passphrase> passphrase, util::KdfLimits limits);

    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) const override;
    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext) const override;

private:
    std::shared_ptr<const Passphrase> passphrase_;
    util::KdfLimits limits_;
};

}
