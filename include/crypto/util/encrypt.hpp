#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace sm::crypto::util {

constexpr std::string_view FILE_MAGIC = "SMGRENC1";
constexpr size_t KEY_SIZE   = 32;  // XChaCha20-Poly1305
constexpr size_t SALT_SIZE  = 16;  // crypto_pwhash_SALTBYTES
constexpr size_t NONCE_SIZE = 24;  // crypto_aead_xchacha20poly1305_ietf_NPUBBYTES
constexpr size_t TAG_SIZE   = 16;
constexpr size_t HEADER_SIZE = FILE_MAGIC.size() + 2 * sizeof(uint64_t) + SALT_SIZE;

struct KdfLimits {
    uint64_t opslimit = 0;
    size_t memlimit = 0;

    static KdfLimits interactive();
    static KdfLimits moderate();
    static KdfLimits sensitive();
    static KdfLimits minimum();
};

// sodium_init() once per process. Throws on failure.
void ensure_sodium_init();

// Argon2id. Throws CipherError when the limits cannot be satisfied.
std::array<uint8_t, KEY_SIZE> derive_key(std::string_view passphrase,
                                         const std::array<uint8_t, SALT_SIZE>& salt,
                                         const KdfLimits& limits);

// magic | opslimit | memlimit | salt | nonce | xchacha20poly1305(plaintext), header as AAD.
std::vector<uint8_t> encrypt_with_passphrase(const std::vector<uint8_t>& plaintext,
                                             std::string_view passphrase,
                                             const KdfLimits& limits);

// Throws CipherError on bad magic, truncation, limits above sensitive(), wrong passphrase or tampering.
std::vector<uint8_t> decrypt_with_passphrase(const std::vector<uint8_t>& ciphertext,
                                             std::string_view passphrase);

}
