#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

#include <sodium.h>
#include <fmt/format.h>
#include <cstring>
#include <stdexcept>

namespace sm::crypto::util {

static_assert(SALT_SIZE == crypto_pwhash_SALTBYTES);
static_assert(NONCE_SIZE == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES);
static_assert(KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
static_assert(TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES);

namespace {

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

}

KdfLimits KdfLimits::interactive() {
    return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
}

KdfLimits KdfLimits::moderate() {
    return {crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
}

KdfLimits KdfLimits::sensitive() {
    return {crypto_pwhash_OPSLIMIT_SENSITIVE, crypto_pwhash_MEMLIMIT_SENSITIVE};
}

KdfLimits KdfLimits::minimum() {
    return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}

void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

std::array<uint8_t, KEY_SIZE> derive_key(const std::string_view passphrase,
                                         const std::array<uint8_t, SALT_SIZE>& salt,
                                         const KdfLimits& limits) {
    ensure_sodium_init();

    if (limits.opslimit < crypto_pwhash_OPSLIMIT_MIN || limits.opslimit > crypto_pwhash_OPSLIMIT_MAX ||
        limits.memlimit < crypto_pwhash_MEMLIMIT_MIN || limits.memlimit > crypto_pwhash_MEMLIMIT_MAX)
        throw CipherError("key derivation limits out of range");

    std::array<uint8_t, KEY_SIZE> key{};
    if (crypto_pwhash(key.data(), key.size(),
                      passphrase.data(), passphrase.size(),
                      salt.data(), limits.opslimit, limits.memlimit,
                      crypto_pwhash_ALG_ARGON2ID13) != 0) {
        log::Registry::crypto()->error("[derive_key] Argon2id failed (opslimit = {}, memlimit = {})",
                                       limits.opslimit, limits.memlimit);
        throw CipherError("key derivation failed (out of memory?)");
    }
    return key;
}

std::vector<uint8_t> encrypt_with_passphrase(const std::vector<uint8_t>& plaintext,
                                             const std::string_view passphrase,
                                             const KdfLimits& limits) {
    ensure_sodium_init();

    std::array<uint8_t, SALT_SIZE> salt{};
    randombytes_buf(salt.data(), salt.size());

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + NONCE_SIZE + plaintext.size() + TAG_SIZE);
    out.insert(out.end(), FILE_MAGIC.begin(), FILE_MAGIC.end());
    put_u64(out, limits.opslimit);
    put_u64(out, limits.memlimit);
    out.insert(out.end(), salt.begin(), salt.end());

    std::array<uint8_t, NONCE_SIZE> nonce{};
    randombytes_buf(nonce.data(), nonce.size());
    out.insert(out.end(), nonce.begin(), nonce.end());

    auto key = derive_key(passphrase, salt, limits);

    const size_t body = out.size();
    out.resize(body + plaintext.size() + TAG_SIZE);

    unsigned long long ciphertext_len = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        out.data() + body, &ciphertext_len,
        plaintext.data(), plaintext.size(),
        out.data(), HEADER_SIZE,
        nullptr, nonce.data(), key.data());
    sodium_memzero(key.data(), key.size());

    if (rc != 0) throw CipherError("encryption failed");
    out.resize(body + ciphertext_len);
    return out;
}

std::vector<uint8_t> decrypt_with_passphrase(const std::vector<uint8_t>& ciphertext,
                                             const std::string_view passphrase) {
    ensure_sodium_init();

    if (ciphertext.size() < HEADER_SIZE + NONCE_SIZE + TAG_SIZE)
        throw CipherError("ciphertext is truncated");
    if (std::memcmp(ciphertext.data(), FILE_MAGIC.data(), FILE_MAGIC.size()) != 0)
        throw CipherError("ciphertext has an unknown format");

    const uint8_t* p = ciphertext.data() + FILE_MAGIC.size();
    KdfLimits limits;
    limits.opslimit = get_u64(p);
    limits.memlimit = static_cast<size_t>(get_u64(p + 8));

    // The header is only authenticated after the key is derived.
    const auto ceiling = KdfLimits::sensitive();
    if (limits.opslimit > ceiling.opslimit || limits.memlimit > ceiling.memlimit)
        throw CipherError(fmt::format("ciphertext asks for key derivation limits above the accepted maximum "
                                      "(opslimit = {}, memlimit = {})", limits.opslimit, limits.memlimit));

    std::array<uint8_t, SALT_SIZE> salt{};
    std::memcpy(salt.data(), p + 16, SALT_SIZE);

    const uint8_t* nonce = ciphertext.data() + HEADER_SIZE;
    const uint8_t* body = nonce + NONCE_SIZE;
    const size_t body_len = ciphertext.size() - HEADER_SIZE - NONCE_SIZE;

    auto key = derive_key(passphrase, salt, limits);

    std::vector<uint8_t> decrypted(body_len - TAG_SIZE);
    unsigned long long decrypted_len = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        decrypted.data(), &decrypted_len,
        nullptr,
        body, body_len,
        ciphertext.data(), HEADER_SIZE,
        nonce, key.data());
    sodium_memzero(key.data(), key.size());

    if (rc != 0) throw CipherError("decryption failed: wrong passphrase or corrupt ciphertext");

    decrypted.resize(decrypted_len);
    return decrypted;
}

}
