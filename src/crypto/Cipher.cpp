#include "crypto/Cipher.hpp"
#include "crypto/Passphrase.hpp"
#include "types/Error.hpp"

namespace sm::crypto {

PassphraseCipher::PassphraseCipher(std::shared_ptr<const Passphrase> passphrase, const util::KdfLimits limits)
    : passphrase_(std::move(passphrase)), limits_(limits) {
    if (!passphrase_ || passphrase_->empty()) throw CipherError("a passphrase is required");
}

std::vector<uint8_t> PassphraseCipher::encrypt(const std::vector<uint8_t>& plaintext) const {
    return util::encrypt_with_passphrase(plaintext, passphrase_->view(), limits_);
}

std::vector<uint8_t> PassphraseCipher::decrypt(const std::vector<uint8_t>& ciphertext) const {
    return util::decrypt_with_passphrase(ciphertext, passphrase_->view());
}

}
