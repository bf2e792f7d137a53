#include "transfer/Payload.hpp"
#include "types/Error.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace sm::transfer {

std::vector<uint8_t> Payload::seal(const std::vector<uint8_t>& plaintext, const crypto::DigestValue& digest) {
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + plaintext.size());
    out.push_back(VERSION);
    out.insert(out.end(), digest.bytes.begin(), digest.bytes.end());
    out.insert(out.end(), plaintext.begin(), plaintext.end());
    return out;
}

Payload Payload::open(const std::vector<uint8_t>& decrypted) {
    if (decrypted.size() < HEADER_SIZE) throw CipherError("decrypted payload is truncated");
    if (decrypted[0] != VERSION)
        throw CipherError(fmt::format("unsupported payload version {}", static_cast<int>(decrypted[0])));

    Payload p;
    std::copy_n(decrypted.begin() + 1, crypto::DIGEST_SIZE, p.digest.bytes.begin());
    p.plaintext.assign(decrypted.begin() + HEADER_SIZE, decrypted.end());
    return p;
}

}
