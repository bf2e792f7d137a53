#include "crypto/util/hash.hpp"
#include "crypto/util/encrypt.hpp"
#include "types/Error.hpp"

#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace sm::crypto {

std::string DigestValue::hex() const {
    std::ostringstream result;
    for (const auto b : bytes)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    return result.str();
}

bool DigestValue::operator==(const DigestValue& other) const {
    return sodium_memcmp(bytes.data(), other.bytes.data(), bytes.size()) == 0;
}

}

namespace sm::crypto::hash {

DigestValue sha256(const std::vector<uint8_t>& data) {
    util::ensure_sodium_init();
    DigestValue out;
    crypto_hash_sha256(out.bytes.data(), data.data(), data.size());
    return out;
}

DigestValue sha256(const std::filesystem::path& filepath) {
    util::ensure_sodium_init();

    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw IOError("failed to open file for hashing: " + filepath.string());

    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        crypto_hash_sha256_update(&state, reinterpret_cast<unsigned char*>(buffer),
                                  static_cast<unsigned long long>(file.gcount()));
    }
    if (file.bad()) throw IOError("failed to read file for hashing: " + filepath.string());

    DigestValue out;
    crypto_hash_sha256_final(&state, out.bytes.data());
    return out;
}

std::optional<DigestValue> fromHex(const std::string_view hex) {
    if (hex.size() != DIGEST_SIZE * 2) return std::nullopt;

    DigestValue out;
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.bytes.data(), out.bytes.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &end) != 0 || bin_len != DIGEST_SIZE || end != hex.data() + hex.size())
        return std::nullopt;
    return out;
}

}
