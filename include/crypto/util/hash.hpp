#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sm::crypto {

constexpr size_t DIGEST_SIZE = 32; // SHA-256

struct DigestValue {
    std::array<uint8_t, DIGEST_SIZE> bytes{};

    [[nodiscard]] std::string hex() const;

    // Constant-time comparison.
    bool operator==(const DigestValue& other) const;
};

}

namespace sm::crypto::hash {

DigestValue sha256(const std::vector<uint8_t>& data);

// Streams the file; throws IOError when it cannot be read.
DigestValue sha256(const std::filesystem::path& filepath);

// Parses 64 hex characters, either case.
std::optional<DigestValue> fromHex(std::string_view hex);

}
