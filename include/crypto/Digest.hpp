#pragma once

#include "crypto/util/hash.hpp"

#include <filesystem>
#include <vector>

namespace sm::crypto {

class Digest {
public:
    virtual ~Digest() = default;

    virtual DigestValue digest(const std::vector<uint8_t>& data) const = 0;
    virtual DigestValue digestFile(const std::filesystem::path& path) const = 0;

    static bool equal(const DigestValue& a, const DigestValue& b) { return a == b; }
};

class Sha256Digest final : public Digest {
public:
    DigestValue digest(const std::vector<uint8_t>& data) const override { return hash::sha256(data); }
    DigestValue digestFile(const std::filesystem::path& path) const override { return hash::sha256(path); }
};

}
