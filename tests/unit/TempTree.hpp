#pragma once

#include "crypto/Cipher.hpp"
#include "fs/files.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace sm::test {

namespace stdfs = std::filesystem;

// Scratch directory removed at the end of the test.
class TempTree {
public:
    TempTree() {
        std::random_device rd;
        root_ = stdfs::temp_directory_path() / ("sm-test-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
        stdfs::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        stdfs::permissions(root_, stdfs::perms::owner_all, stdfs::perm_options::add, ec);
        stdfs::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const stdfs::path& root() const { return root_; }
    [[nodiscard]] stdfs::path operator/(const stdfs::path& rel) const { return root_ / rel; }

    stdfs::path write(const stdfs::path& rel, const std::string& content, const mode_t mode = 0600) const {
        const auto p = root_ / rel;
        stdfs::create_directories(p.parent_path());
        sm::fs::writeFileAtomic(p, {content.begin(), content.end()}, mode);
        return p;
    }

    [[nodiscard]] std::string read(const stdfs::path& rel) const {
        return sm::fs::readFileToString(rel.is_absolute() ? rel : root_ / rel);
    }

private:
    stdfs::path root_;
};

inline mode_t modeOf(const stdfs::path& p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) return 0;
    return st.st_mode & 07777;
}

inline void flipByte(const stdfs::path& p, const size_t offset) {
    auto bytes = sm::fs::readFileToVector(p);
    bytes.at(offset) ^= 0x5a;
    sm::fs::writeFileAtomic(p, bytes, modeOf(p));
}

// Stores the payload as-is, so tests can forge what "decrypts" to anything.
class IdentityCipher final : public crypto::Cipher {
public:
    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) const override { return plaintext; }
    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext) const override { return ciphertext; }
};

}
