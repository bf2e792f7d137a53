#include <gtest/gtest.h>
#include "crypto/Digest.hpp"
#include "types/Error.hpp"
#include "TempTree.hpp"

#include <cctype>

using namespace sm::crypto;

namespace {
std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }
}

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(hash::sha256(bytes("")).hex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hash::sha256(bytes("abc")).hex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, DeterministicAndSensitiveToChange) {
    const Sha256Digest d;
    EXPECT_TRUE(Digest::equal(d.digest(bytes("secret")), d.digest(bytes("secret"))));
    EXPECT_FALSE(Digest::equal(d.digest(bytes("secret")), d.digest(bytes("secreT"))));
}

TEST(DigestTest, FileDigestMatchesBufferDigest) {
    const sm::test::TempTree tree;
    std::string big(200000, 'x');
    big[123456] = 'y';
    const auto p = tree.write("big.bin", big);

    const Sha256Digest d;
    EXPECT_EQ(d.digestFile(p), d.digest(bytes(big)));
}

TEST(DigestTest, MissingFileIsIOError) {
    const Sha256Digest d;
    EXPECT_THROW(d.digestFile("/nonexistent/file"), sm::IOError);
}

TEST(DigestTest, HexRoundTrip) {
    const auto v = hash::sha256(bytes("abc"));
    const auto parsed = hash::fromHex(v.hex());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, v);

    std::string upper = v.hex();
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_EQ(hash::fromHex(upper), v);

    EXPECT_FALSE(hash::fromHex("abc").has_value());
    EXPECT_FALSE(hash::fromHex(std::string(64, 'g')).has_value());
}
