#include <gtest/gtest.h>
#include "transfer/Engine.hpp"
#include "transfer/Payload.hpp"
#include "crypto/Cipher.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Passphrase.hpp"
#include "fs/Metadata.hpp"
#include "manifest/Manifest.hpp"
#include "rules/Resolver.hpp"
#include "verify/Verifier.hpp"
#include "TempTree.hpp"

using namespace sm;
using namespace sm::transfer;
using namespace sm::types;

namespace stdfs = std::filesystem;

class EngineTest : public ::testing::Test {
protected:
    test::TempTree tree;
    stdfs::path src = tree / "src/something";
    stdfs::path out = tree / "out";
    stdfs::path home = tree / "home/something";
    stdfs::path links = tree / "links";

    std::shared_ptr<const crypto::Digest> digest = std::make_shared<const crypto::Sha256Digest>();

    RuleSet rules;

    void SetUp() override {
        rules.exports["machine1"] = {
            Rule{.source = src.string(), .endpoint = "machine1/something", .files = {"secret1", "secret2"}}
        };
        rules.imports["machine1"] = {
            Rule{.source = "machine1/something", .endpoint = home.string(), .files = {"secret1", "secret2"},
                 .symlinks_to = links}
        };
        tree.write("src/something/secret1", "first secret\n", 0640);
        tree.write("src/something/secret2", "second secret\n", 0600);
    }

    static std::shared_ptr<const crypto::Cipher> cipherFor(const std::string& passphrase) {
        return std::make_shared<const crypto::PassphraseCipher>(
            std::make_shared<const crypto::Passphrase>(passphrase), crypto::util::KdfLimits::minimum());
    }

    [[nodiscard]] std::vector<Operation> ops(const Direction d) const {
        return rules::Resolver::resolve(rules, "machine1", d);
    }

    RunReport doExport(EngineOptions options = {}, const std::string& pass = "pass") const {
        Engine engine(options, digest, cipherFor(pass));
        return engine.runExport(ops(Direction::Export), out);
    }

    RunReport doImport(EngineOptions options = {}, const std::string& pass = "pass") const {
        Engine engine(options, digest, cipherFor(pass));
        return engine.runImport(ops(Direction::Import), out);
    }

    // Ciphertext that decrypts (under IdentityCipher) to a payload whose
    // embedded digest does not match its plaintext, correctly listed in the manifest.
    void forgeCiphertext(const std::string& file, const std::string& plaintext) const {
        const std::vector<uint8_t> plain(plaintext.begin(), plaintext.end());
        const auto wrong = digest->digest(std::vector<uint8_t>{'n', 'o', 'p', 'e'});
        const auto bytes = Payload::seal(plain, wrong);

        const auto dir = out / "machine1/something";
        stdfs::create_directories(dir);
        fs::writeFileAtomic(dir / (file + ".age"), bytes, 0600);

        auto m = manifest::Manifest::load(dir);
        m.upsert(file + ".age", digest->digest(bytes));
        m.save(dir);
    }
};

TEST_F(EngineTest, ExportScenarioVerifiesCleanAndDetectsTamper) {
    const auto report = doExport();

    ASSERT_TRUE(report.ok()) << report.results[0].message;
    EXPECT_EQ(report.count(OperationStatus::Success), 2u);
    ASSERT_TRUE(report.closing.has_value());
    EXPECT_TRUE(report.closing->ok());
    EXPECT_EQ(report.closing->passed.size(), 2u);

    EXPECT_TRUE(stdfs::exists(out / "machine1/something/secret1.age"));
    EXPECT_TRUE(manifest::Manifest::existsIn(out / "machine1/something"));

    const verify::Verifier verifier;
    EXPECT_TRUE(verifier.verify(out).ok());

    test::flipByte(out / "machine1/something/secret1.age", 50);
    const auto after = verifier.verify(out);
    EXPECT_EQ(after.failed, (std::set<stdfs::path>{"machine1/something/secret1.age"}));
    EXPECT_EQ(after.passed, (std::set<stdfs::path>{"machine1/something/secret2.age"}));
}

TEST_F(EngineTest, ExportCopiesOwnerGroupAndMode) {
    ASSERT_TRUE(doExport().ok());

    const auto srcMeta = fs::readMetadata(src / "secret1");
    const auto ctMeta = fs::readMetadata(out / "machine1/something/secret1.age");
    EXPECT_EQ(ctMeta, srcMeta);
    EXPECT_EQ(ctMeta.mode, 0640u);
    EXPECT_EQ(fs::readMetadata(out / "machine1/something/secret2.age").mode, 0600u);
}

TEST_F(EngineTest, ExportIsIdempotentOverwrite) {
    ASSERT_TRUE(doExport().ok());
    tree.write("src/something/secret1", "rotated\n", 0640);
    ASSERT_TRUE(doExport().ok());

    ASSERT_TRUE(doImport().ok());
    EXPECT_EQ(tree.read(home / "secret1"), "rotated\n");
}

TEST_F(EngineTest, ImportRestoresContentMetadataAndLinks) {
    ASSERT_TRUE(doExport().ok());

    const auto report = doImport();
    ASSERT_TRUE(report.ok());
    EXPECT_FALSE(report.closing.has_value());

    EXPECT_EQ(tree.read(home / "secret1"), "first secret\n");
    EXPECT_EQ(tree.read(home / "secret2"), "second secret\n");
    EXPECT_EQ(fs::readMetadata(home / "secret1"), fs::readMetadata(src / "secret1"));
    EXPECT_EQ(test::modeOf(home / "secret2"), 0600u);

    ASSERT_TRUE(stdfs::is_symlink(links / "secret1"));
    EXPECT_EQ(stdfs::read_symlink(links / "secret1"), home / "secret1");
}

TEST_F(EngineTest, ImportTwiceIsIdempotent) {
    ASSERT_TRUE(doExport().ok());
    ASSERT_TRUE(doImport().ok());
    EXPECT_TRUE(doImport().ok());
}

TEST_F(EngineTest, TamperedCiphertextIsRejectedBeforeDecryption) {
    ASSERT_TRUE(doExport().ok());
    test::flipByte(out / "machine1/something/secret2.age", 60);

    const auto report = doImport();
    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].status, OperationStatus::Success);
    EXPECT_EQ(report.results[1].status, OperationStatus::Failed);
    EXPECT_EQ(report.results[1].kind, ErrorKind::Integrity);

    EXPECT_FALSE(stdfs::exists(home / "secret2"));
    EXPECT_FALSE(stdfs::exists(stdfs::symlink_status(links / "secret2")));
}

TEST_F(EngineTest, CiphertextMissingFromManifestIsIntegrityFailure) {
    ASSERT_TRUE(doExport().ok());
    auto m = manifest::Manifest::load(out / "machine1/something");
    m.erase("secret1.age");
    m.save(out / "machine1/something");

    const auto report = doImport();
    EXPECT_EQ(report.results[0].kind, ErrorKind::Integrity);
    EXPECT_EQ(report.results[1].status, OperationStatus::Success);
}

TEST_F(EngineTest, NoSymlinkWhenPostCheckFails) {
    forgeCiphertext("secret1", "forged content");
    forgeCiphertext("secret2", "forged content");

    Engine engine({}, digest, std::make_shared<const test::IdentityCipher>());
    const auto report = engine.runImport(ops(Direction::Import), out);

    for (const auto& r : report.results) {
        EXPECT_EQ(r.status, OperationStatus::Failed);
        EXPECT_EQ(r.kind, ErrorKind::Integrity);
    }
    EXPECT_FALSE(stdfs::exists(home / "secret1"));
    EXPECT_FALSE(stdfs::exists(stdfs::symlink_status(links / "secret1")));
    EXPECT_FALSE(stdfs::exists(links));

    // no temp files left beside the target
    for (const auto& e : stdfs::directory_iterator(home)) ADD_FAILURE() << "leftover " << e.path();
}

TEST_F(EngineTest, ConflictingLinkIsLinkErrorAndLeftUntouched) {
    ASSERT_TRUE(doExport().ok());
    tree.write("links/secret1", "unrelated file");

    const auto report = doImport();
    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.results[0].status, OperationStatus::Failed);
    EXPECT_EQ(report.results[0].kind, ErrorKind::Link);
    EXPECT_EQ(report.results[1].status, OperationStatus::Success);

    // the plaintext itself was placed and verified
    EXPECT_EQ(tree.read(home / "secret1"), "first secret\n");
    EXPECT_EQ(tree.read(links / "secret1"), "unrelated file");
}

TEST_F(EngineTest, ProtectExistingRefusesDifferentPlaintext) {
    ASSERT_TRUE(doExport().ok());
    tree.write("home/something/secret1", "local edit\n", 0600);

    const auto report = doImport();
    EXPECT_EQ(report.results[0].status, OperationStatus::Failed);
    EXPECT_EQ(report.results[0].kind, ErrorKind::IO);
    EXPECT_EQ(tree.read(home / "secret1"), "local edit\n");
    EXPECT_EQ(report.results[1].status, OperationStatus::Success);

    EXPECT_TRUE(doImport({.protect_existing = false}).ok());
    EXPECT_EQ(tree.read(home / "secret1"), "first secret\n");
}

TEST_F(EngineTest, WrongPassphraseFailsEachOperationAndRunContinues) {
    ASSERT_TRUE(doExport({}, "right").ok());

    const auto report = doImport({}, "wrong");
    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.count(OperationStatus::Failed), 2u);
    for (const auto& r : report.results) EXPECT_EQ(r.kind, ErrorKind::Cipher);
    EXPECT_FALSE(stdfs::exists(home / "secret1"));
}

TEST_F(EngineTest, MissingSourceFailsOnlyThatOperation) {
    stdfs::remove(src / "secret1");

    const auto report = doExport();
    EXPECT_EQ(report.results[0].status, OperationStatus::Failed);
    EXPECT_EQ(report.results[0].kind, ErrorKind::IO);
    EXPECT_EQ(report.results[1].status, OperationStatus::Success);

    const auto m = manifest::Manifest::load(out / "machine1/something");
    EXPECT_FALSE(m.find("secret1.age").has_value());
    EXPECT_TRUE(m.find("secret2.age").has_value());
    ASSERT_TRUE(report.closing.has_value());
    EXPECT_TRUE(report.closing->ok());
}

TEST_F(EngineTest, FailFastCancelsTheRest) {
    stdfs::remove(src / "secret1");

    const auto report = doExport({.fail_fast = true});
    EXPECT_EQ(report.results[0].status, OperationStatus::Failed);
    EXPECT_EQ(report.results[1].status, OperationStatus::Cancelled);
    EXPECT_FALSE(stdfs::exists(out / "machine1/something/secret2.age"));
}

TEST_F(EngineTest, SiblingsRemovedWhenConfigured) {
    stdfs::remove(src / "secret2");

    const auto report = doExport({.remove_siblings_on_failure = true});
    EXPECT_EQ(report.results[0].status, OperationStatus::RolledBack);
    EXPECT_EQ(report.results[1].status, OperationStatus::Failed);
    EXPECT_FALSE(stdfs::exists(out / "machine1/something/secret1.age"));
    EXPECT_FALSE(manifest::Manifest::load(out / "machine1/something").find("secret1.age").has_value());
}

TEST_F(EngineTest, SiblingsKeptByDefault) {
    stdfs::remove(src / "secret2");

    const auto report = doExport();
    EXPECT_EQ(report.results[0].status, OperationStatus::Success);
    EXPECT_TRUE(stdfs::exists(out / "machine1/something/secret1.age"));
}

TEST_F(EngineTest, InterruptBeforeStartCancelsEverything) {
    const auto flag = std::make_shared<std::atomic<bool>>(true);
    Engine engine({}, digest, cipherFor("pass"), flag);

    const auto report = engine.runExport(ops(Direction::Export), out);
    EXPECT_TRUE(report.interrupted);
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.count(OperationStatus::Cancelled), 2u);
    EXPECT_FALSE(stdfs::exists(out / "machine1"));
}

TEST_F(EngineTest, UnusableManifestAbortsTheRun) {
    tree.write("out/machine1/something/sha256sums.txt", "this is not a manifest\n");

    const auto report = doExport();
    EXPECT_TRUE(report.aborted);
    EXPECT_FALSE(report.abortReason.empty());
    EXPECT_EQ(report.results[0].status, OperationStatus::Failed);
    EXPECT_EQ(report.results[1].status, OperationStatus::Cancelled);
    EXPECT_FALSE(stdfs::exists(out / "machine1/something/secret1.age"));
}

TEST_F(EngineTest, UnrecordedExportRestoresPreviousCiphertext) {
    ASSERT_TRUE(doExport().ok());
    const auto ciphertext = out / "machine1/something/secret1.age";
    const auto before = tree.read(ciphertext);
    const auto modeBefore = test::modeOf(ciphertext);

    tree.write("src/something/secret1", "rotated secret\n", 0640);
    tree.write("out/machine1/something/sha256sums.txt", "this is not a manifest\n");

    const auto report = doExport();
    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(report.results[0].status, OperationStatus::Failed);
    EXPECT_EQ(tree.read(ciphertext), before);
    EXPECT_EQ(test::modeOf(ciphertext), modeBefore);
}

TEST_F(EngineTest, SourceManifestMismatchIsIntegrityFailure) {
    manifest::Manifest m;
    m.upsert("secret1", digest->digest(std::vector<uint8_t>{'o', 'l', 'd'}));
    m.save(src);

    const auto report = doExport();
    EXPECT_EQ(report.results[0].kind, ErrorKind::Integrity);
    EXPECT_EQ(report.results[1].status, OperationStatus::Success);

    EXPECT_TRUE(doExport({.verify_source_manifest = false}).ok());
}

TEST_F(EngineTest, ParallelRunMatchesSequential) {
    std::vector<std::string> files;
    for (int i = 0; i < 12; ++i) {
        files.push_back("key" + std::to_string(i));
        tree.write("src/something/" + files.back(), "value " + std::to_string(i), 0600);
    }
    rules.exports["machine1"][0].files = files;
    rules.imports["machine1"][0].files = files;

    const auto exported = doExport({.jobs = 4});
    ASSERT_TRUE(exported.ok());
    ASSERT_EQ(exported.results.size(), 12u);
    EXPECT_EQ(exported.results[5].operation.source_path, src / "key5");
    EXPECT_EQ(manifest::Manifest::load(out / "machine1/something").size(), 12u);

    const auto imported = doImport({.jobs = 4});
    ASSERT_TRUE(imported.ok());
    EXPECT_EQ(tree.read(home / "key11"), "value 11");
}

TEST_F(EngineTest, BundleWritesRootManifest) {
    const auto exe = tree.write("bin/secrets-manager", "#!/bin/sh\n", 0755);

    Engine engine({}, digest, cipherFor("pass"));
    const auto report = engine.runExport(ops(Direction::Export), out,
                                         Bundle{.config_name = "secrets-manager.yaml",
                                                .config_text = "exports: {}\n",
                                                .executable = exe});
    ASSERT_TRUE(report.ok());
    EXPECT_FALSE(report.bundleError.has_value());

    EXPECT_EQ(tree.read(out / "secrets-manager.yaml"), "exports: {}\n");
    EXPECT_EQ(test::modeOf(out / "secrets-manager"), 0755u);

    const auto root = manifest::Manifest::load(out);
    EXPECT_EQ(root.size(), 2u);
    EXPECT_TRUE(report.closing->passed.contains("secrets-manager.yaml"));
    EXPECT_TRUE(verify::Verifier().verify(out).ok());
}

TEST_F(EngineTest, ImportFromMissingTreeThrows) {
    Engine engine({}, digest, cipherFor("pass"));
    EXPECT_THROW(engine.runImport(ops(Direction::Import), tree / "absent"), IOError);
}
