#include <gtest/gtest.h>
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/Session.hpp"
#include "shell/argsHelpers.hpp"
#include "shell/commands.hpp"
#include "types/Error.hpp"
#include "TempTree.hpp"

#include <fmt/core.h>

using namespace sm::shell;

namespace stdfs = std::filesystem;

TEST(ParserTest, NamePositionalsAndFlags) {
    const auto call = parseArgs({"--profile", "machine1", "export", "/tmp/out", "--json", "--jobs=4"});
    EXPECT_EQ(call.name, "export");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"/tmp/out"}));
    EXPECT_EQ(optVal(call, "profile"), "machine1");
    EXPECT_EQ(optVal(call, "jobs"), "4");
    EXPECT_TRUE(hasFlag(call, "json"));
    EXPECT_FALSE(hasFlag(call, "fail-fast"));
}

TEST(ParserTest, BooleanFlagDoesNotSwallowNextWord) {
    const auto call = parseArgs({"--fail-fast", "import", "/tmp/tree"});
    EXPECT_EQ(call.name, "import");
    EXPECT_TRUE(hasFlag(call, "fail-fast"));
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"/tmp/tree"}));
}

TEST(ParserTest, SentinelEndsFlags) {
    const auto call = parseArgs({"verify-export", "--", "--weird-dir"});
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"--weird-dir"}));
}

TEST(ParserTest, LastValueWins) {
    const auto call = parseArgs({"export", "--jobs", "2", "--jobs", "3", "out"});
    EXPECT_EQ(optVal(call, "jobs"), "3");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"out"}));
}

TEST(ArgsHelpersTest, ParseUInt) {
    EXPECT_EQ(parseUInt("12"), 12u);
    EXPECT_FALSE(parseUInt("").has_value());
    EXPECT_FALSE(parseUInt("-1").has_value());
    EXPECT_FALSE(parseUInt("3x").has_value());
}

TEST(SessionTest, EngineOptionsOverlayFlags) {
    sm::config::SettingsConfig settings;
    settings.jobs = 2;

    auto options = engineOptionsFor(parseArgs({"export", "x"}), settings);
    EXPECT_EQ(options.jobs, 2u);
    EXPECT_FALSE(options.fail_fast);

    options = engineOptionsFor(parseArgs({"export", "x", "--jobs", "8", "--fail-fast"}), settings);
    EXPECT_EQ(options.jobs, 8u);
    EXPECT_TRUE(options.fail_fast);

    EXPECT_THROW(engineOptionsFor(parseArgs({"export", "x", "--jobs", "0"}), settings), sm::ConfigError);
    EXPECT_THROW(engineOptionsFor(parseArgs({"export", "x", "--jobs", "many"}), settings), sm::ConfigError);
}

TEST(SessionTest, ProfileFlagOverridesHostname) {
    EXPECT_EQ(profileFor(parseArgs({"export", "--profile", "machine7"})), "machine7");
    EXPECT_FALSE(profileFor(parseArgs({"export"})).empty());
}

TEST(SessionTest, ExplicitMissingConfigIsConfigError) {
    Session s;
    EXPECT_THROW(s.loadConfig(parseArgs({"export", "--config", "/nonexistent.yaml"})), sm::ConfigError);
}

class CommandsTest : public ::testing::Test {
protected:
    sm::test::TempTree tree;
    std::shared_ptr<Session> session = std::make_shared<Session>();
    Router router;

    void SetUp() override {
        tree.write("src/id_ed25519", "private key\n", 0600);

        const auto yaml = fmt::format(R"(
exports:
  machine1:
    - source: {0}/src
      endpoint: ssh/$profile
      files: [id_ed25519]
imports:
  machine1:
    - source: ssh/$profile
      endpoint: {0}/restored
      files: [id_ed25519]
settings:
  bundle: false
)", tree.root().string());

        session->config = sm::config::parseConfig(yaml);
        session->configLoaded = true;
        session->kdfLimits = sm::crypto::util::KdfLimits::minimum();
        session->passphraseSource = [](bool) { return sm::crypto::Passphrase("test passphrase"); };

        registerAllCommands(router, session);
    }

    CommandResult run(const std::vector<std::string>& args) const { return router.execute(parseArgs(args)); }
};

TEST_F(CommandsTest, ExportVerifyImport) {
    const auto out = (tree / "out").string();

    const auto exported = run({"export", out, "--profile", "machine1"});
    ASSERT_EQ(exported.exit_code, 0) << exported.stdout_text << exported.stderr_text;
    EXPECT_TRUE(exported.has_data);
    EXPECT_EQ(exported.data["succeeded"], 1);
    EXPECT_TRUE(stdfs::exists(tree / "out/ssh/machine1/id_ed25519.age"));

    const auto verified = run({"verify-export", out});
    EXPECT_EQ(verified.exit_code, 0);
    EXPECT_EQ(verified.data["failed"].size(), 0u);

    const auto imported = run({"import", out, "--profile", "machine1"});
    ASSERT_EQ(imported.exit_code, 0) << imported.stdout_text;
    EXPECT_EQ(tree.read("restored/id_ed25519"), "private key\n");
}

TEST_F(CommandsTest, VerifyReportsTamperedPathAndFails) {
    const auto out = (tree / "out").string();
    ASSERT_EQ(run({"export", out, "--profile", "machine1"}).exit_code, 0);

    sm::test::flipByte(tree / "out/ssh/machine1/id_ed25519.age", 70);

    const auto verified = run({"verify-export", out});
    EXPECT_EQ(verified.exit_code, 1);
    EXPECT_NE(verified.stdout_text.find("ssh/machine1/id_ed25519.age"), std::string::npos);
    ASSERT_EQ(verified.data["failed"].size(), 1u);
    EXPECT_EQ(verified.data["failed"][0]["path"], "ssh/machine1/id_ed25519.age");
}

TEST_F(CommandsTest, FailedOperationGivesExitCodeOne) {
    stdfs::remove(tree / "src/id_ed25519");
    const auto res = run({"export", (tree / "out").string(), "--profile", "machine1"});
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_NE(res.stdout_text.find("FAILED"), std::string::npos);
    EXPECT_NE(res.stdout_text.find("ssh/machine1/id_ed25519.age"), std::string::npos);
}

TEST_F(CommandsTest, UnknownProfileHasNothingToDo) {
    const auto res = run({"export", (tree / "out").string(), "--profile", "elsewhere"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_FALSE(stdfs::exists(tree / "out"));
}

TEST_F(CommandsTest, UsageAndConfigErrorsExitTwo) {
    EXPECT_EQ(run({"export"}).exit_code, 2);
    EXPECT_EQ(run({"frobnicate"}).exit_code, 2);
    EXPECT_EQ(run({}).exit_code, 2);
    EXPECT_EQ(run({"export", (tree / "out").string(), "--profile", "shared"}).exit_code, 2);
    EXPECT_EQ(run({"export", (tree / "out").string(), "--profile", "machine1", "--jobs", "0"}).exit_code, 2);
    EXPECT_EQ(run({"import", (tree / "missing").string(), "--profile", "machine1"}).exit_code, 2);
}

TEST_F(CommandsTest, ExportWithoutConfigIsRefused) {
    session->configLoaded = false;
    EXPECT_EQ(run({"export", (tree / "out").string()}).exit_code, 2);
}

TEST_F(CommandsTest, HelpListsCommands) {
    const auto res = run({"help"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("verify-export"), std::string::npos);
    EXPECT_NE(res.stdout_text.find("import <source>"), std::string::npos);
}
