#include <gtest/gtest.h>

#include "testing.hpp"
#include "transport/ssh_config.hpp"

using testing_util::TempDir;
using testing_util::write_file;

namespace {

const char* kConfig =
    "# comment\n"
    "Host edge-*\n"
    "    HostName %h.lab.example\n"
    "    User ops\n"
    "    Port 2222\n"
    "    IdentityFile ~/.ssh/edge_key\n"
    "\n"
    "Host edge-7 !edge-9\n"
    "    User override_ignored\n"
    "    IdentityFile /keys/second\n"
    "\n"
    "Host bastion\n"
    "    HostName=10.0.0.5\n"
    "\n"
    "Host *\n"
    "    User fallback\n"
    "    Port 22\n";

TEST(SshConfigTest, MergesMatchingBlocksFirstValueWins) {
    testing_util::QuietLogs quiet;
    SshConfig cfg = SshConfig::parse(kConfig);
    SshHostEntry e = cfg.lookup("edge-7");

    ASSERT_TRUE(e.hostname.has_value());
    EXPECT_EQ(*e.hostname, "edge-7.lab.example");
    ASSERT_TRUE(e.user.has_value());
    EXPECT_EQ(*e.user, "ops");
    ASSERT_TRUE(e.port.has_value());
    EXPECT_EQ(*e.port, 2222);

    ASSERT_EQ(e.identity_files.size(), 2u);
    EXPECT_EQ(e.identity_files[0], platform::home_dir() + "/.ssh/edge_key");
    EXPECT_EQ(e.identity_files[1], "/keys/second");
}

TEST(SshConfigTest, NegatedPatternExcludesBlock) {
    testing_util::QuietLogs quiet;
    SshConfig cfg = SshConfig::parse(kConfig);
    SshHostEntry e = cfg.lookup("edge-9");
    ASSERT_EQ(e.identity_files.size(), 1u);
    EXPECT_EQ(*e.user, "ops");
}

TEST(SshConfigTest, WildcardFallbackApplies) {
    testing_util::QuietLogs quiet;
    SshConfig cfg = SshConfig::parse(kConfig);
    SshHostEntry e = cfg.lookup("bastion");
    EXPECT_EQ(*e.hostname, "10.0.0.5");
    EXPECT_EQ(*e.user, "fallback");
    EXPECT_EQ(*e.port, 22);

    SshHostEntry other = cfg.lookup("unrelated");
    EXPECT_FALSE(other.hostname.has_value());
    EXPECT_EQ(*other.user, "fallback");
}

TEST(SshConfigTest, PatternMatching) {
    EXPECT_TRUE(SshConfig::pattern_match("*", "anything"));
    EXPECT_TRUE(SshConfig::pattern_match("web-?", "web-1"));
    EXPECT_FALSE(SshConfig::pattern_match("web-?", "web-10"));
    EXPECT_TRUE(SshConfig::pattern_match("*.example.com", "a.b.example.com"));
    EXPECT_TRUE(SshConfig::pattern_match("HOST", "host"));
    EXPECT_FALSE(SshConfig::pattern_match("db*", "web1"));
}

TEST(SshConfigTest, MissingFileIsEmpty) {
    testing_util::QuietLogs quiet;
    TempDir dir;
    SshConfig cfg = SshConfig::load(dir.file("does_not_exist"));
    EXPECT_TRUE(cfg.lookup("edge-1").empty());
}

TEST(SshConfigTest, InvalidPortIsRejected) {
    testing_util::QuietLogs quiet;
    TempDir dir;
    write_file(dir.file("config"), "Host x\n  Port 99999\n");
    EXPECT_THROW(SshConfig::load(dir.file("config")), std::runtime_error);
    EXPECT_THROW(SshConfig::parse("Host x\n  Port abc\n"), std::runtime_error);
    EXPECT_THROW(SshConfig::parse("Host x\n  Port 0\n"), std::runtime_error);
    // Wider than 64 bits
    EXPECT_THROW(SshConfig::parse("Host x\n  Port 99999999999999999999999\n"), std::runtime_error);
}

TEST(SshConfigTest, ProxySettingsFirstValueWins) {
    SshConfig cfg = SshConfig::parse(
        "Host inner-*\n"
        "    ProxyJump ops@bastion:2200\n"
        "    ProxyCommand ignored %h\n"
        "Host inner-direct\n"
        "    ProxyCommand none\n"
        "Host legacy\n"
        "    ProxyCommand nc -X connect -x proxy:3128 %h %p\n"
        "Host *\n"
        "    ProxyJump fallback-jump\n");

    SshHostEntry a = cfg.lookup("inner-1");
    ASSERT_TRUE(a.proxy_jump.has_value());
    EXPECT_EQ(*a.proxy_jump, "ops@bastion:2200");
    EXPECT_FALSE(a.proxy_command.has_value());
    EXPECT_EQ(a.proxy(), "ssh -l ops -p 2200 -W '[%h]:%p' bastion");

    SshHostEntry legacy = cfg.lookup("legacy");
    EXPECT_EQ(legacy.proxy(), "nc -X connect -x proxy:3128 %h %p");

    // "inner-direct" also matches inner-*, which comes first
    EXPECT_EQ(cfg.lookup("inner-direct").proxy(), "ssh -l ops -p 2200 -W '[%h]:%p' bastion");

    EXPECT_EQ(cfg.lookup("elsewhere").proxy(), "ssh -W '[%h]:%p' fallback-jump");
}

TEST(SshConfigTest, ProxyNoneMeansDirect) {
    SshConfig cfg = SshConfig::parse(
        "Host lab\n"
        "    ProxyCommand none\n"
        "Host *\n"
        "    ProxyJump bastion\n");
    SshHostEntry e = cfg.lookup("lab");
    EXPECT_FALSE(e.empty());
    EXPECT_EQ(e.proxy(), "");
    EXPECT_EQ(cfg.lookup("other").proxy(), "ssh -W '[%h]:%p' bastion");
}

} // namespace
