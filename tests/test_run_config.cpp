#include <gtest/gtest.h>

#include "app/run_config.hpp"
#include "testing.hpp"

using testing_util::TempDir;
using testing_util::write_file;

namespace {

const char* kFull = R"({
  "env_files": ["deploy.env"],
  "env": { "REMOTE_DIR": "/srv/images" },
  "state_dir": "${STATE}",
  "artifact": {
    "local_path": "/data/images.tar.zst",
    "remote_path": "${REMOTE_DIR}/images.tar.zst",
    "source": "/data/images.tar"
  },
  "transport": {
    "options": { "user": "${DEPLOY_USER}", "port": "2222", "allow_agent": "false" },
    "known_hosts": "/etc/cargoline/known_hosts"
  },
  "resume": { "retention_days": 3 },
  "post_instructions": { "command": "docker load -i {tar_path}", "use_sudo": true },
  "targets": [
    { "host": "edge-1" },
    { "host": "edge-2", "user": "low", "port": 2200,
      "transport": { "options": { "user": "mid", "key_file": "/keys/mid" } },
      "ssh_options": { "user": "high" },
      "post_instructions": { "type": "command", "options": { "command": "echo {tar_path}" } } },
    { "user": "orphan" }
  ]
})";

TEST(RunConfigTest, ParsesLayersAndTargets) {
    testing_util::QuietLogs quiet;
    TempDir dir;
    write_file(dir.file("deploy.env"), "DEPLOY_USER=ops\nREMOTE_DIR=/ignored\n");

    RunConfig cfg = RunConfig::parse(kFull, dir.path(), {{"STATE", "/var/lib/cargoline"}});
    EXPECT_EQ(cfg.state_dir, "/var/lib/cargoline");
    EXPECT_EQ(cfg.env.at("DEPLOY_USER"), "ops");
    EXPECT_EQ(cfg.env.at("REMOTE_DIR"), "/srv/images");
    EXPECT_EQ(cfg.artifact.remote_path, "/srv/images/images.tar.zst");
    EXPECT_EQ(cfg.artifact.source, "/data/images.tar");
    EXPECT_EQ(*cfg.transport.user, "ops");
    EXPECT_EQ(*cfg.transport.port, 2222);
    EXPECT_FALSE(*cfg.transport.allow_agent);
    EXPECT_EQ(cfg.known_hosts, "/etc/cargoline/known_hosts");
    EXPECT_EQ(cfg.retention_days, 3);

    const auto* global_cmd = std::get_if<RemoteCommand>(&cfg.post);
    ASSERT_NE(global_cmd, nullptr);
    EXPECT_TRUE(global_cmd->use_sudo);

    // Host-less entries are dropped
    ASSERT_EQ(cfg.targets.size(), 2u);
    EXPECT_FALSE(cfg.targets[0].target.options.user.has_value());
    EXPECT_FALSE(has_post_action(cfg.targets[0].post));

    const Target& t2 = cfg.targets[1].target;
    EXPECT_EQ(*t2.options.user, "high");
    EXPECT_EQ(*t2.options.port, 2200);
    EXPECT_EQ(*t2.options.key_file, "/keys/mid");
    const auto* per = std::get_if<RemoteCommand>(&cfg.targets[1].post);
    ASSERT_NE(per, nullptr);
    EXPECT_EQ(per->command, "echo {tar_path}");

    EXPECT_TRUE(cfg.validate().empty());
}

TEST(RunConfigTest, ValidateReportsProblems) {
    RunConfig cfg = RunConfig::parse(R"({"artifact": {"local_path": "/a", "source": "/a"}})", "", {});
    auto problems = cfg.validate();
    ASSERT_EQ(problems.size(), 3u);
    EXPECT_EQ(problems[0], "no targets specified");
    EXPECT_EQ(problems[1], "artifact.remote_path is required");
    EXPECT_EQ(problems[2], "artifact.source and artifact.local_path must differ");
}

TEST(RunConfigTest, RejectsBadValues) {
    EXPECT_THROW(RunConfig::parse("{not json", "", {}), std::runtime_error);
    EXPECT_THROW(RunConfig::parse("[]", "", {}), std::runtime_error);
    EXPECT_THROW(RunConfig::parse(R"({"targets": [{"host": "h", "port": 70000}]})", "", {}),
                 std::runtime_error);
    EXPECT_THROW(RunConfig::parse(R"({"targets": [{"host": "h", "port": "abc"}]})", "", {}),
                 std::runtime_error);
    EXPECT_THROW(RunConfig::parse(R"({"post_instructions": {"use_sudo": true}})", "", {}),
                 std::runtime_error);
    EXPECT_THROW(RunConfig::parse(R"({"targets": {"host": "h"}})", "", {}), std::runtime_error);
}

TEST(RunConfigTest, OversizedNumbersAreConfigErrors) {
    auto message_of = [](const char* doc) -> std::string {
        try {
            RunConfig::parse(doc, "", {});
        } catch (const std::runtime_error& e) {
            return e.what();
        }
        return "";
    };
    EXPECT_EQ(message_of(R"({"targets": [{"host": "h", "port": "99999999999999999999999"}]})"),
              "config: targets[0].port: expected an integer, got '99999999999999999999999'");
    EXPECT_EQ(message_of(R"({"targets": [{"host": "h", "port": 18446744073709551615}]})"),
              "config: targets[0].port: out of range");
    EXPECT_EQ(message_of(R"({"targets": [{"host": "h", "port": 4294967318}]})"),
              "config: targets[0].port: out of range");
}

TEST(RunConfigTest, TimeoutIsBounded) {
    RunConfig ok = RunConfig::parse(R"({"transport": {"options": {"timeout": 86400}}})", "", {});
    EXPECT_EQ(*ok.transport.timeout_s, 86400);
    EXPECT_THROW(RunConfig::parse(R"({"transport": {"options": {"timeout": 86401}}})", "", {}),
                 std::runtime_error);
    EXPECT_THROW(RunConfig::parse(R"({"transport": {"options": {"timeout": 3000000000}}})", "", {}),
                 std::runtime_error);
    EXPECT_THROW(RunConfig::parse(R"({"transport": {"options": {"timeout": "0"}}})", "", {}),
                 std::runtime_error);
}

TEST(RunConfigTest, RequiredVariableFailsParse) {
    EXPECT_THROW(RunConfig::parse(R"({"artifact": {"local_path": "${ART:?artifact path}"}})", "", {}),
                 std::runtime_error);
}

TEST(RunConfigTest, LoadResolvesEnvFilesNextToConfig) {
    testing_util::QuietLogs quiet;
    TempDir dir;
    write_file(dir.file("conf/site.env"), "TARGET_HOST=edge-9\n");
    write_file(dir.file("conf/run.json"), R"({
      "env_files": ["site.env"],
      "artifact": {"local_path": "/a.tar", "remote_path": "/tmp/a.tar"},
      "targets": [{"host": "$TARGET_HOST"}]
    })");

    RunConfig cfg = RunConfig::load(dir.file("conf/run.json"));
    EXPECT_EQ(cfg.config_path, dir.file("conf/run.json"));
    ASSERT_EQ(cfg.targets.size(), 1u);
    EXPECT_EQ(cfg.targets[0].target.host, "edge-9");
    EXPECT_THROW(RunConfig::load(dir.file("conf/absent.json")), std::runtime_error);
}

} // namespace
