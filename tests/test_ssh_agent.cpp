#include <gtest/gtest.h>

#include "testing.hpp"
#include "transport/ssh_agent.hpp"

#include <libssh2.h>

#include <cstdlib>

using testing_util::TempDir;

namespace {

// Sets or clears SSH_AUTH_SOCK for one test and restores it afterwards
class AgentSocketEnv {
public:
    explicit AgentSocketEnv(const char* value) {
        if (const char* old = std::getenv("SSH_AUTH_SOCK")) {
            saved_ = old;
            had_ = true;
        }
        if (value) ::setenv("SSH_AUTH_SOCK", value, 1);
        else       ::unsetenv("SSH_AUTH_SOCK");
    }
    ~AgentSocketEnv() {
        if (had_) ::setenv("SSH_AUTH_SOCK", saved_.c_str(), 1);
        else      ::unsetenv("SSH_AUTH_SOCK");
    }

private:
    std::string saved_;
    bool        had_{false};
};

class SshAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_ = libssh2_session_init();
        ASSERT_NE(session_, nullptr);
    }
    void TearDown() override {
        if (session_) libssh2_session_free(session_);
    }

    testing_util::QuietLogs quiet_;
    LIBSSH2_SESSION*        session_{nullptr};
};

TEST_F(SshAgentTest, NoAgentSocketRecordsNothing) {
    AgentSocketEnv env(nullptr);
    std::vector<std::string> attempted;
    EXPECT_FALSE(agent_userauth(session_, "deploy", "deploy@edge-1", attempted));
    EXPECT_TRUE(attempted.empty());
}

TEST_F(SshAgentTest, UnreachableAgentRecordsNothing) {
    TempDir dir;
    std::string sock = dir.file("agent.sock");   // never created
    AgentSocketEnv env(sock.c_str());
    std::vector<std::string> attempted{"publickey:/k"};
    EXPECT_FALSE(agent_userauth(session_, "deploy", "deploy@edge-1", attempted));
    ASSERT_EQ(attempted.size(), 1u);
    EXPECT_EQ(attempted[0], "publickey:/k");
}

} // namespace
