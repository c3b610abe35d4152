#include <gtest/gtest.h>

#include "fake_transport.hpp"
#include "scheduler/transfer_scheduler.hpp"
#include "testing.hpp"

#include <memory>
#include <mutex>

using testing_util::TempDir;
using testing_util::pattern;
using testing_util::read_file;
using testing_util::write_file;

namespace {

class TransferSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote_.root = remote_dir_.file("root");
        local_ = local_dir_.file("bundle.tar.zst");
        write_file(local_, pattern(5000));
        keys_ = std::make_unique<TempDir>();   // no discoverable keys
    }

    std::vector<TransferTask> make_tasks(int n) const {
        std::vector<TransferTask> tasks;
        for (int i = 0; i < n; ++i) {
            TransferTask t;
            t.target.host = "edge-" + std::to_string(i);
            t.local_path  = local_;
            t.remote_path = "/srv/" + t.target.host + "/bundle.tar.zst";
            tasks.push_back(t);
        }
        return tasks;
    }

    testing_util::QuietLogs   quiet_;
    TempDir                   local_dir_;
    TempDir                   remote_dir_;
    TempDir                   state_dir_;
    std::unique_ptr<TempDir>  keys_;
    FakeRemote                remote_;
    std::string               local_;
};

TEST_F(TransferSchedulerTest, ClampConcurrency) {
    EXPECT_EQ(TransferScheduler::clamp_concurrency(0), 1);
    EXPECT_EQ(TransferScheduler::clamp_concurrency(-3), 1);
    EXPECT_EQ(TransferScheduler::clamp_concurrency(1), 1);
    EXPECT_EQ(TransferScheduler::clamp_concurrency(7), 7);
    EXPECT_EQ(TransferScheduler::clamp_concurrency(10), 10);
    EXPECT_EQ(TransferScheduler::clamp_concurrency(50), 10);
}

TEST_F(TransferSchedulerTest, NeverExceedsConcurrencyLimit) {
    remote_.transfer_delay_ms = 2;
    for (int limit : {1, 2, 5, 10}) {
        remote_.peak = 0;
        remote_.opened = 0;
        CredentialResolver resolver(keys_->path());
        FakeOpener opener(remote_);
        ResumeStore store(state_dir_.path());
        TransferScheduler sched(resolver, opener, store, TransportOptions(), nullptr);

        auto outcomes = sched.run(make_tasks(20), limit);
        ASSERT_EQ(outcomes.size(), 20u);
        for (const auto& o : outcomes) EXPECT_TRUE(o.success) << o.target << ": " << o.error;
        EXPECT_EQ(remote_.opened, 20);
        EXPECT_LE(remote_.peak, limit);
        EXPECT_GE(remote_.peak, 1);
        EXPECT_EQ(remote_.active, 0);
    }
}

TEST_F(TransferSchedulerTest, FailuresAreIsolatedPerTarget) {
    remote_.auth_fail_hosts = {"edge-1", "edge-4", "edge-7"};
    CredentialResolver resolver(keys_->path());
    FakeOpener opener(remote_);
    ResumeStore store(state_dir_.path());
    TransportOptions global;
    global.password = "pw";
    TransferScheduler sched(resolver, opener, store, global, nullptr);

    auto tasks = make_tasks(10);
    auto outcomes = sched.run(tasks, 3);
    ASSERT_EQ(outcomes.size(), 10u);

    int ok = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const auto& o = outcomes[i];
        EXPECT_EQ(o.target, tasks[i].target.label());
        bool should_fail = remote_.auth_fail_hosts.count(tasks[i].target.host) > 0;
        if (should_fail) {
            EXPECT_FALSE(o.success);
            EXPECT_EQ(o.error_kind, ErrorKind::AUTHENTICATION);
            ASSERT_FALSE(o.attempted_methods.empty());
            EXPECT_EQ(o.attempted_methods.front(), "agent");
            EXPECT_EQ(o.attempted_methods.back(), "password");
        } else {
            EXPECT_TRUE(o.success);
            EXPECT_EQ(o.error_kind, ErrorKind::NONE);
            EXPECT_EQ(o.bytes_sent, 5000u);
            EXPECT_EQ(read_file(remote_.local_for(tasks[i].remote_path)), pattern(5000));
            ++ok;
        }
    }
    EXPECT_EQ(ok, 7);
}

TEST_F(TransferSchedulerTest, ConnectionAndTransferErrorsAreClassified) {
    remote_.refuse_hosts = {"edge-0"};
    CredentialResolver resolver(keys_->path());
    FakeOpener opener(remote_);
    ResumeStore store(state_dir_.path());
    TransferScheduler sched(resolver, opener, store, TransportOptions(), nullptr);

    auto tasks = make_tasks(2);
    tasks[1].local_path = local_dir_.file("missing.tar");
    auto outcomes = sched.run(tasks, 2);
    EXPECT_EQ(outcomes[0].error_kind, ErrorKind::CONNECTION);
    EXPECT_EQ(outcomes[1].error_kind, ErrorKind::TRANSFER);
    EXPECT_EQ(remote_.active, 0);
}

TEST_F(TransferSchedulerTest, InterruptedTargetResumesOnNextRun) {
    CredentialResolver resolver(keys_->path());
    FakeOpener opener(remote_);
    ResumeStore store(state_dir_.path());
    TransferScheduler sched(resolver, opener, store, TransportOptions(), nullptr);
    auto tasks = make_tasks(1);

    remote_.fail_after = 2000;
    auto first = sched.run(tasks, 1);
    EXPECT_FALSE(first[0].success);
    EXPECT_EQ(first[0].error_kind, ErrorKind::TRANSFER);
    EXPECT_EQ(store.list().size(), 1u);

    remote_.fail_after = 0;
    auto second = sched.run(tasks, 1);
    EXPECT_TRUE(second[0].success);
    EXPECT_EQ(second[0].resumed_from, 2000u);
    EXPECT_EQ(second[0].bytes_sent, 3000u);
    EXPECT_TRUE(store.list().empty());
}

TEST_F(TransferSchedulerTest, PostHookRunsWithOpenSession) {
    CredentialResolver resolver(keys_->path());
    FakeOpener opener(remote_);
    ResumeStore store(state_dir_.path());
    TransferScheduler sched(resolver, opener, store, TransportOptions(), nullptr);

    std::vector<size_t> seen;
    std::mutex m;
    sched.set_post_transfer([&](size_t index, const TransferTask& t, RemoteSession& s) {
        {
            std::lock_guard<std::mutex> lk(m);
            seen.push_back(index);
        }
        if (index == 1) throw PostActionFailed("post action exited with 3", 3);
        s.execute_remote("tar -xf " + t.remote_path);
    });

    auto outcomes = sched.run(make_tasks(3), 2);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_FALSE(outcomes[1].success);
    EXPECT_EQ(outcomes[1].error_kind, ErrorKind::POST_ACTION);
    EXPECT_TRUE(outcomes[2].success);
    EXPECT_EQ(seen.size(), 3u);
    EXPECT_EQ(remote_.commands.size(), 2u);
}

TEST_F(TransferSchedulerTest, FailedRemoteCommandKeepsPartialOutput) {
    CredentialResolver resolver(keys_->path());
    FakeOpener opener(remote_);
    ResumeStore store(state_dir_.path());
    TransferScheduler sched(resolver, opener, store, TransportOptions(), nullptr);
    std::string err_log = state_dir_.file("transfer_errors.log");
    Logger::get().set_transfer_error_file(err_log);

    remote_.exec_throws = true;
    sched.set_post_transfer([](size_t, const TransferTask& t, RemoteSession& s) {
        s.execute_remote("tar -xf " + t.remote_path);
    });
    auto outcomes = sched.run(make_tasks(1), 1);
    Logger::get().set_transfer_error_file("");

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_FALSE(outcomes[0].success);
    EXPECT_EQ(outcomes[0].error_kind, ErrorKind::EXECUTION);
    EXPECT_EQ(outcomes[0].error, "channel closed");
    EXPECT_EQ(outcomes[0].partial_stdout, "partial");
    EXPECT_TRUE(outcomes[0].partial_stderr.empty());

    std::string logged = read_file(err_log);
    EXPECT_NE(logged.find("ExecutionError: channel closed"), std::string::npos) << logged;
    EXPECT_NE(logged.find("stdout: partial"), std::string::npos) << logged;
}

TEST_F(TransferSchedulerTest, StatsTrackProgress) {
    CredentialResolver resolver(keys_->path());
    FakeOpener opener(remote_);
    ResumeStore store(state_dir_.path());
    TransferScheduler sched(resolver, opener, store, TransportOptions(), nullptr);
    remote_.refuse_hosts = {"edge-2"};

    TransferStats stats;
    sched.set_stats(&stats);
    sched.run(make_tasks(4), 2);

    EXPECT_EQ(stats.targets_total.load(), 4u);
    EXPECT_EQ(stats.targets_done.load(), 3u);
    EXPECT_EQ(stats.targets_failed.load(), 1u);
    EXPECT_EQ(stats.bytes_total.load(), 20000u);
    EXPECT_EQ(stats.bytes_sent.load(), 15000u);
    EXPECT_TRUE(stats.active().empty());
}

TEST_F(TransferSchedulerTest, EmptyTaskListIsFine) {
    CredentialResolver resolver(keys_->path());
    FakeOpener opener(remote_);
    ResumeStore store(state_dir_.path());
    TransferScheduler sched(resolver, opener, store, TransportOptions(), nullptr);
    EXPECT_TRUE(sched.run({}, 4).empty());
}

} // namespace
