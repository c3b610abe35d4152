#include <gtest/gtest.h>

#include "fake_transport.hpp"
#include "testing.hpp"
#include "transport/resumable_upload.hpp"

using testing_util::TempDir;
using testing_util::pattern;
using testing_util::read_file;
using testing_util::write_file;

namespace {

class ResumableUploadTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote_.root = remote_dir_.file("root");
        local_ = local_dir_.file("bundle.tar.zst");
        write_file(local_, pattern(10000));
    }

    std::string key() const {
        return ResumeStore::make_key(local_, "edge-1:22", "/srv/bundle.tar.zst");
    }

    testing_util::QuietLogs quiet_;
    TempDir     local_dir_;
    TempDir     remote_dir_;
    TempDir     state_dir_;
    FakeRemote  remote_;
    std::string local_;
};

TEST_F(ResumableUploadTest, FreshUploadLeavesNoRecord) {
    ResumeStore store(state_dir_.path());
    FakeSession session(remote_, "root@edge-1");
    u64 last_acked = 0;
    ResumableUpload up(store, session, [&](u64 acked, u64) { last_acked = acked; });

    UploadResult res = up.run(local_, "edge-1:22", "/srv/bundle.tar.zst");
    EXPECT_EQ(res.bytes_sent, 10000u);
    EXPECT_EQ(res.resumed_from, 0u);
    EXPECT_EQ(res.total_bytes, 10000u);
    EXPECT_EQ(last_acked, 10000u);
    EXPECT_EQ(read_file(remote_.local_for("/srv/bundle.tar.zst")), pattern(10000));
    EXPECT_FALSE(store.load(key()).has_value());
}

TEST_F(ResumableUploadTest, InterruptedUploadResumesFromCheckpoint) {
    ResumeStore store(state_dir_.path());
    remote_.fail_after = 3500;
    {
        FakeSession session(remote_, "root@edge-1");
        ResumableUpload up(store, session);
        EXPECT_THROW(up.run(local_, "edge-1:22", "/srv/bundle.tar.zst"), TransferError);
    }

    auto rec = store.load(key());
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->transferred_bytes, 4000u);
    EXPECT_EQ(rec->total_bytes, 10000u);
    EXPECT_DOUBLE_EQ(rec->percentage(), 40.0);

    remote_.fail_after = 0;
    FakeSession session(remote_, "root@edge-1");
    ResumableUpload up(store, session);
    UploadResult res = up.run(local_, "edge-1:22", "/srv/bundle.tar.zst");

    EXPECT_EQ(res.resumed_from, 4000u);
    EXPECT_EQ(res.bytes_sent, 6000u);
    ASSERT_EQ(remote_.start_offsets.size(), 2u);
    EXPECT_EQ(remote_.start_offsets[1], 4000u);
    EXPECT_EQ(read_file(remote_.local_for("/srv/bundle.tar.zst")), pattern(10000));
    EXPECT_FALSE(store.load(key()).has_value());
}

TEST_F(ResumableUploadTest, ModifiedLocalFileRestartsFromZero) {
    ResumeStore store(state_dir_.path());
    remote_.fail_after = 5000;
    {
        FakeSession session(remote_, "root@edge-1");
        ResumableUpload up(store, session);
        EXPECT_THROW(up.run(local_, "edge-1:22", "/srv/bundle.tar.zst"), TransferError);
    }
    ASSERT_TRUE(store.load(key()).has_value());

    auto st = file_io::stat_file(local_);
    ASSERT_TRUE(st.has_value());
    file_io::set_mtime(local_, st->mtime_ns + 5000000000ULL);

    remote_.fail_after = 0;
    FakeSession session(remote_, "root@edge-1");
    ResumableUpload up(store, session);
    UploadResult res = up.run(local_, "edge-1:22", "/srv/bundle.tar.zst");
    EXPECT_EQ(res.resumed_from, 0u);
    EXPECT_EQ(res.bytes_sent, 10000u);
    EXPECT_EQ(remote_.start_offsets.back(), 0u);
}

TEST_F(ResumableUploadTest, ShortRemoteFileRestartsFromZero) {
    ResumeStore store(state_dir_.path());
    auto st = file_io::stat_file(local_);
    ASSERT_TRUE(st.has_value());

    ResumeRecord rec;
    rec.resume_key        = key();
    rec.local_path        = file_io::normalize_path(local_);
    rec.remote_host       = "edge-1:22";
    rec.remote_path       = "/srv/bundle.tar.zst";
    rec.transferred_bytes = 8000;
    rec.total_bytes       = st->size;
    rec.local_mtime       = st->mtime_ns;
    store.save(rec);

    // The remote only holds 2000 bytes, fewer than the record claims
    write_file(remote_.local_for("/srv/bundle.tar.zst"), pattern(2000));

    FakeSession session(remote_, "root@edge-1");
    ResumableUpload up(store, session);
    UploadResult res = up.run(local_, "edge-1:22", "/srv/bundle.tar.zst");
    EXPECT_EQ(res.resumed_from, 0u);
    EXPECT_EQ(read_file(remote_.local_for("/srv/bundle.tar.zst")), pattern(10000));
}

TEST_F(ResumableUploadTest, CompletedRecordSkipsTransfer) {
    ResumeStore store(state_dir_.path());
    auto st = file_io::stat_file(local_);
    ASSERT_TRUE(st.has_value());
    write_file(remote_.local_for("/srv/bundle.tar.zst"), pattern(10000));

    ResumeRecord rec;
    rec.resume_key        = key();
    rec.local_path        = file_io::normalize_path(local_);
    rec.remote_host       = "edge-1:22";
    rec.remote_path       = "/srv/bundle.tar.zst";
    rec.transferred_bytes = st->size;
    rec.total_bytes       = st->size;
    rec.local_mtime       = st->mtime_ns;
    store.save(rec);

    FakeSession session(remote_, "root@edge-1");
    ResumableUpload up(store, session);
    UploadResult res = up.run(local_, "edge-1:22", "/srv/bundle.tar.zst");
    EXPECT_EQ(res.bytes_sent, 0u);
    EXPECT_EQ(res.resumed_from, 10000u);
    EXPECT_TRUE(remote_.start_offsets.empty());
    EXPECT_FALSE(store.load(key()).has_value());
}

TEST_F(ResumableUploadTest, EmptyFileWritesNoRecord) {
    ResumeStore store(state_dir_.path());
    std::string empty = local_dir_.file("empty.bin");
    write_file(empty, "");

    FakeSession session(remote_, "root@edge-1");
    ResumableUpload up(store, session);
    UploadResult res = up.run(empty, "edge-1:22", "/srv/empty.bin");
    EXPECT_EQ(res.bytes_sent, 0u);
    EXPECT_TRUE(store.list().empty());
    EXPECT_TRUE(file_io::stat_file(remote_.local_for("/srv/empty.bin")).has_value());
}

TEST_F(ResumableUploadTest, MissingLocalFileIsTransferError) {
    ResumeStore store(state_dir_.path());
    FakeSession session(remote_, "root@edge-1");
    ResumableUpload up(store, session);
    EXPECT_THROW(up.run(local_dir_.file("nope"), "edge-1:22", "/srv/nope"), TransferError);
}

} // namespace
