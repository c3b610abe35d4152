#include <gtest/gtest.h>

#include "cache/artifact_packer.hpp"
#include "common/compress.hpp"
#include "testing.hpp"

using testing_util::TempDir;
using testing_util::pattern;
using testing_util::read_file;
using testing_util::write_file;

namespace {

class ArtifactPackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = work_.file("images.tar");
        artifact_ = work_.file("out/images.tar.zst");
        write_file(source_, pattern(200000));
    }

    testing_util::QuietLogs quiet_;
    TempDir     work_;
    TempDir     cache_dir_;
    std::string source_;
    std::string artifact_;
};

TEST_F(ArtifactPackerTest, CompressesOnceThenReuses) {
    ArtifactCache cache(cache_dir_.path());
    ArtifactPacker packer(cache);

    PackResult first = packer.prepare(artifact_, source_, false);
    EXPECT_TRUE(first.rebuilt);
    EXPECT_TRUE(fs::exists(artifact_));
    EXPECT_LT(first.entry.size_bytes, 200000u);

    PackResult second = packer.prepare(artifact_, source_, false);
    EXPECT_FALSE(second.rebuilt);
    EXPECT_EQ(second.entry.sha256, first.entry.sha256);

    std::string restored = work_.file("restored.tar");
    EXPECT_EQ(compress::decompress_file(artifact_, restored), 200000u);
    EXPECT_EQ(read_file(restored), pattern(200000));
}

TEST_F(ArtifactPackerTest, ForceRebuilds) {
    ArtifactCache cache(cache_dir_.path());
    ArtifactPacker packer(cache);
    packer.prepare(artifact_, source_, false);
    EXPECT_TRUE(packer.prepare(artifact_, source_, true).rebuilt);
}

TEST_F(ArtifactPackerTest, NewerSourceRebuilds) {
    ArtifactCache cache(cache_dir_.path());
    ArtifactPacker packer(cache);
    packer.prepare(artifact_, source_, false);

    auto st = file_io::stat_file(artifact_);
    ASSERT_TRUE(st.has_value());
    write_file(source_, pattern(150000));
    file_io::set_mtime(source_, st->mtime_ns + 2000000000ULL);

    PackResult res = packer.prepare(artifact_, source_, false);
    EXPECT_TRUE(res.rebuilt);
    std::string restored = work_.file("restored.tar");
    compress::decompress_file(artifact_, restored);
    EXPECT_EQ(read_file(restored), pattern(150000));
}

TEST_F(ArtifactPackerTest, PrebuiltArtifactIsRecorded) {
    ArtifactCache cache(cache_dir_.path());
    ArtifactPacker packer(cache);
    std::string prebuilt = work_.file("prebuilt.tar");
    write_file(prebuilt, "already built");

    PackResult first = packer.prepare(prebuilt, "", false);
    EXPECT_TRUE(first.rebuilt);
    EXPECT_FALSE(cache.should_rebuild(prebuilt));
    EXPECT_FALSE(packer.prepare(prebuilt, "", false).rebuilt);
}

TEST_F(ArtifactPackerTest, MissingInputsThrow) {
    ArtifactCache cache(cache_dir_.path());
    ArtifactPacker packer(cache);
    EXPECT_THROW(packer.prepare(work_.file("none.tar"), "", false), std::runtime_error);
    EXPECT_THROW(packer.prepare(artifact_, work_.file("no_source"), false), std::runtime_error);
}

TEST_F(ArtifactPackerTest, TruncatedFrameFailsToDecompress) {
    ArtifactCache cache(cache_dir_.path());
    ArtifactPacker packer(cache);
    packer.prepare(artifact_, source_, false);

    std::string data = read_file(artifact_);
    std::string cut = work_.file("cut.zst");
    write_file(cut, data.substr(0, data.size() / 2));
    EXPECT_THROW(compress::decompress_file(cut, work_.file("cut.out")), std::runtime_error);
}

} // namespace
