#include "io/durable_file.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

std::string Pattern(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>((i * 13) & 0xFF);
    return s;
}

class FileIoTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(FileIoTests, OpensRegularFileWithSize) {
    const std::string p = tmp.File("in.bin");
    testutil::WriteFile(p, Pattern(12345));

    updater::FileReader r;
    auto res = updater::FileReader::Open(p, r);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(r.TotalSize().has_value());
    EXPECT_EQ(*r.TotalSize(), 12345u);
    EXPECT_EQ(r.Path(), p);
}

TEST_F(FileIoTests, MissingFileReportsErrno) {
    updater::FileReader r;
    auto res = updater::FileReader::Open(tmp.File("nope.bin"), r);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ENOENT);
    EXPECT_NE(res.msg.find("nope.bin"), std::string::npos);
}

TEST_F(FileIoTests, RejectsDirectory) {
    updater::FileReader r;
    auto res = updater::FileReader::Open(tmp.Path(), r);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, EINVAL);
}

TEST_F(FileIoTests, ReadsWholeFile) {
    const std::string p = tmp.File("in2.bin");
    const std::string data = Pattern(2 * 1024 * 1024 + 7);
    testutil::WriteFile(p, data);

    updater::FileReader r;
    ASSERT_TRUE(updater::FileReader::Open(p, r).is_ok());
    EXPECT_EQ(testutil::ReadAll(r), data);
}

TEST_F(FileIoTests, CopyStreamReportsRunningTotal) {
    const std::string data = Pattern(3 * updater::kCopyChunkSize + 5);
    testutil::WriteFile(tmp.File("src.bin"), data);

    updater::FileReader r;
    ASSERT_TRUE(updater::FileReader::Open(tmp.File("src.bin"), r).is_ok());
    updater::FileWriter w;
    ASSERT_TRUE(updater::FileWriter::Open(tmp.File("dst.bin"), w).is_ok());

    std::vector<std::uint64_t> totals;
    ASSERT_TRUE(updater::CopyStream(r, w, {}, [&](std::uint64_t n) { totals.push_back(n); }).is_ok());
    ASSERT_TRUE(w.Close().is_ok());

    EXPECT_EQ(testutil::ReadFile(tmp.File("dst.bin")), data);
    ASSERT_FALSE(totals.empty());
    EXPECT_EQ(totals.back(), data.size());
}

TEST_F(FileIoTests, CopyStreamStopsBetweenChunks) {
    testutil::WriteFile(tmp.File("src.bin"), Pattern(4 * updater::kCopyChunkSize));

    updater::FileReader r;
    ASSERT_TRUE(updater::FileReader::Open(tmp.File("src.bin"), r).is_ok());
    updater::FileWriter w;
    ASSERT_TRUE(updater::FileWriter::Open(tmp.File("dst.bin"), w).is_ok());

    std::stop_source stop;
    auto res = updater::CopyStream(r, w, stop.get_token(), [&](std::uint64_t) { stop.request_stop(); });
    EXPECT_TRUE(res.cancelled());
    ASSERT_TRUE(w.Close().is_ok());
    EXPECT_EQ(testutil::ReadFile(tmp.File("dst.bin")).size(), updater::kCopyChunkSize);
}

TEST_F(FileIoTests, WriterTruncates) {
    const std::string p = tmp.File("out.bin");
    testutil::WriteFile(p, "old contents that are longer");

    updater::FileWriter w;
    ASSERT_TRUE(updater::FileWriter::Open(p, w, 0600).is_ok());
    const std::string payload = "new";
    ASSERT_TRUE(w.WriteAll(std::span<const std::uint8_t>(
                               reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size()))
                    .is_ok());
    ASSERT_TRUE(w.FsyncNow().is_ok());
    ASSERT_TRUE(w.Close().is_ok());

    EXPECT_EQ(testutil::ReadFile(p), "new");
}

TEST_F(FileIoTests, DurableWriteReplacesContentAndLeavesNoTemp) {
    const std::string p = tmp.File("state.json");
    ASSERT_TRUE(updater::WriteFileDurably(p, "{\"a\":1}").is_ok());
    ASSERT_TRUE(updater::WriteFileDurably(p, "{\"a\":2}").is_ok());

    std::string text;
    ASSERT_TRUE(updater::ReadFileToString(p, text).is_ok());
    EXPECT_EQ(text, "{\"a\":2}");
    EXPECT_FALSE(testutil::FileExists(p + ".tmp"));

    ASSERT_TRUE(updater::RemoveFileDurably(p).is_ok());
    EXPECT_FALSE(testutil::FileExists(p));
    EXPECT_TRUE(updater::RemoveFileDurably(p).is_ok());

    auto missing = updater::ReadFileToString(p, text);
    EXPECT_FALSE(missing.is_ok());
    EXPECT_EQ(missing.err, ENOENT);
}

TEST_F(FileIoTests, AvailableBytesMeasuresNearestExistingDirectory) {
    std::uint64_t here = 0;
    ASSERT_TRUE(updater::AvailableBytes(tmp.Path(), here).is_ok());
    EXPECT_GT(here, 0u);

    std::uint64_t below = 0;
    ASSERT_TRUE(updater::AvailableBytes(tmp.File("not/yet/created"), below).is_ok());
    EXPECT_GT(below, 0u);
}

TEST(ResultTests, ContextAndErrno) {
    EXPECT_TRUE(updater::Result::Ok().WithContext("ignored").is_ok());

    auto r = updater::Result::Fail(EBUSY, "in progress").WithContext("check_update");
    EXPECT_TRUE(r.busy());
    EXPECT_EQ(r.msg, "check_update: in progress");

    errno = ENOENT;
    auto e = updater::Result::FromErrno("open failed: x");
    EXPECT_EQ(e.err, ENOENT);
    EXPECT_EQ(e.msg.rfind("open failed: x (", 0), 0u);
}

} // namespace
