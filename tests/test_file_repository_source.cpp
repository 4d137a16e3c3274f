#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"
#include "update/file_repository_source.hpp"

#include <cerrno>
#include <filesystem>
#include <stop_token>
#include <vector>

namespace {

namespace fs = std::filesystem;
using updater::FileRepositorySource;

std::string HexOf(const std::string& s) {
    return updater::Sha256Hex(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()));
}

class FileRepositorySourceTests : public ::testing::Test {
  protected:
    void SetUp() override {
        fs::create_directories(tmp.File("repo/stable/linux-amd64"));
        fs::create_directories(tmp.File("bin"));
        testutil::WriteFile(tmp.File("bin/agent"), "old binary");
    }

    void Publish(const std::string& version, const std::string& payload,
                 const std::string& sha = {}, std::uint64_t size = 0) {
        const std::string name = "agent-" + version;
        testutil::WriteFile(tmp.File("repo/stable/linux-amd64/" + name), payload);
        const nlohmann::json manifest{
            {"version", version},
            {"sha256", sha.empty() ? HexOf(payload) : sha},
            {"size_bytes", size == 0 ? payload.size() : size},
            {"artifact", name},
        };
        testutil::WriteFile(tmp.File("repo/stable/linux-amd64/latest.json"), manifest.dump());
    }

    FileRepositorySource::Options SourceOptions() {
        return {
            .repository_dir = tmp.File("repo"),
            .download_dir = tmp.File("downloads"),
            .binary_path = tmp.File("bin/agent"),
        };
    }

    FileRepositorySource Source() { return FileRepositorySource(SourceOptions()); }

    testutil::TemporaryDirectory tmp;
};

TEST_F(FileRepositorySourceTests, CheckLatestReadsManifest) {
    Publish("1.3.0", "new binary");
    auto src = Source();

    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_TRUE(info.has_value()) << info.error();
    EXPECT_EQ(info->version, "1.3.0");
    EXPECT_EQ(info->sha256, HexOf("new binary"));
    EXPECT_EQ(info->size_bytes, 10u);
    EXPECT_EQ(info->artifact_url, tmp.File("repo/stable/linux-amd64/agent-1.3.0"));
}

TEST_F(FileRepositorySourceTests, MissingOrBadManifestIsAnError) {
    auto src = Source();
    EXPECT_FALSE(src.CheckLatest("beta", "linux", "amd64").has_value());

    testutil::WriteFile(tmp.File("repo/stable/linux-amd64/latest.json"),
                        R"({"version": "1.3.0", "sha256": "abc", "artifact": "x"})");
    EXPECT_FALSE(src.CheckLatest("stable", "linux", "amd64").has_value());

    testutil::WriteFile(tmp.File("repo/stable/linux-amd64/latest.json"),
                        R"({"version": "banana", "sha256": ")" + std::string(64, 'a') +
                            R"(", "artifact": "x"})");
    EXPECT_FALSE(src.CheckLatest("stable", "linux", "amd64").has_value());
}

TEST_F(FileRepositorySourceTests, DownloadVerifyInstallReplacesBinary) {
    Publish("1.3.0", "new binary");
    auto src = Source();
    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_TRUE(info.has_value()) << info.error();

    std::vector<int> ticks;
    auto handle = src.Download(*info, std::stop_token{}, [&](int pct) { ticks.push_back(pct); });
    ASSERT_TRUE(handle.has_value()) << handle.error();
    EXPECT_TRUE(testutil::FileExists(handle->path));
    EXPECT_FALSE(testutil::FileExists(handle->path + ".partial"));
    ASSERT_FALSE(ticks.empty());
    EXPECT_EQ(ticks.back(), 100);

    ASSERT_TRUE(src.Verify(*handle, std::stop_token{}).is_ok());
    ASSERT_TRUE(src.Install(*handle).is_ok());

    EXPECT_EQ(testutil::ReadFile(tmp.File("bin/agent")), "new binary");
    EXPECT_FALSE(testutil::FileExists(tmp.File("bin/agent.new")));
    struct stat st {};
    ASSERT_EQ(::stat(tmp.File("bin/agent").c_str(), &st), 0);
    EXPECT_TRUE(st.st_mode & S_IXUSR);

    src.Discard(*handle);
    EXPECT_FALSE(testutil::FileExists(handle->path));
}

TEST_F(FileRepositorySourceTests, VerifyRejectsWrongDigest) {
    Publish("1.3.0", "new binary", std::string(64, '0'));
    auto src = Source();
    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_TRUE(info.has_value()) << info.error();

    auto handle = src.Download(*info, std::stop_token{}, {});
    ASSERT_TRUE(handle.has_value()) << handle.error();

    auto r = src.Verify(*handle, std::stop_token{});
    EXPECT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("sha256 mismatch"), std::string::npos);
}

TEST_F(FileRepositorySourceTests, VerifyRejectsWrongSize) {
    Publish("1.3.0", "new binary", {}, 999);
    auto src = Source();
    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_TRUE(info.has_value()) << info.error();

    auto handle = src.Download(*info, std::stop_token{}, {});
    ASSERT_TRUE(handle.has_value()) << handle.error();

    auto r = src.Verify(*handle, std::stop_token{});
    EXPECT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("size mismatch"), std::string::npos);
}

TEST_F(FileRepositorySourceTests, CancelledDownloadLeavesNothingBehind) {
    Publish("1.3.0", std::string(200 * 1024, 'x'));
    auto src = Source();
    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_TRUE(info.has_value()) << info.error();

    std::stop_source stop;
    auto handle = src.Download(*info, stop.get_token(), [&](int) { stop.request_stop(); });
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error(), "download cancelled");

    EXPECT_TRUE(fs::is_empty(tmp.File("downloads")));
    EXPECT_EQ(testutil::ReadFile(tmp.File("bin/agent")), "old binary");
}

TEST_F(FileRepositorySourceTests, DirectorySyncFailureAfterRenameStillInstalls) {
    Publish("1.3.0", "new binary");
    auto opt = SourceOptions();
    int syncs = 0;
    opt.sync_directory = [&](const std::string&) {
        ++syncs;
        return updater::Result::Fail(EIO, "fsync dir failed");
    };
    FileRepositorySource src(opt);
    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_TRUE(info.has_value()) << info.error();
    auto handle = src.Download(*info, std::stop_token{}, {});
    ASSERT_TRUE(handle.has_value()) << handle.error();

    testutil::LogCapture logs;
    EXPECT_TRUE(src.Install(*handle).is_ok());
    EXPECT_EQ(syncs, 1);
    EXPECT_EQ(testutil::ReadFile(tmp.File("bin/agent")), "new binary");
    EXPECT_TRUE(logs.Contains(updater::LogLevel::Warn, "directory sync failed"));
}

TEST_F(FileRepositorySourceTests, RejectsVersionThatIsNotAFileName) {
    Publish("1.3.0", "new binary");
    const nlohmann::json manifest{
        {"version", "1.3.0-/../../escape"},
        {"sha256", HexOf("new binary")},
        {"artifact", "agent-1.3.0"},
    };
    testutil::WriteFile(tmp.File("repo/stable/linux-amd64/latest.json"), manifest.dump());
    auto src = Source();

    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_FALSE(info.has_value());
    EXPECT_NE(info.error().find("contains characters"), std::string::npos);
}

TEST_F(FileRepositorySourceTests, DownloadStaysInsideDownloadDirectory) {
    Publish("1.3.0", "new binary");
    auto src = Source();
    auto info = src.CheckLatest("stable", "linux", "amd64");
    ASSERT_TRUE(info.has_value()) << info.error();
    info->version = "1.3.0-/../../escape";

    auto handle = src.Download(*info, std::stop_token{}, {});
    ASSERT_TRUE(handle.has_value()) << handle.error();
    EXPECT_EQ(fs::path(handle->path).parent_path(), fs::path(tmp.File("downloads")));
    EXPECT_TRUE(testutil::FileExists(handle->path));
}

} // namespace
