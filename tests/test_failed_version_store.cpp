#include <gtest/gtest.h>

#include "testing.hpp"
#include "update/failed_version_store.hpp"

#include <chrono>

namespace {

using namespace std::chrono_literals;
using updater::FailedVersionStore;

class FailedVersionStoreTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    updater::TimePoint now = updater::FromUnixSeconds(1760000000);

    updater::Clock Clock() {
        return [this] { return now; };
    }
};

TEST_F(FailedVersionStoreTests, ExcludesOnlyThatVersionUntilCooldownEnds) {
    FailedVersionStore store(tmp.File("failed_version.json"), Clock());
    ASSERT_TRUE(store.Record("1.3.0", "rolled back", 72h).is_ok());

    EXPECT_TRUE(store.IsExcluded("1.3.0"));
    EXPECT_TRUE(store.IsExcluded("v1.3.0"));
    EXPECT_FALSE(store.IsExcluded("1.3.1"));
    ASSERT_TRUE(store.Active().has_value());
    EXPECT_EQ(store.Active()->reason, "rolled back");

    now += 71h;
    EXPECT_TRUE(store.IsExcluded("1.3.0"));
    now += 1h;
    EXPECT_FALSE(store.IsExcluded("1.3.0"));
    EXPECT_FALSE(store.Active().has_value());
}

TEST_F(FailedVersionStoreTests, SurvivesReload) {
    {
        FailedVersionStore store(tmp.File("failed_version.json"), Clock());
        ASSERT_TRUE(store.Record("2.0.0", "health check", 24h).is_ok());
    }

    FailedVersionStore reloaded(tmp.File("failed_version.json"), Clock());
    EXPECT_FALSE(reloaded.IsExcluded("2.0.0"));
    reloaded.Load();
    EXPECT_TRUE(reloaded.IsExcluded("2.0.0"));
}

TEST_F(FailedVersionStoreTests, ClearForOnlyMatchingVersion) {
    FailedVersionStore store(tmp.File("failed_version.json"), Clock());
    ASSERT_TRUE(store.Record("2.0.0", "x", 24h).is_ok());

    ASSERT_TRUE(store.ClearFor("1.9.0").is_ok());
    EXPECT_TRUE(store.IsExcluded("2.0.0"));

    ASSERT_TRUE(store.ClearFor("2.0.0").is_ok());
    EXPECT_FALSE(store.IsExcluded("2.0.0"));
    EXPECT_FALSE(testutil::FileExists(tmp.File("failed_version.json")));
}

TEST_F(FailedVersionStoreTests, CorruptFileMeansNoExclusion) {
    testutil::WriteFile(tmp.File("failed_version.json"), "garbage");
    FailedVersionStore store(tmp.File("failed_version.json"), Clock());
    store.Load();
    EXPECT_FALSE(store.Active().has_value());
}

} // namespace
