#include <gtest/gtest.h>

#include "command/command_dispatcher.hpp"
#include "testing.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <mutex>
#include <string>
#include <vector>

namespace {

using updater::CommandDispatcher;
using updater::Result;

class FakeController final : public updater::IUpdateController {
  public:
    Result CheckNow(std::stop_token stop) override {
        ++checks;
        return Run(stop);
    }

    bool Cancel() override {
        ++cancels;
        return cancel_result;
    }

    Result ForceInstallLatest(std::stop_token stop, const std::string& reason) override {
        {
            std::lock_guard lock(mu_);
            reasons_.push_back(reason);
        }
        ++forces;
        return Run(stop);
    }

    std::vector<std::string> Reasons() {
        std::lock_guard lock(mu_);
        return reasons_;
    }

    std::atomic<int> checks{0};
    std::atomic<int> forces{0};
    std::atomic<int> cancels{0};
    std::atomic<int> stopped{0};
    bool cancel_result = true;

    testutil::Gate entered;
    // When set, calls block until the gate opens or stop is requested.
    testutil::Gate* release = nullptr;

  private:
    Result Run(std::stop_token stop) {
        entered.Open();
        if (release && !release->Wait(stop)) {
            ++stopped;
            return Result::Fail(ECANCELED, "cancelled");
        }
        return Result::Ok();
    }

    std::mutex mu_;
    std::vector<std::string> reasons_;
};

TEST(CommandParseTests, KnownCommands) {
    auto check = updater::ParseCommand("check_update", nullptr);
    ASSERT_TRUE(check.has_value());
    EXPECT_STREQ(updater::CommandName(*check), "check_update");

    auto cancel = updater::ParseCommand("cancel_update", nlohmann::json::object());
    ASSERT_TRUE(cancel.has_value());
    EXPECT_TRUE(std::holds_alternative<updater::CancelUpdateCommand>(*cancel));

    auto force = updater::ParseCommand("force_update", nlohmann::json{{"reason", "hotfix"}});
    ASSERT_TRUE(force.has_value());
    EXPECT_EQ(std::get<updater::ForceUpdateCommand>(*force).reason, "hotfix");
}

TEST(CommandParseTests, NonStringReasonIsDropped) {
    auto force = updater::ParseCommand("force_update", nlohmann::json{{"reason", 42}});
    ASSERT_TRUE(force.has_value());
    EXPECT_TRUE(std::get<updater::ForceUpdateCommand>(*force).reason.empty());
}

TEST(CommandParseTests, UnknownCommandIsRejected) {
    auto r = updater::ParseCommand("reboot", nullptr);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "unknown command: 'reboot'");
}

TEST(CommandDispatcherTests, CheckRunsOffTheCallingThread) {
    FakeController controller;
    testutil::Gate release;
    controller.release = &release;
    CommandDispatcher dispatcher(controller);

    dispatcher.HandleCommand("check_update", nullptr);
    ASSERT_TRUE(controller.entered.WaitFor());
    EXPECT_EQ(dispatcher.InFlight(), 1u);

    release.Open();
    dispatcher.Drain();
    EXPECT_EQ(controller.checks.load(), 1);
    EXPECT_EQ(dispatcher.InFlight(), 0u);
}

TEST(CommandDispatcherTests, CancelRunsInline) {
    FakeController controller;
    controller.cancel_result = false;
    CommandDispatcher dispatcher(controller);

    dispatcher.HandleCommand("cancel_update", nullptr);
    EXPECT_EQ(controller.cancels.load(), 1);
    EXPECT_EQ(dispatcher.InFlight(), 0u);
}

TEST(CommandDispatcherTests, ForcePassesReason) {
    FakeController controller;
    CommandDispatcher dispatcher(controller);

    dispatcher.HandleCommand("force_update", nlohmann::json{{"reason", "security fix"}});
    dispatcher.HandleCommand("force_update", nlohmann::json{{"reason", true}});
    dispatcher.HandleCommand("force_update", nullptr);
    dispatcher.Drain();

    auto reasons = controller.Reasons();
    std::sort(reasons.begin(), reasons.end());
    EXPECT_EQ(reasons, (std::vector<std::string>{"", "", "security fix"}));
}

TEST(CommandDispatcherTests, UnknownCommandIsIgnored) {
    FakeController controller;
    CommandDispatcher dispatcher(controller);

    dispatcher.HandleCommand("format_disk", nullptr);
    dispatcher.Drain();
    EXPECT_EQ(controller.checks.load() + controller.forces.load() + controller.cancels.load(), 0);
}

TEST(CommandDispatcherTests, WireMessages) {
    FakeController controller;
    CommandDispatcher dispatcher(controller);

    EXPECT_TRUE(dispatcher.HandleWireMessage(R"({"type":"command","command":"check_update"})").is_ok());
    EXPECT_TRUE(dispatcher.HandleWireMessage(R"({"command":"force_update","data":{"reason":"x"}})").is_ok());
    EXPECT_TRUE(dispatcher.HandleWireMessage(R"({"command":"whatever"})").is_ok());
    dispatcher.Drain();
    EXPECT_EQ(controller.checks.load(), 1);
    EXPECT_EQ(controller.Reasons(), (std::vector<std::string>{"x"}));

    EXPECT_EQ(dispatcher.HandleWireMessage("not json").err, EINVAL);
    EXPECT_EQ(dispatcher.HandleWireMessage("[1,2]").err, EINVAL);
    EXPECT_EQ(dispatcher.HandleWireMessage(R"({"type":"policy","command":"check_update"})").err, EINVAL);
    EXPECT_EQ(dispatcher.HandleWireMessage(R"({"type":"command"})").err, EINVAL);
    EXPECT_EQ(dispatcher.HandleWireMessage(R"({"command":7})").err, EINVAL);
}

TEST(CommandDispatcherTests, ShutdownStopsInFlightCommands) {
    FakeController controller;
    testutil::Gate release;
    controller.release = &release;
    CommandDispatcher dispatcher(controller);

    dispatcher.HandleCommand("force_update", nullptr);
    ASSERT_TRUE(controller.entered.WaitFor());

    dispatcher.Shutdown();
    EXPECT_EQ(controller.stopped.load(), 1);

    dispatcher.HandleCommand("check_update", nullptr);
    EXPECT_EQ(controller.checks.load(), 0);
    EXPECT_EQ(dispatcher.InFlight(), 0u);
}

} // namespace
