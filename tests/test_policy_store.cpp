#include <gtest/gtest.h>

#include "policy/policy_resolver.hpp"
#include "policy/policy_store.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace {

using updater::AgentOverrideMode;
using updater::FleetUpdatePolicy;
using updater::PolicyStore;

TEST(PolicyStoreTests, HoldsModeLocalAndFleet) {
    updater::PolicySpec local;
    local.update_check_days = 5;
    PolicyStore store(AgentOverrideMode::Local, local);

    EXPECT_EQ(store.GetAutoUpdateMode(), AgentOverrideMode::Local);
    EXPECT_EQ(store.GetLocalPolicy().update_check_days, 5);
    EXPECT_EQ(store.GetFleetPolicy(), nullptr);

    auto fleet = std::make_shared<const FleetUpdatePolicy>(FleetUpdatePolicy{.spec = {}, .tenant_id = "t", .updated_at = "x"});
    store.SetFleetPolicy(fleet);
    store.SetAutoUpdateMode(AgentOverrideMode::Inherit);
    EXPECT_EQ(store.GetFleetPolicy(), fleet);
    EXPECT_EQ(store.GetAutoUpdateMode(), AgentOverrideMode::Inherit);

    store.SetFleetPolicy(nullptr);
    EXPECT_EQ(store.GetFleetPolicy(), nullptr);
}

TEST(PolicyStoreTests, ConcurrentReadersSeeWholePolicies) {
    PolicyStore store(AgentOverrideMode::Inherit, {});

    auto make = [](int days) {
        FleetUpdatePolicy f;
        f.spec.update_check_days = days;
        f.tenant_id = "tenant-" + std::to_string(days);
        return std::make_shared<const FleetUpdatePolicy>(f);
    };

    std::atomic_bool stop{false};
    std::atomic_int torn{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto f = store.GetFleetPolicy();
                if (!f) continue;
                if (f->tenant_id != "tenant-" + std::to_string(f->spec.update_check_days)) ++torn;
                auto p = updater::PolicyResolver::Resolve(store.GetAutoUpdateMode(),
                                                          store.GetLocalPolicy(), f.get());
                if (p.spec.update_check_days != f->spec.update_check_days) ++torn;
            }
        });
    }

    for (int i = 1; i <= 2000; ++i) store.SetFleetPolicy(make(i % 10 + 1));
    stop = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(torn.load(), 0);
}

} // namespace
