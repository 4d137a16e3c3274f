#include <gtest/gtest.h>

#include "policy/policy_resolver.hpp"
#include "testing.hpp"

namespace {

using updater::AgentOverrideMode;
using updater::FleetUpdatePolicy;
using updater::PolicyResolver;
using updater::PolicySource;
using updater::PolicySpec;
using updater::VersionPinStrategy;

PolicySpec LocalSpec() {
    PolicySpec s;
    s.update_check_days = 3;
    s.strategy = VersionPinStrategy::Patch;
    return s;
}

FleetUpdatePolicy FleetSpec() {
    FleetUpdatePolicy f;
    f.spec.update_check_days = 1;
    f.spec.strategy = VersionPinStrategy::Latest;
    f.spec.allow_major_upgrade = true;
    f.tenant_id = "tenant-a";
    return f;
}

TEST(PolicyResolverTests, NeverDisablesRegardlessOfPolicies) {
    const auto local = LocalSpec();
    const auto fleet = FleetSpec();

    auto with_fleet = PolicyResolver::Resolve(AgentOverrideMode::Never, local, &fleet);
    auto without = PolicyResolver::Resolve(AgentOverrideMode::Never, local, nullptr);

    EXPECT_FALSE(with_fleet.enabled);
    EXPECT_FALSE(without.enabled);
    EXPECT_EQ(with_fleet.source, PolicySource::Disabled);
}

TEST(PolicyResolverTests, LocalModeIgnoresFleet) {
    const auto local = LocalSpec();
    const auto fleet = FleetSpec();

    auto p = PolicyResolver::Resolve(AgentOverrideMode::Local, local, &fleet);
    EXPECT_TRUE(p.enabled);
    EXPECT_EQ(p.source, PolicySource::Local);
    EXPECT_EQ(p.spec, local);
}

TEST(PolicyResolverTests, InheritUsesFleetWhenPresent) {
    const auto local = LocalSpec();
    const auto fleet = FleetSpec();

    auto p = PolicyResolver::Resolve(AgentOverrideMode::Inherit, local, &fleet);
    EXPECT_TRUE(p.enabled);
    EXPECT_EQ(p.source, PolicySource::Fleet);
    EXPECT_EQ(p.spec, fleet.spec);
}

TEST(PolicyResolverTests, InheritFallsBackToLocal) {
    const auto local = LocalSpec();

    auto p = PolicyResolver::Resolve(AgentOverrideMode::Inherit, local, nullptr);
    EXPECT_TRUE(p.enabled);
    EXPECT_EQ(p.source, PolicySource::Fallback);
    EXPECT_EQ(p.spec, local);
}

TEST(PolicyResolverTests, ResolveIsDeterministic) {
    const auto local = LocalSpec();
    const auto fleet = FleetSpec();
    for (auto mode : {AgentOverrideMode::Inherit, AgentOverrideMode::Local, AgentOverrideMode::Never}) {
        for (const FleetUpdatePolicy* f : {static_cast<const FleetUpdatePolicy*>(nullptr), &fleet}) {
            EXPECT_EQ(PolicyResolver::Resolve(mode, local, f), PolicyResolver::Resolve(mode, local, f));
        }
    }
}

TEST(PolicyResolverTests, ZeroCheckDaysStaysEnabled) {
    PolicySpec local;
    local.update_check_days = 0;
    auto p = PolicyResolver::Resolve(AgentOverrideMode::Local, local, nullptr);
    EXPECT_TRUE(p.enabled);
    EXPECT_EQ(p.spec.update_check_days, 0);
}

struct EligibilityCase {
    VersionPinStrategy strategy;
    bool allow_major;
    std::string target;
    std::string running;
    std::string candidate;
    bool eligible;
};

class EligibilityTests : public ::testing::TestWithParam<EligibilityCase> {};

TEST_P(EligibilityTests, AppliesStrategy) {
    const auto& c = GetParam();
    PolicySpec spec;
    spec.strategy = c.strategy;
    spec.allow_major_upgrade = c.allow_major;
    spec.target_version = c.target;

    auto e = PolicyResolver::CheckEligibility(spec, c.running, c.candidate);
    EXPECT_EQ(e.eligible, c.eligible) << c.running << " -> " << c.candidate << ": " << e.reason;
    EXPECT_FALSE(e.reason.empty());
}

INSTANTIATE_TEST_SUITE_P(
    Strategies, EligibilityTests,
    ::testing::Values(
        EligibilityCase{VersionPinStrategy::Latest, false, "", "1.2.3", "1.3.0", true},
        EligibilityCase{VersionPinStrategy::Latest, false, "", "1.2.3", "1.2.3", false},
        EligibilityCase{VersionPinStrategy::Latest, false, "", "1.2.3", "1.2.0", false},
        EligibilityCase{VersionPinStrategy::Latest, false, "", "1.2.3", "2.0.0", false},
        EligibilityCase{VersionPinStrategy::Latest, true, "", "1.2.3", "2.0.0", true},
        EligibilityCase{VersionPinStrategy::Latest, false, "1.3.0", "1.2.3", "1.4.0", false},
        EligibilityCase{VersionPinStrategy::Latest, false, "1.3.0", "1.2.3", "1.3.0", true},
        EligibilityCase{VersionPinStrategy::Latest, false, "1.0.0", "1.2.3", "1.0.0", false},
        EligibilityCase{VersionPinStrategy::Minor, false, "", "1.2.3", "1.2.9", true},
        EligibilityCase{VersionPinStrategy::Minor, false, "", "1.2.3", "1.3.0", false},
        EligibilityCase{VersionPinStrategy::Minor, false, "", "1.2.3", "1.9.0", false},
        EligibilityCase{VersionPinStrategy::Minor, false, "", "1.2.3", "2.0.0", false},
        EligibilityCase{VersionPinStrategy::Minor, true, "", "1.2.3", "1.3.0", true},
        EligibilityCase{VersionPinStrategy::Minor, true, "", "1.2.3", "2.0.0", true},
        EligibilityCase{VersionPinStrategy::Minor, false, "1.2.5", "1.2.3", "1.2.4", false},
        EligibilityCase{VersionPinStrategy::Patch, false, "1.2.5", "1.2.3", "1.2.5", true},
        EligibilityCase{VersionPinStrategy::Patch, false, "", "1.2.3", "1.2.4", true},
        EligibilityCase{VersionPinStrategy::Patch, false, "", "1.2.3", "1.3.0", false},
        EligibilityCase{VersionPinStrategy::Patch, true, "", "1.2.3", "2.2.4", false},
        EligibilityCase{VersionPinStrategy::Pin, false, "1.5.0", "1.2.3", "1.5.0", true},
        EligibilityCase{VersionPinStrategy::Pin, false, "1.0.0", "1.2.3", "1.0.0", true},
        EligibilityCase{VersionPinStrategy::Pin, false, "1.5.0", "1.2.3", "1.6.0", false},
        EligibilityCase{VersionPinStrategy::Pin, false, "1.5.0", "1.5.0", "1.5.0", false},
        EligibilityCase{VersionPinStrategy::Pin, false, "", "1.2.3", "1.6.0", false},
        EligibilityCase{VersionPinStrategy::Pin, false, "not-a-version", "1.2.3", "1.6.0", false},
        EligibilityCase{VersionPinStrategy::Latest, false, "", "dev", "1.6.0", false},
        EligibilityCase{VersionPinStrategy::Latest, false, "", "1.2.3", "nightly", false}));

} // namespace

namespace {

TEST(PolicyResolverTests, PinWithoutTargetWarns) {
    testutil::LogCapture logs;
    PolicySpec spec;
    spec.strategy = VersionPinStrategy::Pin;

    const auto e = PolicyResolver::CheckEligibility(spec, "1.2.3", "1.3.0");
    EXPECT_FALSE(e.eligible);
    EXPECT_TRUE(logs.Contains(updater::LogLevel::Warn, "without target_version"));
}

TEST(PolicyResolverTests, InvalidTargetBlocksEveryStrategy) {
    testutil::LogCapture logs;
    PolicySpec spec;
    spec.strategy = VersionPinStrategy::Latest;
    spec.target_version = "soon";

    const auto e = PolicyResolver::CheckEligibility(spec, "1.2.3", "1.3.0");
    EXPECT_FALSE(e.eligible);
    EXPECT_TRUE(logs.Contains(updater::LogLevel::Warn, "not a valid version"));
}

} // namespace
