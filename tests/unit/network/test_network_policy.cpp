/**
 * @file test_network_policy.cpp
 * @brief Unit tests for the unmetered-network policy
 */

#include <gtest/gtest.h>

#include <kcenon/background_transfer/network/network_policy.h>

#include <filesystem>
#include <fstream>
#include <memory>

namespace kcenon::background_transfer::test {

namespace {

auto make_task(const std::string& id, bool requires_unmetered) -> task {
    task t;
    t.task_id = id;
    t.url = "https://example.com/" + id;
    t.requires_unmetered_network = requires_unmetered;
    return t;
}

}  // namespace

// =============================================================================
// Effective Constraint
// =============================================================================

TEST(NetworkPolicyTest, ParseAcceptsNamesAndNumbers) {
    EXPECT_EQ(parse_network_policy("for_all_tasks"), network_policy::for_all_tasks);
    EXPECT_EQ(parse_network_policy("2"), network_policy::for_no_tasks);
    EXPECT_EQ(parse_network_policy("as_set_by_task"), network_policy::as_set_by_task);
    EXPECT_FALSE(parse_network_policy("sometimes").has_value());
    EXPECT_FALSE(parse_network_policy("").has_value());
}

TEST(NetworkPolicyTest, EffectiveConstraintTable) {
    auto metered_ok = make_task("a", false);
    auto unmetered_only = make_task("b", true);

    EXPECT_FALSE(effective_unmetered(metered_ok, std::nullopt, network_policy::as_set_by_task));
    EXPECT_TRUE(effective_unmetered(unmetered_only, std::nullopt, network_policy::as_set_by_task));
    EXPECT_TRUE(effective_unmetered(metered_ok, std::nullopt, network_policy::for_all_tasks));
    EXPECT_FALSE(effective_unmetered(unmetered_only, std::nullopt, network_policy::for_no_tasks));
}

TEST(NetworkPolicyTest, OverrideBeatsPolicy) {
    auto t = make_task("a", false);
    EXPECT_FALSE(effective_unmetered(t, false, network_policy::for_all_tasks));
    EXPECT_TRUE(effective_unmetered(t, true, network_policy::for_no_tasks));
}

// =============================================================================
// Reconciler
// =============================================================================

class NetworkPolicyReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("bt_policy_test_" +
                 std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(root_);
        store_ = std::make_shared<persistent_store>(root_);
        ASSERT_TRUE(store_->initialize().has_value());
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
    std::shared_ptr<persistent_store> store_;
};

TEST_F(NetworkPolicyReconcilerTest, DefaultsToPerTaskFlag) {
    network_policy_reconciler reconciler(store_);
    EXPECT_EQ(reconciler.policy(), network_policy::as_set_by_task);
    EXPECT_TRUE(reconciler.requires_unmetered(make_task("a", true)));
    EXPECT_FALSE(reconciler.requires_unmetered(make_task("b", false)));
}

TEST_F(NetworkPolicyReconcilerTest, PolicySurvivesRestart) {
    {
        network_policy_reconciler reconciler(store_);
        ASSERT_TRUE(reconciler.set_policy(network_policy::for_no_tasks).has_value());
    }

    network_policy_reconciler restored(store_);
    EXPECT_EQ(restored.policy(), network_policy::for_no_tasks);
    EXPECT_FALSE(restored.requires_unmetered(make_task("a", true)));
}

TEST_F(NetworkPolicyReconcilerTest, UnknownSavedPolicyIgnored) {
    ASSERT_TRUE(store_->save_setting("network_policy", "whenever").has_value());

    network_policy_reconciler reconciler(store_);
    EXPECT_EQ(reconciler.policy(), network_policy::as_set_by_task);
}

TEST_F(NetworkPolicyReconcilerTest, WorksWithoutStore) {
    network_policy_reconciler reconciler(nullptr);
    EXPECT_TRUE(reconciler.set_policy(network_policy::for_all_tasks).has_value());
    EXPECT_TRUE(reconciler.requires_unmetered(make_task("a", false)));
}

TEST_F(NetworkPolicyReconcilerTest, PersistFailureStillChangesPolicy) {
    network_policy_reconciler reconciler(store_);

    std::filesystem::remove_all(root_ / "settings");
    std::ofstream(root_ / "settings") << "blocks the settings directory";

    auto result = reconciler.set_policy(network_policy::for_all_tasks);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::state_write_error);
    EXPECT_EQ(reconciler.policy(), network_policy::for_all_tasks);
}

TEST_F(NetworkPolicyReconcilerTest, OverridesRecordedAndForgotten) {
    network_policy_reconciler reconciler(store_);
    ASSERT_TRUE(reconciler.set_policy(network_policy::for_all_tasks).has_value());

    reconciler.record_override("a", false);
    EXPECT_EQ(reconciler.override_for("a"), false);
    EXPECT_FALSE(reconciler.requires_unmetered(make_task("a", true)));

    reconciler.forget("a");
    EXPECT_FALSE(reconciler.override_for("a").has_value());
    EXPECT_TRUE(reconciler.requires_unmetered(make_task("a", false)));
}

TEST_F(NetworkPolicyReconcilerTest, ChangedByOnlyWhenConstraintFlips) {
    network_policy_reconciler reconciler(store_);
    auto metered_ok = make_task("a", false);
    auto unmetered_only = make_task("b", true);

    EXPECT_TRUE(reconciler.changed_by(metered_ok, network_policy::as_set_by_task,
                                      network_policy::for_all_tasks));
    EXPECT_FALSE(reconciler.changed_by(unmetered_only, network_policy::as_set_by_task,
                                       network_policy::for_all_tasks));
    EXPECT_TRUE(reconciler.changed_by(unmetered_only, network_policy::for_all_tasks,
                                      network_policy::for_no_tasks));
    EXPECT_FALSE(reconciler.changed_by(metered_ok, network_policy::for_no_tasks,
                                       network_policy::for_no_tasks));

    reconciler.record_override("a", true);
    EXPECT_FALSE(reconciler.changed_by(metered_ok, network_policy::as_set_by_task,
                                       network_policy::for_no_tasks));
}

}  // namespace kcenon::background_transfer::test
