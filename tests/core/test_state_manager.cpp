//===== test_state_manager.cpp =====
#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include "signal_ngin/core/state_manager.hpp"

using namespace signal_ngin;

class StateManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        StateManager::reset_instance();
    }

    void TearDown() override {
        StateManager::reset_instance();
    }

    static ComponentInfo make_info(const std::string& id, ComponentType type,
                                   ComponentState state = ComponentState::INITIALIZED) {
        return ComponentInfo{type, state, id, "", std::chrono::system_clock::now(), {}};
    }
};

TEST_F(StateManagerTest, RegisterComponentSuccess) {
    auto result = StateManager::instance().register_component(
        make_info("executor", ComponentType::PIPELINE_EXECUTOR));
    EXPECT_TRUE(result.is_ok());
    EXPECT_TRUE(StateManager::instance().is_registered("executor"));
}

TEST_F(StateManagerTest, RegisterDuplicateComponent) {
    auto info = make_info("executor", ComponentType::PIPELINE_EXECUTOR);
    ASSERT_TRUE(StateManager::instance().register_component(info).is_ok());
    EXPECT_TRUE(StateManager::instance().register_component(info).is_error());
}

TEST_F(StateManagerTest, StateTransitions) {
    ASSERT_TRUE(StateManager::instance()
                    .register_component(make_info("queue", ComponentType::JOB_QUEUE))
                    .is_ok());

    EXPECT_TRUE(StateManager::instance().update_state("queue", ComponentState::RUNNING).is_ok());
    EXPECT_TRUE(
        StateManager::instance().update_state("queue", ComponentState::INITIALIZED).is_error());
}

TEST_F(StateManagerTest, PauseAndResumeWorkerClass) {
    auto& manager = StateManager::instance();
    ASSERT_TRUE(
        manager.register_component(make_info("queue:us", ComponentType::WORKER_CLASS)).is_ok());
    ASSERT_TRUE(manager.update_state("queue:us", ComponentState::RUNNING).is_ok());

    ASSERT_TRUE(manager.update_state("queue:us", ComponentState::PAUSED).is_ok());
    EXPECT_EQ(manager.get_state("queue:us").value().state, ComponentState::PAUSED);

    ASSERT_TRUE(manager.update_state("queue:us", ComponentState::RUNNING).is_ok());
    EXPECT_EQ(manager.get_state("queue:us").value().state, ComponentState::RUNNING);
}

TEST_F(StateManagerTest, StoppedComponentRestartsThroughInitialized) {
    auto& manager = StateManager::instance();
    ASSERT_TRUE(manager.register_component(make_info("sched", ComponentType::SCHEDULER)).is_ok());
    ASSERT_TRUE(manager.update_state("sched", ComponentState::RUNNING).is_ok());
    ASSERT_TRUE(manager.update_state("sched", ComponentState::STOPPED).is_ok());

    EXPECT_TRUE(manager.update_state("sched", ComponentState::RUNNING).is_error());
    EXPECT_TRUE(manager.update_state("sched", ComponentState::INITIALIZED).is_ok());
    EXPECT_TRUE(manager.update_state("sched", ComponentState::RUNNING).is_ok());
}

TEST_F(StateManagerTest, MetricsAreStored) {
    auto& manager = StateManager::instance();
    ASSERT_TRUE(
        manager.register_component(make_info("executor", ComponentType::PIPELINE_EXECUTOR)).is_ok());
    ASSERT_TRUE(manager.update_metrics("executor", {{"signals_generated", 3.0}}).is_ok());

    auto info = manager.get_state("executor");
    ASSERT_TRUE(info.is_ok());
    EXPECT_DOUBLE_EQ(info.value().metrics.at("signals_generated"), 3.0);

    EXPECT_TRUE(manager.update_metrics("missing", {{"x", 1.0}}).is_error());
}

TEST_F(StateManagerTest, ComponentHealth) {
    auto& manager = StateManager::instance();
    ASSERT_TRUE(
        manager.register_component(make_info("executor", ComponentType::PIPELINE_EXECUTOR)).is_ok());
    ASSERT_TRUE(manager
                    .register_component(make_info("db", ComponentType::DATABASE,
                                                  ComponentState::RUNNING))
                    .is_ok());
    EXPECT_TRUE(manager.is_healthy());

    ASSERT_TRUE(manager.update_state("db", ComponentState::ERR_STATE, "connection lost").is_ok());
    EXPECT_FALSE(manager.is_healthy());
}

TEST_F(StateManagerTest, UnregisterComponent) {
    auto& manager = StateManager::instance();
    ASSERT_TRUE(manager.register_component(make_info("sched", ComponentType::SCHEDULER)).is_ok());
    EXPECT_TRUE(manager.unregister_component("sched").is_ok());
    EXPECT_FALSE(manager.is_registered("sched"));
    EXPECT_TRUE(manager.get_state("sched").is_error());
}
