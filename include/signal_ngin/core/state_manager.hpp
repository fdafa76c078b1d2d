// include/signal_ngin/core/state_manager.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "signal_ngin/core/error.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType {
    PIPELINE_EXECUTOR,
    SCHEDULER,
    JOB_QUEUE,
    WORKER_CLASS,
    MARKET_DATA,
    DATABASE,
    SIGNAL_SINK
};

inline std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::PAUSED:
            return "PAUSED";
        case ComponentState::ERR_STATE:
            return "ERR_STATE";
        case ComponentState::STOPPED:
            return "STOPPED";
    }
    return "UNKNOWN";
}

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of component lifecycle states
 *
 * Transitions are validated: INITIALIZED -> RUNNING|ERR_STATE,
 * RUNNING -> PAUSED|STOPPED|ERR_STATE, PAUSED -> RUNNING|STOPPED|ERR_STATE,
 * ERR_STATE -> INITIALIZED|STOPPED, STOPPED -> INITIALIZED.
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");
    bool is_registered(const std::string& component_id) const;
    bool is_healthy() const;
    std::vector<std::string> get_all_components() const;

    static void reset_instance() {
        auto& inst = instance();
        std::unique_lock<std::recursive_mutex> lock(inst.mutex_);
        inst.components_.clear();
        inst.cv_.notify_all();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<void> validate_transition(ComponentState current_state, ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::recursive_mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace signal_ngin
