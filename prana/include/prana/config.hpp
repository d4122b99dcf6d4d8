#pragma once
// Config: one JSON document for every knob
//
// Missing keys keep their defaults. Keys of the wrong type are an error.

#include "health.hpp"
#include "incentive.hpp"
#include "log.hpp"
#include "memory.hpp"
#include "orchestrator.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace prana {

using json = nlohmann::json;

struct AgentConfig {
    OrchestratorConfig orchestrator;
    HealthConfig health;
    IncentiveConfig incentive;
    MemoryConfig memory;
    DecisionParameters decisions;
    size_t performance_capacity = 1000;  // Performance samples kept
    size_t trend_window = 100;           // Samples per incentive adaptation
    std::string log_level = "info";      // debug|info|warn|error|off
};

inline LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

// Value at key, or the default when absent
template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    if (!params.contains(key)) return default_val;
    try {
        return params.at(key).get<T>();
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Config key '") + key + "': " + e.what());
    }
}

// Every config section must be a JSON object
inline void require_object(const json& j, const char* section) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string("Config section '") + section +
                                    "' must be an object, got " + j.type_name());
    }
}

// ─────────────────────────────────────────────────────────────────────
// to_json / from_json (found by nlohmann via ADL)
// ─────────────────────────────────────────────────────────────────────

inline void to_json(json& j, const ResourceThresholds& t) {
    j = json{{"cpu_percent", t.cpu_percent}, {"mem_percent", t.mem_percent}};
}

inline void from_json(const json& j, ResourceThresholds& t) {
    require_object(j, "thresholds");
    t.cpu_percent = get_param(j, "cpu_percent", t.cpu_percent);
    t.mem_percent = get_param(j, "mem_percent", t.mem_percent);
}

inline void to_json(json& j, const DiversityConfig& c) {
    j = json{{"window_size", c.window_size}, {"threshold", c.threshold}};
}

inline void from_json(const json& j, DiversityConfig& c) {
    require_object(j, "diversity");
    c.window_size = get_param(j, "window_size", c.window_size);
    c.threshold = get_param(j, "threshold", c.threshold);
}

inline void to_json(json& j, const OrchestratorConfig& c) {
    j = json{
        {"thresholds", c.thresholds},
        {"efficiency_threshold", c.efficiency_threshold},
        {"sustain_ms", c.sustain_ms},
        {"stability_interval_ms", c.stability_interval_ms},
        {"max_error_rate", c.max_error_rate},
        {"complexity_step", c.complexity_step},
        {"max_complexity", c.max_complexity},
        {"throttle_backoff_ms", c.throttle_backoff_ms},
        {"idle_poll_ms", c.idle_poll_ms},
        {"normalize_phase_weights", c.normalize_phase_weights},
        {"diversity", c.diversity}
    };
}

inline void from_json(const json& j, OrchestratorConfig& c) {
    require_object(j, "orchestrator");
    c.thresholds = get_param(j, "thresholds", c.thresholds);
    c.efficiency_threshold = get_param(j, "efficiency_threshold", c.efficiency_threshold);
    c.sustain_ms = get_param(j, "sustain_ms", c.sustain_ms);
    c.stability_interval_ms = get_param(j, "stability_interval_ms", c.stability_interval_ms);
    c.max_error_rate = get_param(j, "max_error_rate", c.max_error_rate);
    c.complexity_step = get_param(j, "complexity_step", c.complexity_step);
    c.max_complexity = get_param(j, "max_complexity", c.max_complexity);
    c.throttle_backoff_ms = get_param(j, "throttle_backoff_ms", c.throttle_backoff_ms);
    c.idle_poll_ms = get_param(j, "idle_poll_ms", c.idle_poll_ms);
    c.normalize_phase_weights = get_param(j, "normalize_phase_weights", c.normalize_phase_weights);
    c.diversity = get_param(j, "diversity", c.diversity);
}

inline void to_json(json& j, const HealthConfig& c) {
    j = json{
        {"error_log_capacity", c.error_log_capacity},
        {"critical_below", c.critical_below},
        {"recurring_min_count", c.recurring_min_count},
        {"max_actions_per_heal", c.max_actions_per_heal},
        {"memory_critical_value", c.memory_critical_value},
        {"resource_major_pause_ms", c.resource_major_pause_ms},
        {"resource_minor_pause_ms", c.resource_minor_pause_ms},
        {"communication_pause_ms", c.communication_pause_ms},
        {"seed", c.seed}
    };
}

inline void from_json(const json& j, HealthConfig& c) {
    require_object(j, "health");
    c.error_log_capacity = get_param(j, "error_log_capacity", c.error_log_capacity);
    c.critical_below = get_param(j, "critical_below", c.critical_below);
    c.recurring_min_count = get_param(j, "recurring_min_count", c.recurring_min_count);
    c.max_actions_per_heal = get_param(j, "max_actions_per_heal", c.max_actions_per_heal);
    c.memory_critical_value = get_param(j, "memory_critical_value", c.memory_critical_value);
    c.resource_major_pause_ms = get_param(j, "resource_major_pause_ms", c.resource_major_pause_ms);
    c.resource_minor_pause_ms = get_param(j, "resource_minor_pause_ms", c.resource_minor_pause_ms);
    c.communication_pause_ms = get_param(j, "communication_pause_ms", c.communication_pause_ms);
    c.seed = get_param(j, "seed", c.seed);
}

inline void to_json(json& j, const IncentiveConfig& c) {
    j = json{
        {"rewards", {
            {"curiosity", c.curiosity_reward},
            {"efficiency", c.efficiency_reward},
            {"cooperation", c.cooperation_reward},
            {"innovation", c.innovation_reward}
        }},
        {"penalties", {
            {"error", c.error_penalty},
            {"resource_waste", c.resource_waste_penalty},
            {"conflict", c.conflict_penalty},
            {"stagnation", c.stagnation_penalty}
        }},
        {"reward_scaling", c.reward_scaling},
        {"penalty_scaling", c.penalty_scaling},
        {"scaling_min", c.scaling_min},
        {"scaling_max", c.scaling_max},
        {"trend_threshold", c.trend_threshold},
        {"emotion_decay", c.emotion_decay}
    };
}

inline void from_json(const json& j, IncentiveConfig& c) {
    require_object(j, "incentive");
    json rewards = get_param(j, "rewards", json::object());
    require_object(rewards, "incentive.rewards");
    c.curiosity_reward = get_param(rewards, "curiosity", c.curiosity_reward);
    c.efficiency_reward = get_param(rewards, "efficiency", c.efficiency_reward);
    c.cooperation_reward = get_param(rewards, "cooperation", c.cooperation_reward);
    c.innovation_reward = get_param(rewards, "innovation", c.innovation_reward);

    json penalties = get_param(j, "penalties", json::object());
    require_object(penalties, "incentive.penalties");
    c.error_penalty = get_param(penalties, "error", c.error_penalty);
    c.resource_waste_penalty = get_param(penalties, "resource_waste", c.resource_waste_penalty);
    c.conflict_penalty = get_param(penalties, "conflict", c.conflict_penalty);
    c.stagnation_penalty = get_param(penalties, "stagnation", c.stagnation_penalty);

    c.reward_scaling = get_param(j, "reward_scaling", c.reward_scaling);
    c.penalty_scaling = get_param(j, "penalty_scaling", c.penalty_scaling);
    c.scaling_min = get_param(j, "scaling_min", c.scaling_min);
    c.scaling_max = get_param(j, "scaling_max", c.scaling_max);
    c.trend_threshold = get_param(j, "trend_threshold", c.trend_threshold);
    c.emotion_decay = get_param(j, "emotion_decay", c.emotion_decay);
}

inline void to_json(json& j, const MemoryConfig& c) {
    j = json{
        {"size", c.size},
        {"retrieval_noise", c.retrieval_noise},
        {"history_capacity", c.history_capacity},
        {"seed", c.seed}
    };
}

inline void from_json(const json& j, MemoryConfig& c) {
    require_object(j, "memory");
    c.size = get_param(j, "size", c.size);
    c.retrieval_noise = get_param(j, "retrieval_noise", c.retrieval_noise);
    c.history_capacity = get_param(j, "history_capacity", c.history_capacity);
    c.seed = get_param(j, "seed", c.seed);
}

inline void to_json(json& j, const DecisionParameters& p) {
    j = json{{"decision_threshold", p.decision_threshold},
             {"exploration_rate", p.exploration_rate}};
}

inline void from_json(const json& j, DecisionParameters& p) {
    require_object(j, "decisions");
    p.decision_threshold = get_param(j, "decision_threshold", p.decision_threshold);
    p.exploration_rate = get_param(j, "exploration_rate", p.exploration_rate);
}

inline void to_json(json& j, const AgentConfig& c) {
    j = json{
        {"version", {PRANA_CONFIG_VERSION_MAJOR, PRANA_CONFIG_VERSION_MINOR}},
        {"orchestrator", c.orchestrator},
        {"health", c.health},
        {"incentive", c.incentive},
        {"memory", c.memory},
        {"decisions", c.decisions},
        {"performance_capacity", c.performance_capacity},
        {"trend_window", c.trend_window},
        {"log_level", c.log_level}
    };
}

inline void from_json(const json& j, AgentConfig& c) {
    require_object(j, "config");
    if (j.contains("version")) {
        const json& v = j.at("version");
        if (!v.is_array() || v.size() != 2 ||
            !v[0].is_number_integer() || !v[1].is_number_integer() ||
            !version::config_compatible(v[0].get<int>(), v[1].get<int>())) {
            throw std::invalid_argument("Incompatible config version: " + v.dump());
        }
    }
    c.orchestrator = get_param(j, "orchestrator", c.orchestrator);
    c.health = get_param(j, "health", c.health);
    c.incentive = get_param(j, "incentive", c.incentive);
    c.memory = get_param(j, "memory", c.memory);
    c.decisions = get_param(j, "decisions", c.decisions);
    c.performance_capacity = get_param(j, "performance_capacity", c.performance_capacity);
    c.trend_window = get_param(j, "trend_window", c.trend_window);
    c.log_level = get_param(j, "log_level", c.log_level);
    parse_log_level(c.log_level);  // Reject unknown levels at load time
    c.incentive.validate();
}

// Read and parse a config file; throws on I/O or parse failure
inline AgentConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Config " + path + ": " + e.what());
    }
    return j.get<AgentConfig>();
}

} // namespace prana
