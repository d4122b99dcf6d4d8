#pragma once
// Agent: one self-regulating whole
//
// Owns every component and wires the recovery engine to the state it
// repairs. Not copyable: the engine holds pointers into the agent.

#include "config.hpp"
#include "emotion.hpp"
#include "health.hpp"
#include "incentive.hpp"
#include "memory.hpp"
#include "orchestrator.hpp"
#include "resource.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <stdexcept>
#include <string>

namespace prana {

class Agent {
public:
    explicit Agent(AgentConfig config = {},
                   ResourceMonitor* monitor = nullptr,
                   PauseFn pause = real_pause())
        : config_(std::move(config))
        , incentives_(config_.incentive)
        , memory_(config_.memory)
        , decisions_(config_.decisions)
        , health_(config_.health, RecoveryTargets{&memory_, &emotions_, &decisions_}, std::move(pause))
        , orchestrator_(config_.orchestrator, monitor)
    {}

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // ═══════════════════════════════════════════════════════════════
    // Feedback
    // ═══════════════════════════════════════════════════════════════

    float reward(RewardType type, float magnitude = 1.0f, Timestamp at = now()) {
        return incentives_.apply_reward(type, magnitude, emotions_, at);
    }

    float penalize(PenaltyType type, float magnitude = 1.0f, Timestamp at = now()) {
        return incentives_.apply_penalty(type, magnitude, emotions_, at);
    }

    uint64_t log_error(const std::string& type, float severity,
                       nlohmann::json details = nlohmann::json::object(),
                       Timestamp at = now()) {
        return health_.log_error(type, severity, std::move(details), at);
    }

    HealReport heal() { return health_.heal(); }

    // Append a performance sample; every trend_window samples the trend
    // is handed to the incentive system
    void record_performance(float value) {
        performance_.push_back(value);
        while (performance_.size() > config_.performance_capacity) {
            performance_.pop_front();
        }

        if (++since_adapt_ >= config_.trend_window) {
            since_adapt_ = 0;
            float trend = performance_trend();
            incentives_.adapt_incentives(trend);
            log_debug("agent", "performance trend %.4f -> scaling r=%.3f p=%.3f", trend,
                      incentives_.reward_scaling(), incentives_.penalty_scaling());
        }
    }

    // Mean first difference over the last trend_window samples (0 when < 2)
    float performance_trend() const {
        size_t n = std::min(performance_.size(), config_.trend_window);
        if (n < 2) return 0.0f;

        size_t first = performance_.size() - n;
        float sum = 0.0f;
        for (size_t i = first + 1; i < performance_.size(); ++i) {
            sum += performance_[i] - performance_[i - 1];
        }
        return sum / static_cast<float>(n - 1);
    }

    // Apply one recorded event:
    //   {"kind":"error","type":T,"severity":S,"details":{...}}
    //   {"kind":"reward"|"penalty","type":T,"magnitude":M}
    //   {"kind":"emotion","type":E,"delta":D}
    //   {"kind":"performance","value":V}
    // "at" (Unix millis) is optional everywhere.
    void apply_event(const nlohmann::json& ev) {
        if (!ev.is_object() || !ev.contains("kind")) {
            throw std::invalid_argument("Event must be an object with a 'kind': " + ev.dump());
        }
        std::string kind = get_param<std::string>(ev, "kind", "");
        Timestamp at = get_param<Timestamp>(ev, "at", now());

        if (kind == "error") {
            log_error(require_type(ev), get_param(ev, "severity", 1.0f),
                      get_param(ev, "details", nlohmann::json::object()), at);
        } else if (kind == "reward") {
            reward(parse_reward(require_type(ev)), get_param(ev, "magnitude", 1.0f), at);
        } else if (kind == "penalty") {
            penalize(parse_penalty(require_type(ev)), get_param(ev, "magnitude", 1.0f), at);
        } else if (kind == "emotion") {
            emotions_.update_emotion(parse_emotion(require_type(ev)),
                                     get_param(ev, "delta", 0.0f),
                                     config_.incentive.emotion_decay);
        } else if (kind == "performance") {
            record_performance(get_param(ev, "value", 0.0f));
        } else {
            throw std::invalid_argument("Unknown event kind: " + kind);
        }
    }

    // ═══════════════════════════════════════════════════════════════
    // Status
    // ═══════════════════════════════════════════════════════════════

    nlohmann::json status_json() const {
        nlohmann::json emotions = nlohmann::json::object();
        for (Emotion e : ALL_EMOTIONS) emotions[emotion_name(e)] = emotions_.get(e);
        auto dominant = emotions_.dominant_emotion();

        nlohmann::json metrics = nlohmann::json::object();
        for (HealthMetric m : ALL_HEALTH_METRICS) metrics[metric_name(m)] = health_.metric(m);

        nlohmann::json teams = nlohmann::json::array();
        for (const Team* team : orchestrator_.active_teams()) teams.push_back(team->name);

        nlohmann::json cells = nlohmann::json::array();
        for (size_t i = 0; i < memory_.size(); ++i) cells.push_back(memory_.peek(i));

        return {
            {"version", PRANA_VERSION},
            {"emotions", {
                {"intensities", emotions},
                {"dominant", {{"emotion", emotion_name(dominant.first)}, {"intensity", dominant.second}}},
                {"stability", emotions_.stability()},
                {"adaptability", emotions_.adaptability()},
                {"social_alignment", emotions_.social_alignment()}
            }},
            {"incentives", {
                {"reward_scaling", incentives_.reward_scaling()},
                {"penalty_scaling", incentives_.penalty_scaling()},
                {"total_reward", incentives_.total_reward()},
                {"events", incentives_.history().size()},
                {"performance_trend", performance_trend()}
            }},
            {"health", {
                {"metrics", metrics},
                {"errors", health_.error_log().size()},
                {"unhealed", health_.unhealed_count()}
            }},
            {"decisions", decisions_},
            {"memory", cells},
            {"orchestrator", {
                {"phase", phase_name(orchestrator_.phase())},
                {"complexity", orchestrator_.complexity()},
                {"running", orchestrator_.is_running()},
                {"light_speed", orchestrator_.is_light_speed()},
                {"active_teams", teams}
            }}
        };
    }

    EmotionalState& emotions() { return emotions_; }
    const EmotionalState& emotions() const { return emotions_; }
    IncentiveSystem& incentives() { return incentives_; }
    const IncentiveSystem& incentives() const { return incentives_; }
    ProbabilisticMemoryBank& memory() { return memory_; }
    const DecisionParameters& decisions() const { return decisions_; }
    DecisionParameters& decisions() { return decisions_; }
    HealthEngine& health() { return health_; }
    const HealthEngine& health() const { return health_; }
    Orchestrator& orchestrator() { return orchestrator_; }
    const Orchestrator& orchestrator() const { return orchestrator_; }
    const std::deque<float>& performance() const { return performance_; }
    const AgentConfig& config() const { return config_; }

private:
    static std::string require_type(const nlohmann::json& ev) {
        std::string type = get_param<std::string>(ev, "type", "");
        if (type.empty()) {
            throw std::invalid_argument("Event is missing 'type': " + ev.dump());
        }
        return type;
    }

    AgentConfig config_;
    EmotionalState emotions_;
    IncentiveSystem incentives_;
    ProbabilisticMemoryBank memory_;
    DecisionParameters decisions_;
    HealthEngine health_;          // Targets the three members above
    Orchestrator orchestrator_;

    std::deque<float> performance_;
    size_t since_adapt_ = 0;
};

} // namespace prana
