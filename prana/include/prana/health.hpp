#pragma once
// Health: diagnosis and recovery
//
// Errors are logged, not thrown. Each one wears down a gauge.
// Diagnosis turns worn gauges and repeating errors into issues;
// healing runs the matching remedy for the worst of them.

#include "types.hpp"
#include "emotion.hpp"
#include "log.hpp"
#include "memory.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <deque>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace prana {

// Health gauges, each in [0, 100]
enum class HealthMetric : uint8_t {
    MemoryIntegrity,
    EmotionalBalance,
    ResourceEfficiency,
    DecisionQuality,
    CommunicationReliability
};

constexpr size_t HEALTH_METRIC_COUNT = 5;

constexpr std::array<HealthMetric, HEALTH_METRIC_COUNT> ALL_HEALTH_METRICS = {
    HealthMetric::MemoryIntegrity, HealthMetric::EmotionalBalance,
    HealthMetric::ResourceEfficiency, HealthMetric::DecisionQuality,
    HealthMetric::CommunicationReliability
};

inline const char* metric_name(HealthMetric m) {
    switch (m) {
        case HealthMetric::MemoryIntegrity:          return "memory_integrity";
        case HealthMetric::EmotionalBalance:         return "emotional_balance";
        case HealthMetric::ResourceEfficiency:       return "resource_efficiency";
        case HealthMetric::DecisionQuality:          return "decision_quality";
        case HealthMetric::CommunicationReliability: return "communication_reliability";
    }
    return "unknown";
}

// Error category table: two error types feed each gauge
inline std::optional<HealthMetric> metric_for_error(std::string_view type) {
    if (type == "memory_corruption" || type == "memory_leak")
        return HealthMetric::MemoryIntegrity;
    if (type == "emotional_instability" || type == "emotional_deadlock")
        return HealthMetric::EmotionalBalance;
    if (type == "resource_depletion" || type == "resource_contention")
        return HealthMetric::ResourceEfficiency;
    if (type == "decision_paralysis" || type == "decision_oscillation")
        return HealthMetric::DecisionQuality;
    if (type == "communication_failure" || type == "protocol_violation")
        return HealthMetric::CommunicationReliability;
    return std::nullopt;
}

// Recovery strategies, in selection order
enum class RecoveryStrategy : uint8_t {
    MemoryCorruption,
    EmotionalInstability,
    ResourceDepletion,
    DecisionParalysis,
    CommunicationFailure
};

constexpr std::array<RecoveryStrategy, 5> STRATEGY_TABLE = {
    RecoveryStrategy::MemoryCorruption, RecoveryStrategy::EmotionalInstability,
    RecoveryStrategy::ResourceDepletion, RecoveryStrategy::DecisionParalysis,
    RecoveryStrategy::CommunicationFailure
};

inline const char* strategy_name(RecoveryStrategy s) {
    switch (s) {
        case RecoveryStrategy::MemoryCorruption:     return "memory_corruption";
        case RecoveryStrategy::EmotionalInstability: return "emotional_instability";
        case RecoveryStrategy::ResourceDepletion:    return "resource_depletion";
        case RecoveryStrategy::DecisionParalysis:    return "decision_paralysis";
        case RecoveryStrategy::CommunicationFailure: return "communication_failure";
    }
    return "unknown";
}

// First strategy whose key occurs inside the subject
inline std::optional<RecoveryStrategy> select_strategy(std::string_view subject) {
    for (RecoveryStrategy s : STRATEGY_TABLE) {
        if (subject.find(strategy_name(s)) != std::string_view::npos) return s;
    }
    return std::nullopt;
}

struct ErrorRecord {
    uint64_t id = 0;
    std::string type;
    float severity = 0.0f;
    Timestamp timestamp = 0;
    nlohmann::json details = nlohmann::json::object();
    bool healed = false;
};

enum class IssueKind : uint8_t { Critical, Recurring };

struct Issue {
    IssueKind kind = IssueKind::Critical;
    std::string subject;               // Metric name or error type
    float severity = 0.0f;
    std::optional<size_t> count;       // Recurring only
    std::string description;
    std::vector<uint64_t> record_ids;  // Unhealed records behind this issue

    std::string label() const {
        return (kind == IssueKind::Critical ? "critical_" : "recurring_") + subject;
    }
};

struct HealAction {
    std::string issue;
    RecoveryStrategy strategy;
    std::string outcome;
};

enum class HealStatus : uint8_t {
    Healthy,
    HealingPerformed,
    NoSuitableStrategy
};

inline const char* heal_status_name(HealStatus s) {
    switch (s) {
        case HealStatus::Healthy:            return "healthy";
        case HealStatus::HealingPerformed:   return "healing_performed";
        case HealStatus::NoSuitableStrategy: return "no_suitable_healing_strategy";
    }
    return "unknown";
}

struct HealReport {
    HealStatus status = HealStatus::Healthy;
    std::vector<HealAction> actions;
};

// Health configuration
struct HealthConfig {
    size_t error_log_capacity = 100;     // Ring buffer, oldest evicted
    float critical_below = 50.0f;        // Gauge under this = critical issue
    size_t recurring_min_count = 3;      // Unhealed repeats = recurring issue
    size_t max_actions_per_heal = 3;     // Issues handled per heal()
    float memory_critical_value = 70.0f; // Cells above this survive a scrub
    int64_t resource_major_pause_ms = 10;
    int64_t resource_minor_pause_ms = 5;
    int64_t communication_pause_ms = 20;
    uint64_t seed = 0;                   // 0 = nondeterministic scrub
};

// What the remedies act on. Non-owning; any may be null, in which case the
// matching remedy reports that it had nothing to act on.
struct RecoveryTargets {
    MemoryStore* memory = nullptr;
    EmotionalState* emotions = nullptr;
    DecisionParameters* decisions = nullptr;
};

inline std::string humanize(std::string s) {
    std::replace(s.begin(), s.end(), '_', ' ');
    return s;
}

class HealthEngine {
public:
    explicit HealthEngine(HealthConfig config = {},
                          RecoveryTargets targets = {},
                          PauseFn pause = real_pause())
        : config_(config)
        , targets_(targets)
        , pause_(std::move(pause))
        , rng_(config.seed ? config.seed : std::random_device{}()) {
        metrics_.fill(100.0f);
    }

    void attach(RecoveryTargets targets) { targets_ = targets; }

    // Append to the log and wear down the matching gauge
    uint64_t log_error(const std::string& type, float severity,
                       nlohmann::json details = nlohmann::json::object(),
                       Timestamp at = now()) {
        ErrorRecord rec;
        rec.id = next_id_++;
        rec.type = type;
        rec.severity = std::max(0.0f, severity);
        rec.timestamp = at;
        rec.details = std::move(details);
        uint64_t id = rec.id;

        log_.push_back(std::move(rec));
        while (log_.size() > config_.error_log_capacity) {
            log_.pop_front();
        }

        if (auto metric = metric_for_error(type)) {
            float& v = gauge(*metric);
            v = std::max(0.0f, v - std::max(0.0f, severity));
        } else {
            log_debug("health", "error type '%s' maps to no gauge", type.c_str());
        }
        return id;
    }

    // Critical gauges, then recurring errors (first-seen order), sorted by
    // severity descending with ties kept in discovery order
    std::vector<Issue> diagnose() const {
        std::vector<Issue> issues;

        for (HealthMetric m : ALL_HEALTH_METRICS) {
            float value = metric(m);
            if (value < config_.critical_below) {
                Issue issue;
                issue.kind = IssueKind::Critical;
                issue.subject = metric_name(m);
                issue.severity = (config_.critical_below - value) / config_.critical_below * 10.0f;
                issue.description = "Critical " + humanize(issue.subject) + " issue detected";
                for (const auto& rec : log_) {
                    if (!rec.healed && metric_for_error(rec.type) == m) {
                        issue.record_ids.push_back(rec.id);
                    }
                }
                issues.push_back(std::move(issue));
            }
        }

        struct Tally {
            std::string type;
            size_t count = 0;
            float total_severity = 0.0f;
            std::vector<uint64_t> ids;
        };
        std::vector<Tally> tallies;
        for (const auto& rec : log_) {
            if (rec.healed) continue;
            auto it = std::find_if(tallies.begin(), tallies.end(),
                [&rec](const Tally& t) { return t.type == rec.type; });
            if (it == tallies.end()) {
                tallies.push_back({rec.type, 0, 0.0f, {}});
                it = tallies.end() - 1;
            }
            it->count++;
            it->total_severity += rec.severity;
            it->ids.push_back(rec.id);
        }

        for (auto& t : tallies) {
            if (t.count >= config_.recurring_min_count) {
                Issue issue;
                issue.kind = IssueKind::Recurring;
                issue.subject = t.type;
                issue.severity = t.total_severity / static_cast<float>(t.count);
                issue.count = t.count;
                issue.description = "Recurring " + humanize(t.type) + " detected";
                issue.record_ids = std::move(t.ids);
                issues.push_back(std::move(issue));
            }
        }

        std::stable_sort(issues.begin(), issues.end(),
            [](const Issue& a, const Issue& b) { return a.severity > b.severity; });
        return issues;
    }

    // Run remedies for the worst issues. Records behind an issue are marked
    // healed as soon as its remedy returns; if a remedy throws, the records
    // of that issue stay unhealed and the exception reaches the caller.
    HealReport heal() {
        HealReport report;
        auto issues = diagnose();
        if (issues.empty()) {
            report.status = HealStatus::Healthy;
            return report;
        }

        size_t limit = std::min(issues.size(), config_.max_actions_per_heal);
        for (size_t i = 0; i < limit; ++i) {
            const Issue& issue = issues[i];
            auto strategy = select_strategy(issue.subject);
            if (!strategy) {
                log_debug("health", "no strategy for %s", issue.label().c_str());
                continue;
            }

            std::string outcome;
            try {
                outcome = run_strategy(*strategy, issue.severity);
            } catch (const std::exception& e) {
                prana::log_error("health", "%s failed on %s: %s",
                          strategy_name(*strategy), issue.label().c_str(), e.what());
                throw;
            }

            log_info("health", "%s -> %s: %s", issue.label().c_str(),
                     strategy_name(*strategy), outcome.c_str());
            report.actions.push_back({issue.label(), *strategy, outcome});
            mark_healed(issue.record_ids);
        }

        report.status = report.actions.empty()
            ? HealStatus::NoSuitableStrategy
            : HealStatus::HealingPerformed;
        return report;
    }

    float metric(HealthMetric m) const { return metrics_[static_cast<size_t>(m)]; }
    const std::deque<ErrorRecord>& error_log() const { return log_; }

    size_t unhealed_count() const {
        return static_cast<size_t>(std::count_if(log_.begin(), log_.end(),
            [](const ErrorRecord& r) { return !r.healed; }));
    }

    const HealthConfig& config() const { return config_; }

private:
    float& gauge(HealthMetric m) { return metrics_[static_cast<size_t>(m)]; }

    void raise(HealthMetric m, float gain) {
        float& v = gauge(m);
        v = std::min(100.0f, v + gain);
    }

    void mark_healed(const std::vector<uint64_t>& ids) {
        for (auto& rec : log_) {
            if (rec.healed) continue;
            if (std::find(ids.begin(), ids.end(), rec.id) != ids.end()) {
                rec.healed = true;
            }
        }
    }

    std::string run_strategy(RecoveryStrategy s, float severity) {
        switch (s) {
            case RecoveryStrategy::MemoryCorruption:     return heal_memory_corruption(severity);
            case RecoveryStrategy::EmotionalInstability: return heal_emotional_instability(severity);
            case RecoveryStrategy::ResourceDepletion:    return heal_resource_depletion(severity);
            case RecoveryStrategy::DecisionParalysis:    return heal_decision_paralysis(severity);
            case RecoveryStrategy::CommunicationFailure: return heal_communication_failure(severity);
        }
        return "No action taken";
    }

    std::string heal_memory_corruption(float severity) {
        if (!targets_.memory) return "No memory store attached; nothing to repair";
        MemoryStore& mem = *targets_.memory;

        mem.optimize_layout();

        if (severity > 7.0f) {
            // Snapshot the strong cells, scrub the rest at random, restore.
            // Classified on the exact value so read noise cannot demote a cell.
            std::vector<std::pair<size_t, float>> backups;
            std::vector<bool> critical(mem.size(), false);
            for (size_t i = 0; i < mem.size(); ++i) {
                float v = mem.peek(i);
                if (v > config_.memory_critical_value) {
                    critical[i] = true;
                    backups.emplace_back(i, v);
                }
            }

            std::uniform_real_distribution<float> coin(0.0f, 1.0f);
            for (size_t i = 0; i < mem.size(); ++i) {
                if (!critical[i] && coin(rng_) < severity / 10.0f) {
                    mem.store(i, 0.0f);
                }
            }

            for (const auto& [i, v] : backups) {
                mem.store(i, v);
            }

            raise(HealthMetric::MemoryIntegrity, std::min(30.0f, severity * 3.0f));
            return "Deep memory healing performed";
        }

        raise(HealthMetric::MemoryIntegrity, std::min(15.0f, severity * 2.0f));
        return "Memory layout optimization performed";
    }

    std::string heal_emotional_instability(float severity) {
        if (!targets_.emotions) return "No emotional state attached; nothing to rebalance";
        EmotionalState& state = *targets_.emotions;

        float median = state.median();

        std::array<Emotion, EMOTION_COUNT> order = ALL_EMOTIONS;
        std::stable_sort(order.begin(), order.end(),
            [&state, median](Emotion a, Emotion b) {
                return std::fabs(state.get(a) - median) > std::fabs(state.get(b) - median);
            });

        float rate = std::min(0.5f, severity / 10.0f);
        std::string names;
        for (size_t i = 0; i < 3; ++i) {
            Emotion e = order[i];
            state.update_emotion(e, (median - state.get(e)) * rate);
            if (!names.empty()) names += ", ";
            names += emotion_name(e);
        }

        raise(HealthMetric::EmotionalBalance, std::min(25.0f, severity * 2.5f));
        return "Emotional rebalancing performed on [" + names + "]";
    }

    std::string heal_resource_depletion(float severity) {
        if (severity > 5.0f) {
            pause_(config_.resource_major_pause_ms);
            raise(HealthMetric::ResourceEfficiency, std::min(20.0f, severity * 2.0f));
            return "Major resource reallocation performed";
        }
        pause_(config_.resource_minor_pause_ms);
        raise(HealthMetric::ResourceEfficiency, std::min(10.0f, severity));
        return "Resource usage optimization performed";
    }

    std::string heal_decision_paralysis(float severity) {
        if (!targets_.decisions) return "No decision parameters attached; nothing to reset";
        DecisionParameters& params = *targets_.decisions;

        params.decision_threshold = DecisionParameters::kDefaultThreshold;

        if (severity > 6.0f) {
            params.exploration_rate = std::min(DecisionParameters::kMaxExploration,
                                               params.exploration_rate + severity / 20.0f);
            raise(HealthMetric::DecisionQuality, std::min(30.0f, severity * 3.0f));
            return "Decision system reset with increased exploration";
        }

        raise(HealthMetric::DecisionQuality, std::min(15.0f, severity * 1.5f));
        return "Decision thresholds reset";
    }

    std::string heal_communication_failure(float severity) {
        pause_(config_.communication_pause_ms);
        raise(HealthMetric::CommunicationReliability, std::min(25.0f, severity * 2.5f));
        return "Communication protocols reset and reinitialized";
    }

    HealthConfig config_;
    RecoveryTargets targets_;
    PauseFn pause_;
    std::mt19937 rng_;
    std::array<float, HEALTH_METRIC_COUNT> metrics_{};
    std::deque<ErrorRecord> log_;
    uint64_t next_id_ = 1;
};

} // namespace prana
