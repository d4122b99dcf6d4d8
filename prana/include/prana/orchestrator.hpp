#pragma once
// Orchestrator: staged progression toward warp drive
//
// Five phases, one team each (plus the warp team at the end).
// A phase is earned by its team holding efficiency above threshold
// for long enough; it is lost again when the error rate climbs.
// The machine is busy-waited by nobody: each call to step() is one
// tick, and the caller decides when the next one happens.

#include "types.hpp"
#include "diversity.hpp"
#include "log.hpp"
#include "resource.hpp"
#include <array>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace prana {

enum class Phase : uint8_t {
    Init = 1,
    Cohesion = 2,
    AdversarialCortex = 3,
    HyperCompression = 4,
    WarpDrive = 5
};

inline const char* phase_name(Phase p) {
    switch (p) {
        case Phase::Init:              return "INITIALIZATION";
        case Phase::Cohesion:          return "CAPTURING_COHESION";
        case Phase::AdversarialCortex: return "ADVERSARIAL_CORTEX";
        case Phase::HyperCompression:  return "SECONDARY_HYPER_COMPRESSION";
        case Phase::WarpDrive:         return "WARP_DRIVE";
    }
    return "UNKNOWN";
}

inline int phase_index(Phase p) { return static_cast<int>(p); }

constexpr size_t TEAM_COUNT = 5;

// Pure per-team transform
using TeamProcessor = std::function<Signal(const Signal&)>;

inline TeamProcessor identity_processor() {
    return [](const Signal& in) { return in; };
}

struct Team {
    std::string name;
    bool active = false;
    float efficiency = 0.5f;  // [0, 1], reported by the host
    TeamProcessor process = identity_processor();
};

// Everything the loop mutates, owned by whoever drives it
struct PhaseState {
    Phase phase = Phase::Init;
    Timestamp phase_started = 0;
    int complexity = 0;
    float error_rate = 0.0f;  // Reported by the host
    bool running = false;     // Between restart() and warp drive
    bool light_speed = false;
    std::array<Team, TEAM_COUNT> teams = {{
        {"Initialization", false, 0.5f, identity_processor()},
        {"Capturing Cohesion", false, 0.5f, identity_processor()},
        {"Adversarial Cortex", false, 0.5f, identity_processor()},
        {"Secondary Hyper-Compression", false, 0.5f, identity_processor()},
        {"Warp Drive", false, 0.5f, identity_processor()}
    }};

    // Team that gates leaving phase p (and is activated on entering it)
    Team& team_for(Phase p) { return teams[static_cast<size_t>(phase_index(p) - 1)]; }
    const Team& team_for(Phase p) const { return teams[static_cast<size_t>(phase_index(p) - 1)]; }
};

struct OrchestratorConfig {
    ResourceThresholds thresholds;             // Overload = back off
    float efficiency_threshold = 0.8f;         // Team must hold this...
    int64_t sustain_ms = 3000;                 // ...for this long to advance
    int64_t stability_interval_ms = 10000;     // Phase age before stability is judged
    float max_error_rate = 0.1f;               // Above this = unstable, revert
    int complexity_step = 10;
    int max_complexity = 100;                  // Warning only
    int64_t throttle_backoff_ms = 1000;
    int64_t idle_poll_ms = 100;
    bool normalize_phase_weights = false;      // See combine_weighted()
    DiversityConfig diversity;
};

enum class TickAction : uint8_t {
    Halted,     // Not running (never started, or warp drive done)
    Throttled,  // Resource overload, nothing evaluated
    Reverted,   // Unstable, stepped back (or held at Init)
    Advanced,   // Moved to the next phase
    Finalized,  // Warp drive initiated, loop ends
    Idle        // Nothing fired
};

inline const char* tick_action_name(TickAction a) {
    switch (a) {
        case TickAction::Halted:    return "halted";
        case TickAction::Throttled: return "throttled";
        case TickAction::Reverted:  return "reverted";
        case TickAction::Advanced:  return "advanced";
        case TickAction::Finalized: return "finalized";
        case TickAction::Idle:      return "idle";
    }
    return "unknown";
}

struct TickOutcome {
    TickAction action = TickAction::Idle;
    int64_t next_delay_ms = 0;       // How long the driver should wait
    Phase phase = Phase::Init;       // Phase after the tick
    bool complexity_warning = false; // Complexity went over the cap
};

// ═══════════════════════════════════════════════════════════════════
// State transitions (operate on an exclusively borrowed PhaseState)
// ═══════════════════════════════════════════════════════════════════

// Back to Init with only the first team active. Complexity carries over.
inline void restart(PhaseState& s, Timestamp current) {
    s.phase = Phase::Init;
    for (auto& team : s.teams) team.active = false;
    s.team_for(Phase::Init).active = true;
    s.light_speed = false;
    s.running = true;
    s.phase_started = current;
}

// Efficiency gate with hysteresis: any dip restarts the clock
inline bool check_team_efficiency(PhaseState& s, const Team& team,
                                  float threshold, int64_t duration_ms,
                                  Timestamp current) {
    if (team.efficiency >= threshold) {
        return current - s.phase_started >= duration_ms;
    }
    s.phase_started = current;
    return false;
}

// Returns true when complexity went over the cap
inline bool advance_phase(PhaseState& s, const OrchestratorConfig& config, Timestamp current) {
    s.phase = static_cast<Phase>(phase_index(s.phase) + 1);
    s.team_for(s.phase).active = true;
    s.phase_started = current;
    log_info("warp", "Advancing to phase: %s", phase_name(s.phase));

    s.complexity += config.complexity_step;
    if (s.complexity > config.max_complexity) {
        log_warn("warp", "High complexity detected (%d > %d). Consider simplifying the system.",
                 s.complexity, config.max_complexity);
        return true;
    }
    return false;
}

// Returns false when already at Init (nothing to revert)
inline bool revert_phase(PhaseState& s, const OrchestratorConfig& config, Timestamp current) {
    if (s.phase == Phase::Init) return false;

    s.team_for(s.phase).active = false;
    s.phase = static_cast<Phase>(phase_index(s.phase) - 1);
    s.phase_started = current;
    s.complexity -= config.complexity_step;
    log_info("warp", "Reverting to phase: %s", phase_name(s.phase));
    return true;
}

inline void initiate_warp_drive(PhaseState& s) {
    s.light_speed = true;
    for (auto& team : s.teams) team.active = true;
    s.running = false;
    log_info("warp", "Warp Drive initiated! All teams are now active and operating at light speed.");
}

// One tick of the phase machine
inline TickOutcome step(PhaseState& s, const OrchestratorConfig& config,
                        const ResourceSample& resources, Timestamp current) {
    TickOutcome out;

    if (!s.running) {
        out.action = TickAction::Halted;
        out.phase = s.phase;
        return out;
    }

    if (config.thresholds.overloaded(resources)) {
        log_warn("warp", "Resource overload detected (cpu=%.1f%% mem=%.1f%%). Throttling processing.",
                 resources.cpu_percent, resources.mem_percent);
        out.action = TickAction::Throttled;
        out.next_delay_ms = config.throttle_backoff_ms;
        out.phase = s.phase;
        return out;
    }

    if (current - s.phase_started > config.stability_interval_ms &&
        s.error_rate > config.max_error_rate) {
        log_error("warp", "System instability detected (error rate %.3f). Reverting to previous phase.",
                  s.error_rate);
        bool moved = revert_phase(s, config, current);
        out.action = TickAction::Reverted;
        // Holding at Init re-checks immediately otherwise; pace it like an idle tick
        out.next_delay_ms = moved ? 0 : config.idle_poll_ms;
        out.phase = s.phase;
        return out;
    }

    if (s.phase == Phase::WarpDrive) {
        initiate_warp_drive(s);
        out.action = TickAction::Finalized;
        out.phase = s.phase;
        return out;
    }

    const Team& gate = s.team_for(s.phase);
    if (check_team_efficiency(s, gate, config.efficiency_threshold, config.sustain_ms, current)) {
        out.complexity_warning = advance_phase(s, config, current);
        out.action = TickAction::Advanced;
    } else {
        out.action = TickAction::Idle;
    }
    out.next_delay_ms = config.idle_poll_ms;
    out.phase = s.phase;
    return out;
}

// ═══════════════════════════════════════════════════════════════════
// Combining team outputs
// ═══════════════════════════════════════════════════════════════════

constexpr std::array<float, 4> PHASE_WEIGHTS = {0.1f, 0.2f, 0.3f, 0.4f};

inline void check_shapes(const std::vector<Signal>& outputs) {
    for (const auto& o : outputs) {
        if (o.size() != outputs.front().size()) {
            throw std::invalid_argument("Team outputs differ in length: " +
                                        std::to_string(outputs.front().size()) + " vs " +
                                        std::to_string(o.size()));
        }
    }
}

// Elementwise mean
inline Signal combine_mean(const std::vector<Signal>& outputs) {
    if (outputs.empty()) return {};
    check_shapes(outputs);

    Signal combined(outputs.front().size(), 0.0f);
    for (const auto& o : outputs) {
        for (size_t i = 0; i < o.size(); ++i) combined[i] += o[i];
    }
    for (float& v : combined) v /= static_cast<float>(outputs.size());
    return combined;
}

// Weighted sum using PHASE_WEIGHTS truncated to the number of outputs.
// By default the weights are NOT renormalised: two outputs get 0.1 and 0.2
// (sum 0.3), so the result shrinks toward zero. normalize divides by the
// weight sum instead. Outputs past the fourth carry no weight.
inline Signal combine_weighted(const std::vector<Signal>& outputs, bool normalize) {
    if (outputs.empty()) return {};
    check_shapes(outputs);

    Signal combined(outputs.front().size(), 0.0f);
    float weight_sum = 0.0f;
    for (size_t k = 0; k < outputs.size() && k < PHASE_WEIGHTS.size(); ++k) {
        float w = PHASE_WEIGHTS[k];
        weight_sum += w;
        for (size_t i = 0; i < combined.size(); ++i) {
            combined[i] += w * outputs[k][i];
        }
    }
    if (normalize && weight_sum > 0.0f) {
        for (float& v : combined) v /= weight_sum;
    }
    return combined;
}

// ═══════════════════════════════════════════════════════════════════
// Orchestrator: state + config + collaborators
// ═══════════════════════════════════════════════════════════════════

using LowDiversityCallback = std::function<void(float diversity)>;

class Orchestrator {
public:
    explicit Orchestrator(OrchestratorConfig config = {},
                          ResourceMonitor* monitor = nullptr)
        : config_(config)
        , monitor_(monitor)
        , diversity_(config.diversity) {}

    // Begin (or re-begin) a run at Init
    void start(Timestamp current = now()) {
        restart(state_, current);
        log_info("warp", "Warp sequence started at %s", phase_name(state_.phase));
    }

    // One evaluation: sample resources, then step the machine
    TickOutcome tick(Timestamp current = now()) {
        ResourceSample sample = monitor_ ? monitor_->sample() : ResourceSample{};
        return step(state_, config_, sample, current);
    }

    // Every active team transforms the same input; outputs are combined
    Signal process_with_warp(const Signal& input) {
        std::vector<Signal> outputs;
        for (const auto& team : state_.teams) {
            if (team.active) outputs.push_back(team.process(input));
        }

        diversity_.update(input);

        Signal result = state_.light_speed
            ? combine_mean(outputs)
            : combine_weighted(outputs, config_.normalize_phase_weights);

        if (diversity_.is_low()) {
            log_warn("warp", "Low task diversity detected (%.2f). Potential overfitting risk.",
                     diversity_.diversity());
            if (low_diversity_cb_) low_diversity_cb_(diversity_.diversity());
        }
        return result;
    }

    std::vector<const Team*> active_teams() const {
        std::vector<const Team*> active;
        for (const auto& team : state_.teams) {
            if (team.active) active.push_back(&team);
        }
        return active;
    }

    // Non-finite reports are rejected; finite ones are clamped to [0, 1]
    void set_team_efficiency(size_t team, float efficiency) {
        Team& t = team_at(team);
        t.efficiency = clamp_unit(require_finite(efficiency, "Team efficiency"), 0.0f, 1.0f);
    }

    void set_team_processor(size_t team, TeamProcessor fn) {
        team_at(team).process = std::move(fn);
    }

    void set_error_rate(float rate) {
        state_.error_rate = std::max(0.0f, require_finite(rate, "Error rate"));
    }
    void set_monitor(ResourceMonitor* monitor) { monitor_ = monitor; }
    void on_low_diversity(LowDiversityCallback cb) { low_diversity_cb_ = std::move(cb); }

    const PhaseState& state() const { return state_; }
    PhaseState& state() { return state_; }
    const OrchestratorConfig& config() const { return config_; }
    const TaskDiversityTracker& diversity() const { return diversity_; }

    Phase phase() const { return state_.phase; }
    bool is_light_speed() const { return state_.light_speed; }
    bool is_running() const { return state_.running; }
    int complexity() const { return state_.complexity; }

private:
    static float require_finite(float v, const char* what) {
        if (!std::isfinite(v)) {
            throw std::invalid_argument(std::string(what) + " must be finite");
        }
        return v;
    }

    Team& team_at(size_t team) {
        if (team >= TEAM_COUNT) {
            throw std::out_of_range("Team index " + std::to_string(team) + " out of range");
        }
        return state_.teams[team];
    }

    OrchestratorConfig config_;
    ResourceMonitor* monitor_;
    PhaseState state_;
    TaskDiversityTracker diversity_;
    LowDiversityCallback low_diversity_cb_;
};

} // namespace prana
