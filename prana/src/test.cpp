#include <prana/prana.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <chrono>
#include <limits>
#include <vector>

using namespace prana;

static bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

// Pause hook that records instead of sleeping
struct PauseRecorder {
    std::vector<int64_t> pauses;
    PauseFn fn() {
        return [this](int64_t ms) { pauses.push_back(ms); };
    }
};

// ═══════════════════════════════════════════════════════════════════
// Emotion
// ═══════════════════════════════════════════════════════════════════

void test_emotion_update() {
    std::cout << "Testing Emotion update..." << std::endl;

    EmotionalState s;
    for (Emotion e : ALL_EMOTIONS) assert(near(s.get(e), 50.0f));

    s.update_emotion("joy", 20.0f, 0.9f);
    assert(near(s.get(Emotion::Joy), 70.0f));
    for (Emotion e : ALL_EMOTIONS) {
        if (e != Emotion::Joy) assert(near(s.get(e), 45.0f));
    }
    assert(near(s.stability(), 12.5f));
    assert(near(s.adaptability(), 22.5f));
    assert(near(s.social_alignment(), 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_emotion_clamping() {
    std::cout << "Testing Emotion clamping..." << std::endl;

    EmotionalState s;
    s.update_emotion(Emotion::Joy, 500.0f);
    assert(near(s.get(Emotion::Joy), 100.0f));
    s.update_emotion(Emotion::Fear, -500.0f);
    assert(near(s.get(Emotion::Fear), 0.0f));

    for (int i = 0; i < 50; ++i) {
        s.update_emotion(ALL_EMOTIONS[i % EMOTION_COUNT], (i % 2 ? -37.0f : 61.0f));
        for (float v : s.intensities()) {
            assert(v >= EMOTION_MIN && v <= EMOTION_MAX);
        }
    }

    EmotionalState from_array(std::array<float, EMOTION_COUNT>{{150.0f, -5.0f, 50.0f, 50.0f, 50.0f, 50.0f, 50.0f, 50.0f}});
    assert(near(from_array.get(Emotion::Joy), 100.0f));
    assert(near(from_array.get(Emotion::Sadness), 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_emotion_dominant_and_distance() {
    std::cout << "Testing Emotion dominant/distance..." << std::endl;

    EmotionalState uniform;
    assert(uniform.dominant_emotion().first == Emotion::Joy);  // All tied

    EmotionalState tied(std::array<float, EMOTION_COUNT>{{10.0f, 10.0f, 80.0f, 10.0f, 80.0f, 10.0f, 10.0f, 10.0f}});
    auto dom = tied.dominant_emotion();
    assert(dom.first == Emotion::Fear);  // Fear precedes trust
    assert(near(dom.second, 80.0f));

    // Direction only: a scaled copy is at distance 0
    EmotionalState small(std::array<float, EMOTION_COUNT>{{10.0f, 10.0f, 10.0f, 10.0f, 10.0f, 10.0f, 10.0f, 10.0f}});
    assert(near(uniform.emotional_distance(small), 0.0f));

    EmotionalState joy_only(std::array<float, EMOTION_COUNT>{{100.0f, 0, 0, 0, 0, 0, 0, 0}});
    EmotionalState sad_only(std::array<float, EMOTION_COUNT>{{0, 100.0f, 0, 0, 0, 0, 0, 0}});
    assert(near(joy_only.emotional_distance(sad_only), std::sqrt(2.0f)));

    auto v = joy_only.emotional_vector();
    assert(near(v[0], 1.0f));

    EmotionalState medians(std::array<float, EMOTION_COUNT>{{90.0f, 10.0f, 50.0f, 50.0f, 50.0f, 50.0f, 50.0f, 20.0f}});
    assert(near(medians.median(), 50.0f));

    std::cout << "  PASS" << std::endl;
}

void test_emotion_parse_errors() {
    std::cout << "Testing Emotion parse errors..." << std::endl;

    assert(parse_emotion("anticipation") == Emotion::Anticipation);
    assert(!emotion_from_string("happiness").has_value());

    bool threw = false;
    try {
        parse_emotion("happiness");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    EmotionalState s;
    threw = false;
    try {
        s.update_emotion("joyful", 10.0f);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    for (Emotion e : ALL_EMOTIONS) assert(near(s.get(e), 50.0f));  // Rejected before mutation

    std::cout << "  PASS" << std::endl;
}

void test_emotion_decay_range() {
    std::cout << "Testing Emotion decay range..." << std::endl;

    EmotionalState s;
    for (float decay : {-1.0f, 1.5f, std::numeric_limits<float>::quiet_NaN()}) {
        bool threw = false;
        try {
            s.update_emotion(Emotion::Joy, 0.0f, decay);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    for (Emotion e : ALL_EMOTIONS) assert(near(s.get(e), 50.0f));

    // Both ends of the range are accepted
    s.update_emotion(Emotion::Joy, 0.0f, 1.0f);
    for (Emotion e : ALL_EMOTIONS) assert(near(s.get(e), 50.0f));
    s.update_emotion(Emotion::Joy, 0.0f, 0.0f);
    assert(near(s.get(Emotion::Joy), 50.0f));
    assert(near(s.get(Emotion::Fear), 0.0f));

    // A bad decay in the incentive config never reaches an IncentiveSystem
    IncentiveConfig cfg;
    cfg.emotion_decay = 1.5f;
    bool threw = false;
    try {
        IncentiveSystem inc(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    cfg.emotion_decay = DEFAULT_DECAY;
    cfg.reward_scaling = 4.0f;
    threw = false;
    try {
        IncentiveSystem inc(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Incentive
// ═══════════════════════════════════════════════════════════════════

void test_incentive_reward_penalty() {
    std::cout << "Testing Incentive reward/penalty..." << std::endl;

    IncentiveSystem inc;

    EmotionalState a;
    float r = inc.apply_reward(RewardType::Curiosity, 1.0f, a, 1000);
    assert(near(r, 5.0f));
    assert(near(a.get(Emotion::Joy), 46.5f));
    assert(near(a.get(Emotion::Surprise), 47.25f));

    EmotionalState b;
    float p = inc.apply_penalty("conflict", 2.0f, b, 5000);
    assert(near(p, -10.0f));
    assert(near(b.get(Emotion::Anger), 49.5f));
    assert(near(b.get(Emotion::Fear), 47.0f));

    assert(inc.history().size() == 2);
    assert(inc.history()[0].category == "curiosity");
    assert(inc.history()[1].category == "conflict");
    assert(near(inc.total_reward(), -5.0f));

    bool threw = false;
    try {
        inc.apply_reward("bravery", 1.0f, a);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(inc.history().size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_incentive_recent_window() {
    std::cout << "Testing Incentive recent window..." << std::endl;

    IncentiveSystem inc;
    EmotionalState s;
    inc.apply_reward(RewardType::Efficiency, 1.0f, s, 1000);
    inc.apply_penalty(PenaltyType::Error, 1.0f, s, 5000);

    auto recent = inc.recent_rewards(3000, 6000);
    assert(recent.size() == 1);
    assert(recent[0].category == "error");

    // Inclusive at the boundary
    auto both = inc.recent_rewards(5000, 6000);
    assert(both.size() == 2);

    assert(inc.recent_rewards(10, 6000).empty());
    assert(inc.history().size() == 2);  // Filtering never trims

    std::cout << "  PASS" << std::endl;
}

void test_incentive_adapt() {
    std::cout << "Testing Incentive adaptation..." << std::endl;

    IncentiveSystem up;
    up.adapt_incentives(0.5f);
    assert(near(up.reward_scaling(), 0.95f));
    assert(near(up.penalty_scaling(), 1.05f));

    for (int i = 0; i < 100; ++i) up.adapt_incentives(0.5f);
    assert(near(up.reward_scaling(), 0.5f));
    assert(near(up.penalty_scaling(), 1.5f));

    IncentiveSystem down;
    down.adapt_incentives(-0.5f);
    assert(near(down.reward_scaling(), 1.05f));
    assert(near(down.penalty_scaling(), 0.95f));

    IncentiveSystem flat;
    flat.adapt_incentives(0.2f);  // Not strictly above the threshold
    flat.adapt_incentives(-0.1f);
    assert(near(flat.reward_scaling(), 1.0f));
    assert(near(flat.penalty_scaling(), 1.0f));

    // Scaling feeds the next reward
    EmotionalState s;
    assert(near(up.apply_reward(RewardType::Innovation, 1.0f, s), 3.0f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Memory
// ═══════════════════════════════════════════════════════════════════

void test_memory_bank() {
    std::cout << "Testing ProbabilisticMemoryBank..." << std::endl;

    MemoryConfig cfg;
    cfg.size = 3;
    cfg.retrieval_noise = 0.0f;
    cfg.seed = 42;
    ProbabilisticMemoryBank bank(cfg);

    bank.store(0, 150.0f);
    assert(near(bank.peek(0), 100.0f));

    bool threw = false;
    try {
        bank.store(3, 1.0f);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        bank.retrieve(5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // Layout follows access frequency
    bank.store(0, 10.0f);
    bank.store(1, 20.0f);
    bank.store(2, 30.0f);
    // Accesses: cell 0 twice, cell 1 three times, cell 2 four times
    for (int i = 0; i < 3; ++i) bank.retrieve(2);
    for (int i = 0; i < 2; ++i) bank.retrieve(1);
    assert(bank.access_patterns()[2] == 4);
    bank.optimize_layout();
    assert(near(bank.peek(0), 30.0f));
    assert(near(bank.peek(1), 20.0f));
    assert(near(bank.peek(2), 10.0f));
    assert(bank.layout_optimizations() == 1);

    // Entanglement mixes toward the mean
    bank.store(0, 0.0f);
    bank.store(1, 100.0f);
    bank.entangle(0, 1, 0.5f);
    assert(near(bank.peek(0), 25.0f));
    assert(near(bank.peek(1), 75.0f));
    assert(near(bank.entanglement(1, 0), 0.5f));

    // Noisy reads stay on scale
    MemoryConfig noisy;
    noisy.retrieval_noise = 0.5f;
    noisy.seed = 7;
    ProbabilisticMemoryBank loud(noisy);
    loud.store(0, 50.0f);
    for (int i = 0; i < 20; ++i) {
        float v = loud.retrieve(0);
        assert(v >= 0.0f && v <= 100.0f);
    }
    assert(loud.access_history().size() == 21);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Health
// ═══════════════════════════════════════════════════════════════════

void test_health_recurring_scenario() {
    std::cout << "Testing Health recurring error scenario..." << std::endl;

    HealthEngine engine;
    engine.log_error("memory_corruption", 20.0f);
    assert(near(engine.metric(HealthMetric::MemoryIntegrity), 80.0f));
    engine.log_error("memory_corruption", 20.0f);
    assert(near(engine.metric(HealthMetric::MemoryIntegrity), 60.0f));
    engine.log_error("memory_corruption", 20.0f);
    assert(near(engine.metric(HealthMetric::MemoryIntegrity), 40.0f));

    auto issues = engine.diagnose();
    assert(issues.size() == 2);
    assert(issues[0].label() == "recurring_memory_corruption");
    assert(near(issues[0].severity, 20.0f));
    assert(issues[0].count.has_value() && *issues[0].count == 3);
    assert(issues[0].description == "Recurring memory corruption detected");
    assert(issues[1].label() == "critical_memory_integrity");
    assert(near(issues[1].severity, 2.0f));
    assert(!issues[1].count.has_value());
    assert(issues[1].description == "Critical memory integrity issue detected");

    std::cout << "  PASS" << std::endl;
}

void test_health_diagnose_ordering() {
    std::cout << "Testing Health diagnose ordering..." << std::endl;

    HealthEngine engine;
    assert(engine.diagnose().empty());

    engine.log_error("protocol_violation", 70.0f);     // comm 30 -> critical 4.0
    engine.log_error("emotional_deadlock", 90.0f);     // emotional 10 -> critical 8.0
    for (int i = 0; i < 3; ++i) engine.log_error("decision_oscillation", 5.0f);  // recurring 5.0

    auto issues = engine.diagnose();
    assert(issues.size() == 3);
    for (size_t i = 1; i < issues.size(); ++i) {
        assert(issues[i - 1].severity >= issues[i].severity);
    }
    assert(issues[0].label() == "critical_emotional_balance");
    assert(issues[1].label() == "recurring_decision_oscillation");
    assert(issues[2].label() == "critical_communication_reliability");

    // Metrics floor at zero
    engine.log_error("memory_leak", 500.0f);
    assert(near(engine.metric(HealthMetric::MemoryIntegrity), 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_health_heal_healthy() {
    std::cout << "Testing Health heal (healthy)..." << std::endl;

    PauseRecorder rec;
    EmotionalState emotions;
    DecisionParameters decisions;
    decisions.decision_threshold = 0.9f;
    HealthEngine engine({}, {nullptr, &emotions, &decisions}, rec.fn());

    auto report = engine.heal();
    assert(report.status == HealStatus::Healthy);
    assert(std::string(heal_status_name(report.status)) == "healthy");
    assert(report.actions.empty());
    assert(rec.pauses.empty());
    assert(near(decisions.decision_threshold, 0.9f));
    for (Emotion e : ALL_EMOTIONS) assert(near(emotions.get(e), 50.0f));
    for (HealthMetric m : ALL_HEALTH_METRICS) assert(near(engine.metric(m), 100.0f));

    std::cout << "  PASS" << std::endl;
}

void test_health_heal_scenario() {
    std::cout << "Testing Health heal (recurring memory corruption)..." << std::endl;

    PauseRecorder rec;
    AgentConfig cfg;
    cfg.memory.seed = 11;
    cfg.health.seed = 11;
    Agent agent(cfg, nullptr, rec.fn());

    for (int i = 0; i < 3; ++i) agent.log_error("memory_corruption", 20.0f);

    auto report = agent.heal();
    assert(report.status == HealStatus::HealingPerformed);
    assert(report.actions.size() == 1);  // critical_memory_integrity matches no strategy
    assert(report.actions[0].issue == "recurring_memory_corruption");
    assert(report.actions[0].strategy == RecoveryStrategy::MemoryCorruption);
    assert(report.actions[0].outcome == "Deep memory healing performed");

    assert(near(agent.health().metric(HealthMetric::MemoryIntegrity), 70.0f));
    assert(agent.health().unhealed_count() == 0);
    for (const auto& r : agent.health().error_log()) assert(r.healed);
    assert(agent.memory().layout_optimizations() == 1);
    assert(agent.health().diagnose().empty());

    std::cout << "  PASS" << std::endl;
}

void test_health_no_suitable_strategy() {
    std::cout << "Testing Health heal (no suitable strategy)..." << std::endl;

    HealthEngine engine;
    uint64_t id = engine.log_error("memory_leak", 60.0f);
    assert(id == 1);

    auto report = engine.heal();
    assert(report.status == HealStatus::NoSuitableStrategy);
    assert(std::string(heal_status_name(report.status)) == "no_suitable_healing_strategy");
    assert(report.actions.empty());
    assert(engine.unhealed_count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_health_strategy_effects() {
    std::cout << "Testing Health strategy effects..." << std::endl;

    // Resource depletion, major and minor
    {
        PauseRecorder rec;
        HealthEngine engine({}, {}, rec.fn());
        for (int i = 0; i < 3; ++i) engine.log_error("resource_depletion", 8.0f);
        assert(near(engine.metric(HealthMetric::ResourceEfficiency), 76.0f));
        auto report = engine.heal();
        assert(report.actions.size() == 1);
        assert(report.actions[0].outcome == "Major resource reallocation performed");
        assert(rec.pauses.size() == 1 && rec.pauses[0] == 10);
        assert(near(engine.metric(HealthMetric::ResourceEfficiency), 92.0f));
    }
    {
        PauseRecorder rec;
        HealthEngine engine({}, {}, rec.fn());
        for (int i = 0; i < 3; ++i) engine.log_error("resource_depletion", 4.0f);
        auto report = engine.heal();
        assert(report.actions[0].outcome == "Resource usage optimization performed");
        assert(rec.pauses.size() == 1 && rec.pauses[0] == 5);
        assert(near(engine.metric(HealthMetric::ResourceEfficiency), 92.0f));
    }

    // Decision paralysis, deep and shallow
    {
        DecisionParameters params;
        params.decision_threshold = 0.9f;
        HealthEngine engine({}, {nullptr, nullptr, &params});
        for (int i = 0; i < 3; ++i) engine.log_error("decision_paralysis", 7.0f);
        auto report = engine.heal();
        assert(report.actions[0].outcome == "Decision system reset with increased exploration");
        assert(near(params.decision_threshold, 0.6f));
        assert(near(params.exploration_rate, 0.3f));
        assert(near(engine.metric(HealthMetric::DecisionQuality), 100.0f));
    }
    {
        DecisionParameters params;
        params.decision_threshold = 0.2f;
        HealthEngine engine({}, {nullptr, nullptr, &params});
        for (int i = 0; i < 3; ++i) engine.log_error("decision_paralysis", 2.0f);
        auto report = engine.heal();
        assert(report.actions[0].outcome == "Decision thresholds reset");
        assert(near(params.decision_threshold, 0.6f));
        assert(near(params.exploration_rate, 0.1f));
        assert(near(engine.metric(HealthMetric::DecisionQuality), 97.0f));
    }

    // Communication failure
    {
        PauseRecorder rec;
        HealthEngine engine({}, {}, rec.fn());
        for (int i = 0; i < 3; ++i) engine.log_error("communication_failure", 4.0f);
        auto report = engine.heal();
        assert(report.actions[0].strategy == RecoveryStrategy::CommunicationFailure);
        assert(rec.pauses.size() == 1 && rec.pauses[0] == 20);
        assert(near(engine.metric(HealthMetric::CommunicationReliability), 98.0f));
    }

    // Missing collaborator: benign outcome, metric untouched
    {
        HealthEngine engine;
        for (int i = 0; i < 3; ++i) engine.log_error("decision_paralysis", 2.0f);
        auto report = engine.heal();
        assert(report.status == HealStatus::HealingPerformed);
        assert(near(engine.metric(HealthMetric::DecisionQuality), 94.0f));
    }

    std::cout << "  PASS" << std::endl;
}

void test_health_emotional_rebalance() {
    std::cout << "Testing Health emotional rebalance..." << std::endl;

    EmotionalState emotions(std::array<float, EMOTION_COUNT>{{90.0f, 10.0f, 50.0f, 50.0f, 50.0f, 50.0f, 50.0f, 20.0f}});
    HealthEngine engine({}, {nullptr, &emotions, nullptr});
    for (int i = 0; i < 3; ++i) engine.log_error("emotional_instability", 4.0f);
    assert(near(engine.metric(HealthMetric::EmotionalBalance), 88.0f));

    auto report = engine.heal();
    assert(report.actions.size() == 1);
    assert(report.actions[0].outcome == "Emotional rebalancing performed on [joy, sadness, surprise]");
    assert(emotions.get(Emotion::Joy) < 90.0f);
    assert(emotions.get(Emotion::Sadness) > 10.0f);
    assert(emotions.get(Emotion::Surprise) > 20.0f);
    assert(near(engine.metric(HealthMetric::EmotionalBalance), 98.0f));

    std::cout << "  PASS" << std::endl;
}

void test_health_ring_buffer() {
    std::cout << "Testing Health error log eviction..." << std::endl;

    HealthConfig cfg;
    cfg.error_log_capacity = 3;
    HealthEngine engine(cfg);
    for (int i = 0; i < 5; ++i) engine.log_error("cosmic_ray", 1.0f);

    assert(engine.error_log().size() == 3);
    assert(engine.error_log().front().id == 3);
    assert(engine.error_log().back().id == 5);
    for (HealthMetric m : ALL_HEALTH_METRICS) assert(near(engine.metric(m), 100.0f));

    // Unknown types still recur
    auto issues = engine.diagnose();
    assert(issues.size() == 1);
    assert(issues[0].label() == "recurring_cosmic_ray");

    std::cout << "  PASS" << std::endl;
}

class FailingStore : public MemoryStore {
public:
    size_t size() const override { return 4; }
    void store(size_t, float) override {}
    float retrieve(size_t) override { return 0.0f; }
    float peek(size_t) const override { return 0.0f; }
    void optimize_layout() override { throw std::runtime_error("store offline"); }
};

void test_health_strategy_failure() {
    std::cout << "Testing Health strategy failure..." << std::endl;

    PauseRecorder rec;
    FailingStore store;
    HealthEngine engine({}, {&store, nullptr, nullptr}, rec.fn());
    for (int i = 0; i < 3; ++i) engine.log_error("resource_depletion", 30.0f);
    for (int i = 0; i < 3; ++i) engine.log_error("memory_corruption", 20.0f);

    bool threw = false;
    try {
        engine.heal();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // The resource remedy ran first and keeps its records healed
    assert(near(engine.metric(HealthMetric::ResourceEfficiency), 30.0f));
    assert(engine.unhealed_count() == 3);
    for (const auto& r : engine.error_log()) {
        assert(r.healed == (r.type == "resource_depletion"));
    }

    std::cout << "  PASS" << std::endl;
}

void test_health_deep_scrub() {
    std::cout << "Testing Health deep memory scrub..." << std::endl;

    // Noisy reads straddle the critical value; the scrub must not care
    for (uint64_t seed : {1u, 7u, 42u, 1234u, 99991u}) {
        MemoryConfig mcfg;
        mcfg.size = 10;
        mcfg.retrieval_noise = 0.05f;
        mcfg.seed = seed;
        ProbabilisticMemoryBank bank(mcfg);
        for (size_t i = 0; i < 5; ++i) bank.store(i, 74.0f);
        for (size_t i = 5; i < 10; ++i) bank.store(i, 30.0f);

        HealthConfig hcfg;
        hcfg.seed = seed;
        HealthEngine engine(hcfg, {&bank, nullptr, nullptr});
        for (int i = 0; i < 3; ++i) engine.log_error("memory_corruption", 10.0f);
        assert(near(engine.metric(HealthMetric::MemoryIntegrity), 70.0f));

        auto report = engine.heal();
        assert(report.actions.size() == 1);
        assert(report.actions[0].outcome == "Deep memory healing performed");

        // Severity 10 zeroes every non-critical cell; critical ones keep their value
        size_t kept = 0, zeroed = 0;
        for (size_t i = 0; i < bank.size(); ++i) {
            if (near(bank.peek(i), 74.0f)) kept++;
            else if (near(bank.peek(i), 0.0f)) zeroed++;
        }
        assert(kept == 5);
        assert(zeroed == 5);
        assert(near(engine.metric(HealthMetric::MemoryIntegrity), 100.0f));
    }

    std::cout << "  PASS" << std::endl;
}

void test_strategy_selection() {
    std::cout << "Testing strategy selection..." << std::endl;

    assert(select_strategy("memory_corruption") == RecoveryStrategy::MemoryCorruption);
    assert(select_strategy("deep_decision_paralysis_x") == RecoveryStrategy::DecisionParalysis);
    assert(!select_strategy("memory_integrity").has_value());
    assert(!select_strategy("memory_leak").has_value());
    assert(metric_for_error("protocol_violation") == HealthMetric::CommunicationReliability);
    assert(!metric_for_error("cosmic_ray").has_value());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Orchestrator
// ═══════════════════════════════════════════════════════════════════

void test_orchestrator_advance() {
    std::cout << "Testing Orchestrator advance with sustain..." << std::endl;

    Orchestrator orch;
    orch.start(0);
    assert(orch.phase() == Phase::Init);
    assert(orch.active_teams().size() == 1);

    auto out = orch.tick(100);  // Default efficiency 0.5
    assert(out.action == TickAction::Idle);
    assert(out.next_delay_ms == 100);

    orch.set_team_efficiency(0, 0.9f);
    assert(orch.tick(200).action == TickAction::Idle);  // Clock restarted at 100
    out = orch.tick(3100);
    assert(out.action == TickAction::Advanced);
    assert(out.phase == Phase::Cohesion);
    assert(orch.complexity() == 10);
    assert(orch.active_teams().size() == 2);
    assert(orch.state().teams[1].active);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_rejects_non_finite() {
    std::cout << "Testing Orchestrator non-finite reports..." << std::endl;

    Orchestrator orch;
    orch.start(0);

    bool threw = false;
    try {
        orch.set_team_efficiency(0, std::numeric_limits<float>::quiet_NaN());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(near(orch.state().teams[0].efficiency, 0.5f));
    assert(orch.tick(5000).action == TickAction::Idle);

    threw = false;
    try {
        orch.set_error_rate(std::numeric_limits<float>::infinity());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(near(orch.state().error_rate, 0.0f));

    // Finite values are still clamped
    orch.set_team_efficiency(0, 3.0f);
    assert(near(orch.state().teams[0].efficiency, 1.0f));
    orch.set_error_rate(-0.5f);
    assert(near(orch.state().error_rate, 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_hysteresis() {
    std::cout << "Testing Orchestrator hysteresis..." << std::endl;

    Orchestrator orch;
    orch.start(0);
    orch.set_team_efficiency(0, 0.9f);
    orch.tick(0);
    assert(orch.tick(3000).action == TickAction::Advanced);

    orch.set_team_efficiency(1, 0.9f);
    assert(orch.tick(4900).action == TickAction::Idle);   // 1900 above threshold
    orch.set_team_efficiency(1, 0.5f);
    assert(orch.tick(5500).action == TickAction::Idle);   // Dip restarts the clock
    orch.set_team_efficiency(1, 0.9f);
    assert(orch.tick(8000).action == TickAction::Idle);   // 2500 since the dip
    assert(orch.tick(8500).action == TickAction::Advanced);
    assert(orch.phase() == Phase::AdversarialCortex);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_revert() {
    std::cout << "Testing Orchestrator revert..." << std::endl;

    Orchestrator orch;
    orch.start(0);
    orch.set_team_efficiency(0, 0.9f);
    orch.tick(0);
    assert(orch.tick(3000).action == TickAction::Advanced);
    assert(orch.complexity() == 10);

    orch.set_error_rate(0.5f);
    // Exactly the stability interval is not yet judged
    assert(orch.tick(13000).action == TickAction::Idle);

    auto out = orch.tick(23001);
    assert(out.action == TickAction::Reverted);
    assert(out.phase == Phase::Init);
    assert(out.next_delay_ms == 0);
    assert(!orch.state().teams[1].active);
    assert(orch.complexity() == 0);

    // Holding at Init: nothing to revert
    out = orch.tick(33002);
    assert(out.action == TickAction::Reverted);
    assert(out.phase == Phase::Init);
    assert(out.next_delay_ms == 100);
    assert(orch.complexity() == 0);

    // Error rate at the ceiling is stable
    orch.set_error_rate(0.1f);
    assert(orch.tick(50000).action != TickAction::Reverted);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_throttle() {
    std::cout << "Testing Orchestrator throttle..." << std::endl;

    StaticResourceMonitor monitor({95.0f, 10.0f});
    Orchestrator orch({}, &monitor);
    orch.start(0);
    orch.set_team_efficiency(0, 0.9f);

    auto out = orch.tick(5000);
    assert(out.action == TickAction::Throttled);
    assert(out.next_delay_ms == 1000);
    assert(out.phase == Phase::Init);

    monitor.set({10.0f, 91.0f});
    assert(orch.tick(5100).action == TickAction::Throttled);

    monitor.set({90.0f, 90.0f});  // At threshold is not overload
    assert(orch.tick(5200).action == TickAction::Advanced);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_finalize_and_restart() {
    std::cout << "Testing Orchestrator warp drive..." << std::endl;

    Orchestrator orch;
    orch.start(0);
    for (size_t i = 0; i < TEAM_COUNT; ++i) orch.set_team_efficiency(i, 0.9f);

    orch.tick(0);
    assert(orch.tick(3000).phase == Phase::Cohesion);
    assert(orch.tick(6000).phase == Phase::AdversarialCortex);
    assert(orch.tick(9000).phase == Phase::HyperCompression);
    auto out = orch.tick(12000);
    assert(out.action == TickAction::Advanced);
    assert(out.phase == Phase::WarpDrive);
    assert(orch.complexity() == 40);

    out = orch.tick(12100);
    assert(out.action == TickAction::Finalized);
    assert(orch.is_light_speed());
    assert(!orch.is_running());
    assert(orch.active_teams().size() == TEAM_COUNT);

    // Terminal and idempotent
    for (int i = 0; i < 3; ++i) {
        out = orch.tick(12200 + i);
        assert(out.action == TickAction::Halted);
        assert(out.phase == Phase::WarpDrive);
    }
    assert(orch.complexity() == 40);

    orch.start(20000);
    assert(orch.phase() == Phase::Init);
    assert(!orch.is_light_speed());
    assert(orch.is_running());
    assert(orch.active_teams().size() == 1);
    assert(orch.complexity() == 40);

    std::cout << "  PASS" << std::endl;
}

void test_orchestrator_complexity_warning() {
    std::cout << "Testing Orchestrator complexity warning..." << std::endl;

    OrchestratorConfig cfg;
    cfg.max_complexity = 15;
    cfg.sustain_ms = 0;
    Orchestrator orch(cfg);
    orch.start(0);
    for (size_t i = 0; i < TEAM_COUNT; ++i) orch.set_team_efficiency(i, 1.0f);

    auto out = orch.tick(1);
    assert(out.action == TickAction::Advanced && !out.complexity_warning);
    out = orch.tick(2);
    assert(out.action == TickAction::Advanced && out.complexity_warning);
    assert(orch.phase() == Phase::AdversarialCortex);  // Warning never blocks

    bool threw = false;
    try {
        orch.set_team_efficiency(TEAM_COUNT, 0.5f);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_combine() {
    std::cout << "Testing team output combine..." << std::endl;

    std::vector<Signal> two = {{1.0f, 2.0f}, {3.0f, 4.0f}};
    Signal raw = combine_weighted(two, false);
    assert(raw.size() == 2);
    assert(near(raw[0], 0.7f));   // 0.1*1 + 0.2*3
    assert(near(raw[1], 1.0f));   // 0.1*2 + 0.2*4

    Signal normalized = combine_weighted(two, true);
    assert(near(normalized[0], 0.7f / 0.3f));
    assert(near(normalized[1], 1.0f / 0.3f));

    Signal mean = combine_mean(two);
    assert(near(mean[0], 2.0f) && near(mean[1], 3.0f));

    std::vector<Signal> five(5, Signal{1.0f});
    assert(near(combine_weighted(five, false)[0], 1.0f));  // Fifth output unweighted

    assert(combine_weighted({}, false).empty());

    bool threw = false;
    try {
        combine_mean({{1.0f, 2.0f}, {1.0f}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_process_with_warp() {
    std::cout << "Testing process_with_warp..." << std::endl;

    OrchestratorConfig cfg;
    cfg.sustain_ms = 0;
    cfg.diversity.window_size = 3;
    Orchestrator orch(cfg);
    orch.start(0);

    int low_signals = 0;
    orch.on_low_diversity([&low_signals](float d) {
        assert(d < 0.6f);
        low_signals++;
    });

    orch.set_team_processor(0, [](const Signal& in) {
        Signal out = in;
        for (float& v : out) v *= 2.0f;
        return out;
    });

    Signal out = orch.process_with_warp({1.0f, 2.0f});
    assert(near(out[0], 0.2f) && near(out[1], 0.4f));  // Single team, weight 0.1
    orch.process_with_warp({1.0f, 2.0f});
    assert(low_signals == 0);                            // Window not yet full
    orch.process_with_warp({1.0f, 2.0f});
    assert(low_signals == 1);
    assert(orch.diversity().distinct() == 1);

    for (size_t i = 0; i < TEAM_COUNT; ++i) orch.set_team_efficiency(i, 1.0f);
    for (int t = 1; orch.is_running(); ++t) orch.tick(t);
    assert(orch.is_light_speed());

    out = orch.process_with_warp({3.0f});
    assert(near(out[0], (6.0f + 3.0f * 4) / 5.0f));      // Mean over all five teams

    std::cout << "  PASS" << std::endl;
}

void test_diversity_tracker() {
    std::cout << "Testing TaskDiversityTracker..." << std::endl;

    TaskDiversityTracker tracker({4, 0.6f});
    for (int i = 0; i < 3; ++i) tracker.update({1.0f});
    assert(!tracker.full());
    assert(!tracker.is_low());

    tracker.update({1.0f});
    assert(tracker.full());
    assert(near(tracker.diversity(), 0.25f));
    assert(tracker.is_low());

    tracker.update({2.0f});
    tracker.update({3.0f});
    tracker.update({4.0f});
    assert(tracker.size() == 4);
    assert(tracker.distinct() == 4);
    assert(!tracker.is_low());

    tracker.clear();
    assert(tracker.size() == 0 && tracker.distinct() == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Ticker
// ═══════════════════════════════════════════════════════════════════

void test_ticker_completes() {
    std::cout << "Testing Ticker run to completion..." << std::endl;

    OrchestratorConfig cfg;
    cfg.sustain_ms = 0;
    cfg.idle_poll_ms = 1;
    Orchestrator orch(cfg);
    for (size_t i = 0; i < TEAM_COUNT; ++i) orch.set_team_efficiency(i, 0.95f);

    Timestamp clock = 0;
    Ticker ticker(orch, [&clock] { return clock += 1; });
    std::vector<TickAction> seen;
    ticker.on_tick([&seen](const TickOutcome& o) { seen.push_back(o.action); });

    assert(ticker.run());
    auto stats = ticker.stats();
    assert(stats.completed);
    assert(stats.advanced == 4);
    assert(stats.ticks == 5);
    assert(seen.back() == TickAction::Finalized);
    assert(orch.phase() == Phase::WarpDrive);
    assert(!ticker.is_running());

    std::cout << "  PASS" << std::endl;
}

void test_ticker_stop_cancels() {
    std::cout << "Testing Ticker stop during backoff..." << std::endl;

    StaticResourceMonitor monitor({99.0f, 0.0f});
    OrchestratorConfig cfg;
    cfg.throttle_backoff_ms = 60000;
    Orchestrator orch(cfg, &monitor);

    Ticker ticker(orch);
    ticker.start();
    assert(ticker.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto begin = std::chrono::steady_clock::now();
    ticker.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    assert(elapsed < std::chrono::seconds(5));

    auto stats = ticker.stats();
    assert(!ticker.is_running());
    assert(!stats.completed);
    assert(stats.throttled >= 1);
    assert(orch.phase() == Phase::Init);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Config + Agent
// ═══════════════════════════════════════════════════════════════════

void test_config_json() {
    std::cout << "Testing AgentConfig JSON..." << std::endl;

    AgentConfig defaults;
    json dumped = defaults;
    assert(dumped["orchestrator"]["sustain_ms"] == 3000);
    assert(dumped["orchestrator"]["stability_interval_ms"] == 10000);
    assert(dumped["health"]["error_log_capacity"] == 100);

    AgentConfig loaded = dumped.get<AgentConfig>();
    assert(loaded.orchestrator.throttle_backoff_ms == 1000);
    assert(near(loaded.incentive.innovation_reward, 6.0f));
    assert(near(loaded.incentive.stagnation_penalty, -2.0f));
    assert(loaded.trend_window == 100);

    // Partial documents keep defaults
    json partial = json::parse(R"({"orchestrator": {"sustain_ms": 500, "diversity": {"window_size": 7}},
                                   "incentive": {"rewards": {"curiosity": 9}}})");
    AgentConfig p = partial.get<AgentConfig>();
    assert(p.orchestrator.sustain_ms == 500);
    assert(p.orchestrator.diversity.window_size == 7);
    assert(near(p.orchestrator.diversity.threshold, 0.6f));
    assert(near(p.orchestrator.efficiency_threshold, 0.8f));
    assert(near(p.incentive.curiosity_reward, 9.0f));
    assert(near(p.incentive.efficiency_reward, 3.0f));

    auto rejects = [](const char* text) {
        try {
            json::parse(text).get<AgentConfig>();
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    assert(rejects(R"({"trend_window": "lots"})"));
    assert(rejects(R"({"version": [2, 0]})"));
    assert(rejects(R"({"log_level": "chatty"})"));
    assert(rejects(R"({"incentive": {"scaling_min": 2.0, "scaling_max": 1.0}})"));
    assert(rejects(R"({"incentive": {"emotion_decay": 1.5}})"));
    assert(rejects(R"({"incentive": {"emotion_decay": -0.1}})"));
    assert(rejects(R"({"incentive": {"reward_scaling": 4.0}})"));
    assert(rejects(R"({"incentive": {"penalty_scaling": 0.1}})"));
    assert(rejects(R"({"orchestrator": "oops"})"));
    assert(rejects(R"({"orchestrator": {"thresholds": 3}})"));
    assert(rejects(R"({"incentive": {"rewards": 5}})"));
    assert(rejects(R"({"incentive": {"penalties": [1, 2]}})"));
    assert(rejects(R"({"health": [1]})"));
    assert(rejects(R"([1, 2])"));
    assert(!rejects(R"({"version": [1, 0]})"));

    assert(parse_log_level("warn") == LogLevel::Warn);

    std::cout << "  PASS" << std::endl;
}

void test_agent() {
    std::cout << "Testing Agent..." << std::endl;

    AgentConfig cfg;
    cfg.trend_window = 5;
    PauseRecorder rec;
    Agent agent(cfg, nullptr, rec.fn());

    for (int i = 0; i < 5; ++i) agent.record_performance(static_cast<float>(i));
    assert(near(agent.performance_trend(), 1.0f));
    assert(near(agent.incentives().reward_scaling(), 0.95f));
    assert(near(agent.incentives().penalty_scaling(), 1.05f));

    agent.apply_event(json{{"kind", "reward"}, {"type", "cooperation"}, {"magnitude", 1.0}});
    assert(near(agent.incentives().total_reward(), 4.0f * 0.95f));

    for (int i = 0; i < 3; ++i) {
        agent.apply_event(json{{"kind", "error"}, {"type", "memory_corruption"}, {"severity", 20}});
    }
    assert(agent.health().diagnose().size() == 2);

    agent.apply_event(json{{"kind", "emotion"}, {"type", "fear"}, {"delta", 10}});

    bool threw = false;
    try {
        agent.apply_event(json{{"kind", "teleport"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        agent.apply_event(json{{"kind", "penalty"}, {"type", "laziness"}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    agent.decisions().decision_threshold = 0.95f;
    auto report = agent.heal();
    assert(report.status == HealStatus::HealingPerformed);

    json status = agent.status_json();
    assert(status["version"] == PRANA_VERSION);
    assert(status["orchestrator"]["phase"] == "INITIALIZATION");
    assert(status["health"]["unhealed"] == 0);
    assert(status["memory"].size() == cfg.memory.size);
    assert(status["emotions"]["intensities"].contains("anticipation"));
    assert(status["incentives"]["events"] == 1);

    std::cout << "  PASS" << std::endl;
}

int main() {
    set_log_level(LogLevel::Off);

    std::cout << "=== Prana C++ Tests ===" << std::endl;
    std::cout << "Version = " << PRANA_VERSION << std::endl;
    std::cout << std::endl;

    test_emotion_update();
    test_emotion_clamping();
    test_emotion_dominant_and_distance();
    test_emotion_parse_errors();
    test_emotion_decay_range();
    test_incentive_reward_penalty();
    test_incentive_recent_window();
    test_incentive_adapt();
    test_memory_bank();

    std::cout << std::endl;
    std::cout << "=== Health ===" << std::endl;
    test_health_recurring_scenario();
    test_health_diagnose_ordering();
    test_health_heal_healthy();
    test_health_heal_scenario();
    test_health_no_suitable_strategy();
    test_health_strategy_effects();
    test_health_emotional_rebalance();
    test_health_ring_buffer();
    test_health_strategy_failure();
    test_health_deep_scrub();
    test_strategy_selection();

    std::cout << std::endl;
    std::cout << "=== Orchestrator ===" << std::endl;
    test_orchestrator_advance();
    test_orchestrator_rejects_non_finite();
    test_orchestrator_hysteresis();
    test_orchestrator_revert();
    test_orchestrator_throttle();
    test_orchestrator_finalize_and_restart();
    test_orchestrator_complexity_warning();
    test_combine();
    test_process_with_warp();
    test_diversity_tracker();
    test_ticker_completes();
    test_ticker_stop_cancels();

    std::cout << std::endl;
    std::cout << "=== Config & Agent ===" << std::endl;
    test_config_json();
    test_agent();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
