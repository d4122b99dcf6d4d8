#pragma once
// Incentive: the reward loop
//
// Behaviour that helps is rewarded. Behaviour that wastes is penalised.
// Every event lands in the history and moves two emotions.

#include "types.hpp"
#include "emotion.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace prana {

enum class RewardType : uint8_t {
    Curiosity,
    Efficiency,
    Cooperation,
    Innovation
};

enum class PenaltyType : uint8_t {
    Error,
    ResourceWaste,
    Conflict,
    Stagnation
};

inline const char* reward_name(RewardType t) {
    switch (t) {
        case RewardType::Curiosity:   return "curiosity";
        case RewardType::Efficiency:  return "efficiency";
        case RewardType::Cooperation: return "cooperation";
        case RewardType::Innovation:  return "innovation";
    }
    return "unknown";
}

inline const char* penalty_name(PenaltyType t) {
    switch (t) {
        case PenaltyType::Error:         return "error";
        case PenaltyType::ResourceWaste: return "resource_waste";
        case PenaltyType::Conflict:      return "conflict";
        case PenaltyType::Stagnation:    return "stagnation";
    }
    return "unknown";
}

inline RewardType parse_reward(std::string_view name) {
    for (RewardType t : {RewardType::Curiosity, RewardType::Efficiency,
                         RewardType::Cooperation, RewardType::Innovation}) {
        if (name == reward_name(t)) return t;
    }
    throw std::invalid_argument("Unknown reward type: " + std::string(name));
}

inline PenaltyType parse_penalty(std::string_view name) {
    for (PenaltyType t : {PenaltyType::Error, PenaltyType::ResourceWaste,
                          PenaltyType::Conflict, PenaltyType::Stagnation}) {
        if (name == penalty_name(t)) return t;
    }
    throw std::invalid_argument("Unknown penalty type: " + std::string(name));
}

// Incentive configuration
struct IncentiveConfig {
    // Reward weights (positive)
    float curiosity_reward = 5.0f;
    float efficiency_reward = 3.0f;
    float cooperation_reward = 4.0f;
    float innovation_reward = 6.0f;

    // Penalty weights (negative)
    float error_penalty = -3.0f;
    float resource_waste_penalty = -4.0f;
    float conflict_penalty = -5.0f;
    float stagnation_penalty = -2.0f;

    // Scaling factors, kept within [scaling_min, scaling_max]
    float reward_scaling = 1.0f;
    float penalty_scaling = 1.0f;
    float scaling_min = 0.5f;
    float scaling_max = 1.5f;

    float trend_threshold = 0.2f;  // |trend| above this adapts scaling
    float emotion_decay = DEFAULT_DECAY;

    float weight(RewardType t) const {
        switch (t) {
            case RewardType::Curiosity:   return curiosity_reward;
            case RewardType::Efficiency:  return efficiency_reward;
            case RewardType::Cooperation: return cooperation_reward;
            case RewardType::Innovation:  return innovation_reward;
        }
        return 0.0f;
    }

    float weight(PenaltyType t) const {
        switch (t) {
            case PenaltyType::Error:         return error_penalty;
            case PenaltyType::ResourceWaste: return resource_waste_penalty;
            case PenaltyType::Conflict:      return conflict_penalty;
            case PenaltyType::Stagnation:    return stagnation_penalty;
        }
        return 0.0f;
    }

    void validate() const {
        if (!(scaling_min > 0.0f) || scaling_min > scaling_max) {
            throw std::invalid_argument("Incentive scaling bounds must satisfy 0 < min <= max");
        }
        if (!(reward_scaling >= scaling_min && reward_scaling <= scaling_max) ||
            !(penalty_scaling >= scaling_min && penalty_scaling <= scaling_max)) {
            throw std::invalid_argument("Incentive scaling must start within [scaling_min, scaling_max]");
        }
        EmotionalState::check_decay(emotion_decay);
        if (curiosity_reward < 0.0f || efficiency_reward < 0.0f ||
            cooperation_reward < 0.0f || innovation_reward < 0.0f) {
            throw std::invalid_argument("Reward weights must be non-negative");
        }
        if (error_penalty > 0.0f || resource_waste_penalty > 0.0f ||
            conflict_penalty > 0.0f || stagnation_penalty > 0.0f) {
            throw std::invalid_argument("Penalty weights must be non-positive");
        }
    }
};

// Two-emotion response to an incentive event
struct EmotionRule {
    Emotion first;
    float first_factor;
    Emotion second;
    float second_factor;
};

inline EmotionRule emotion_rule(RewardType t) {
    switch (t) {
        case RewardType::Curiosity:   return {Emotion::Surprise, 0.5f, Emotion::Joy, 0.3f};
        case RewardType::Efficiency:  return {Emotion::Joy, 0.4f, Emotion::Trust, 0.2f};
        case RewardType::Cooperation: return {Emotion::Trust, 0.5f, Emotion::Joy, 0.2f};
        case RewardType::Innovation:  return {Emotion::Surprise, 0.3f, Emotion::Joy, 0.4f};
    }
    return {Emotion::Joy, 0.0f, Emotion::Joy, 0.0f};
}

inline EmotionRule emotion_rule(PenaltyType t) {
    switch (t) {
        case PenaltyType::Error:         return {Emotion::Sadness, 0.4f, Emotion::Surprise, 0.2f};
        case PenaltyType::ResourceWaste: return {Emotion::Disgust, 0.3f, Emotion::Anger, 0.3f};
        case PenaltyType::Conflict:      return {Emotion::Anger, 0.5f, Emotion::Fear, 0.2f};
        case PenaltyType::Stagnation:    return {Emotion::Sadness, 0.4f, Emotion::Disgust, 0.2f};
    }
    return {Emotion::Sadness, 0.0f, Emotion::Sadness, 0.0f};
}

// Single history entry
struct RewardRecord {
    std::string category;
    float value;       // Signed: rewards > 0, penalties < 0
    Timestamp timestamp;
};

class IncentiveSystem {
public:
    explicit IncentiveSystem(IncentiveConfig config = {})
        : config_(config) {
        config_.validate();
    }

    // Returns the scaled (positive) reward
    float apply_reward(RewardType type, float magnitude,
                       EmotionalState& emotions, Timestamp at = now()) {
        float scaled = config_.weight(type) * magnitude * config_.reward_scaling;
        history_.push_back({reward_name(type), scaled, at});

        EmotionRule rule = emotion_rule(type);
        emotions.update_emotion(rule.first, scaled * rule.first_factor, config_.emotion_decay);
        emotions.update_emotion(rule.second, scaled * rule.second_factor, config_.emotion_decay);
        return scaled;
    }

    // Returns the scaled (negative) penalty; emotions rise by its magnitude
    float apply_penalty(PenaltyType type, float magnitude,
                        EmotionalState& emotions, Timestamp at = now()) {
        float scaled = config_.weight(type) * magnitude * config_.penalty_scaling;
        history_.push_back({penalty_name(type), scaled, at});

        EmotionRule rule = emotion_rule(type);
        emotions.update_emotion(rule.first, -scaled * rule.first_factor, config_.emotion_decay);
        emotions.update_emotion(rule.second, -scaled * rule.second_factor, config_.emotion_decay);
        return scaled;
    }

    float apply_reward(std::string_view name, float magnitude,
                       EmotionalState& emotions, Timestamp at = now()) {
        return apply_reward(parse_reward(name), magnitude, emotions, at);
    }

    float apply_penalty(std::string_view name, float magnitude,
                        EmotionalState& emotions, Timestamp at = now()) {
        return apply_penalty(parse_penalty(name), magnitude, emotions, at);
    }

    // Records with current - timestamp <= window_ms; history is untouched
    std::vector<RewardRecord> recent_rewards(int64_t window_ms = 3600000,
                                             Timestamp current = now()) const {
        std::vector<RewardRecord> recent;
        for (const auto& r : history_) {
            if (current - r.timestamp <= window_ms) {
                recent.push_back(r);
            }
        }
        return recent;
    }

    float total_reward() const {
        float total = 0.0f;
        for (const auto& r : history_) total += r.value;
        return total;
    }

    // Improving performance makes rewards cheaper and penalties dearer;
    // declining performance does the inverse.
    void adapt_incentives(float performance_trend) {
        if (performance_trend > config_.trend_threshold) {
            config_.reward_scaling = std::max(config_.scaling_min, config_.reward_scaling * 0.95f);
            config_.penalty_scaling = std::min(config_.scaling_max, config_.penalty_scaling * 1.05f);
        } else if (performance_trend < -config_.trend_threshold) {
            config_.reward_scaling = std::min(config_.scaling_max, config_.reward_scaling * 1.05f);
            config_.penalty_scaling = std::max(config_.scaling_min, config_.penalty_scaling * 0.95f);
        }
    }

    const std::vector<RewardRecord>& history() const { return history_; }
    float reward_scaling() const { return config_.reward_scaling; }
    float penalty_scaling() const { return config_.penalty_scaling; }
    const IncentiveConfig& config() const { return config_; }

private:
    IncentiveConfig config_;
    std::vector<RewardRecord> history_;
};

} // namespace prana
