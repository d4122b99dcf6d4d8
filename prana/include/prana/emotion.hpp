#pragma once
// Emotion: the affective state of an agent
//
// Eight bounded channels. Raising one lets the others fade.
// Stability, adaptability and alignment are read off the eight,
// never set directly.

#include "types.hpp"
#include <array>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace prana {

// Primary emotions, in tie-break order
enum class Emotion : uint8_t {
    Joy,
    Sadness,
    Fear,
    Anger,
    Trust,
    Disgust,
    Anticipation,
    Surprise
};

constexpr size_t EMOTION_COUNT = 8;

constexpr std::array<Emotion, EMOTION_COUNT> ALL_EMOTIONS = {
    Emotion::Joy, Emotion::Sadness, Emotion::Fear, Emotion::Anger,
    Emotion::Trust, Emotion::Disgust, Emotion::Anticipation, Emotion::Surprise
};

inline const char* emotion_name(Emotion e) {
    switch (e) {
        case Emotion::Joy:          return "joy";
        case Emotion::Sadness:      return "sadness";
        case Emotion::Fear:         return "fear";
        case Emotion::Anger:        return "anger";
        case Emotion::Trust:        return "trust";
        case Emotion::Disgust:      return "disgust";
        case Emotion::Anticipation: return "anticipation";
        case Emotion::Surprise:     return "surprise";
    }
    return "unknown";
}

inline std::optional<Emotion> emotion_from_string(std::string_view name) {
    for (Emotion e : ALL_EMOTIONS) {
        if (name == emotion_name(e)) return e;
    }
    return std::nullopt;
}

// Boundary parse: rejects anything outside the eight channels
inline Emotion parse_emotion(std::string_view name) {
    auto e = emotion_from_string(name);
    if (!e) {
        throw std::invalid_argument("Unknown emotion: " + std::string(name));
    }
    return *e;
}

constexpr float EMOTION_MIN = 0.0f;
constexpr float EMOTION_MAX = 100.0f;
constexpr float EMOTION_DEFAULT = 50.0f;
constexpr float DEFAULT_DECAY = 0.9f;

class EmotionalState {
public:
    EmotionalState() {
        intensities_.fill(EMOTION_DEFAULT);
        update_derived_metrics();
    }

    explicit EmotionalState(const std::array<float, EMOTION_COUNT>& values) {
        for (size_t i = 0; i < EMOTION_COUNT; ++i) {
            intensities_[i] = clamp_unit(values[i], EMOTION_MIN, EMOTION_MAX);
        }
        update_derived_metrics();
    }

    float get(Emotion e) const { return intensities_[index(e)]; }
    float operator[](Emotion e) const { return get(e); }

    const std::array<float, EMOTION_COUNT>& intensities() const { return intensities_; }

    // Add delta to one channel (clamped), scale every other channel by decay.
    // Decay must lie in [0,1], so the other channels stay in range without a
    // re-clamp.
    void update_emotion(Emotion e, float delta, float decay = DEFAULT_DECAY) {
        check_decay(decay);
        if (!std::isfinite(delta)) {
            throw std::invalid_argument("Emotion delta must be finite");
        }
        size_t target = index(e);
        intensities_[target] = clamp_unit(intensities_[target] + delta,
                                          EMOTION_MIN, EMOTION_MAX);

        for (size_t i = 0; i < EMOTION_COUNT; ++i) {
            if (i != target) intensities_[i] *= decay;
        }

        update_derived_metrics();
    }

    void update_emotion(std::string_view name, float delta, float decay = DEFAULT_DECAY) {
        update_emotion(parse_emotion(name), delta, decay);
    }

    // Derived metrics (recomputed after every mutation)
    float stability() const { return stability_; }
    float adaptability() const { return adaptability_; }
    float social_alignment() const { return social_alignment_; }

    // Strongest channel; earlier enumerators win ties
    std::pair<Emotion, float> dominant_emotion() const {
        size_t best = 0;
        for (size_t i = 1; i < EMOTION_COUNT; ++i) {
            if (intensities_[i] > intensities_[best]) best = i;
        }
        return {ALL_EMOTIONS[best], intensities_[best]};
    }

    // Unit-length direction of the eight intensities (zero vector stays zero)
    std::array<float, EMOTION_COUNT> emotional_vector() const {
        std::array<float, EMOTION_COUNT> v = intensities_;
        float norm = 0.0f;
        for (float x : v) norm += x * x;
        norm = std::sqrt(norm);
        if (norm > 0.0f) {
            for (float& x : v) x /= norm;
        }
        return v;
    }

    // Euclidean distance between directions; magnitude is ignored
    float emotional_distance(const EmotionalState& other) const {
        auto a = emotional_vector();
        auto b = other.emotional_vector();
        float sum = 0.0f;
        for (size_t i = 0; i < EMOTION_COUNT; ++i) {
            float d = a[i] - b[i];
            sum += d * d;
        }
        return std::sqrt(sum);
    }

    // Median of the eight intensities (mean of the middle pair)
    float median() const {
        std::array<float, EMOTION_COUNT> sorted = intensities_;
        std::sort(sorted.begin(), sorted.end());
        return (sorted[EMOTION_COUNT / 2 - 1] + sorted[EMOTION_COUNT / 2]) / 2.0f;
    }

    static void check_decay(float decay) {
        if (!(decay >= 0.0f && decay <= 1.0f)) {
            throw std::invalid_argument("Emotion decay must lie in [0, 1], got " +
                                        std::to_string(decay));
        }
    }

private:
    static size_t index(Emotion e) { return static_cast<size_t>(e); }

    void update_derived_metrics() {
        float joy = get(Emotion::Joy);
        float sadness = get(Emotion::Sadness);
        float fear = get(Emotion::Fear);
        float anger = get(Emotion::Anger);
        float trust = get(Emotion::Trust);
        float disgust = get(Emotion::Disgust);
        float anticipation = get(Emotion::Anticipation);
        float surprise = get(Emotion::Surprise);

        stability_ = (joy + trust - fear - anger) / 2.0f;
        adaptability_ = (anticipation + surprise - sadness) / 2.0f;
        social_alignment_ = trust - disgust;
    }

    std::array<float, EMOTION_COUNT> intensities_{};
    float stability_ = 0.0f;
    float adaptability_ = 0.0f;
    float social_alignment_ = 0.0f;
};

} // namespace prana
