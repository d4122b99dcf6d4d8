#pragma once
// Core types: the atoms of the control loop
//
// Time is intrinsic. Every signal is a vector of floats.
// Nothing outside these types is shared between components.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace prana {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Input/output of team processing
using Signal = std::vector<float>;

// Suspension hook used by remediation steps that model latency.
// Tests replace it with a recorder so nothing actually sleeps.
using PauseFn = std::function<void(int64_t ms)>;

inline PauseFn real_pause() {
    return [](int64_t ms) {
        if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    };
}

inline float clamp_unit(float v, float lo, float hi) {
    return std::max(lo, std::min(hi, v));
}

// Parameters owned by the host agent and tuned by recovery
struct DecisionParameters {
    float decision_threshold = 0.6f;
    float exploration_rate = 0.1f;

    static constexpr float kDefaultThreshold = 0.6f;
    static constexpr float kMaxExploration = 0.3f;
};

} // namespace prana
