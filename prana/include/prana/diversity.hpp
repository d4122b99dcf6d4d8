#pragma once
// Diversity: is the agent seeing the same task over and over?
//
// A sliding window of raw inputs. Low diversity is only reported,
// never corrected here.

#include "types.hpp"
#include <deque>
#include <map>

namespace prana {

struct DiversityConfig {
    size_t window_size = 100;  // Inputs remembered
    float threshold = 0.6f;    // distinct / window below this = low
};

class TaskDiversityTracker {
public:
    explicit TaskDiversityTracker(DiversityConfig config = {})
        : config_(config) {}

    void update(const Signal& task) {
        window_.push_back(task);
        counts_[task]++;

        while (window_.size() > config_.window_size) {
            auto it = counts_.find(window_.front());
            if (it != counts_.end() && --it->second == 0) {
                counts_.erase(it);
            }
            window_.pop_front();
        }
    }

    size_t distinct() const { return counts_.size(); }
    size_t size() const { return window_.size(); }
    bool full() const { return window_.size() >= config_.window_size; }

    // distinct / window size (not / inputs seen)
    float diversity() const {
        if (config_.window_size == 0) return 1.0f;
        return static_cast<float>(counts_.size()) / static_cast<float>(config_.window_size);
    }

    // Only judged once the window is full
    bool is_low() const {
        if (!full()) return false;
        return diversity() < config_.threshold;
    }

    void clear() {
        window_.clear();
        counts_.clear();
    }

    const DiversityConfig& config() const { return config_; }

private:
    DiversityConfig config_;
    std::deque<Signal> window_;
    std::map<Signal, size_t> counts_;
};

} // namespace prana
