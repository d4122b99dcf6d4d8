#pragma once
// Memory: a small probabilistic store
//
// Values live on a 0-100 scale, held internally in [0,1].
// Reads are noisy. Neighbouring cells can be entangled (mixed).
// The layout reorders itself around what is read most.

#include "types.hpp"
#include <deque>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace prana {

// Contract the recovery engine depends on
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual size_t size() const = 0;
    virtual void store(size_t index, float value) = 0;
    virtual float retrieve(size_t index) = 0;
    virtual float peek(size_t index) const = 0;  // Exact value, not an access
    virtual void optimize_layout() = 0;
};

struct MemoryConfig {
    size_t size = 10;              // Number of cells
    float retrieval_noise = 0.05f; // Gaussian sigma on the [0,1] scale
    size_t history_capacity = 100; // Access log length
    uint64_t seed = 0;             // 0 = nondeterministic
};

enum class AccessKind : uint8_t { Store, Retrieve };

struct AccessEvent {
    AccessKind kind;
    size_t index;
    Timestamp timestamp;
};

class ProbabilisticMemoryBank : public MemoryStore {
public:
    explicit ProbabilisticMemoryBank(MemoryConfig config = {})
        : config_(config)
        , values_(config.size, 0.0f)
        , entanglement_(config.size * config.size, 0.0f)
        , rng_(config.seed ? config.seed : std::random_device{}()) {}

    size_t size() const override { return config_.size; }

    void store(size_t index, float value) override {
        check_index(index);
        values_[index] = clamp_unit(value / 100.0f, 0.0f, 1.0f);
        record(AccessKind::Store, index);
    }

    float retrieve(size_t index) override {
        check_index(index);
        record(AccessKind::Retrieve, index);

        float v = values_[index];
        if (config_.retrieval_noise > 0.0f) {
            std::normal_distribution<float> noise(0.0f, config_.retrieval_noise);
            v += noise(rng_);
        }
        return clamp_unit(v, 0.0f, 1.0f) * 100.0f;
    }

    // Noise-free read on the 0-100 scale; does not count as an access
    float peek(size_t index) const override {
        check_index(index);
        return values_[index] * 100.0f;
    }

    // Pull two cells toward their mean in proportion to strength
    void entangle(size_t a, size_t b, float strength = 0.5f) {
        check_index(a);
        check_index(b);

        entangle_at(a, b) = strength;
        entangle_at(b, a) = strength;

        float avg = (values_[a] + values_[b]) / 2.0f;
        values_[a] = (1.0f - strength) * values_[a] + strength * avg;
        values_[b] = (1.0f - strength) * values_[b] + strength * avg;
    }

    float entanglement(size_t a, size_t b) const {
        check_index(a);
        check_index(b);
        return entanglement_[a * config_.size + b];
    }

    // Accesses per cell over the retained history
    std::vector<size_t> access_patterns() const {
        std::vector<size_t> counts(config_.size, 0);
        for (const auto& ev : history_) {
            counts[ev.index]++;
        }
        return counts;
    }

    // Move the most accessed cells to the front, carrying entanglement along
    void optimize_layout() override {
        auto counts = access_patterns();

        std::vector<size_t> order(config_.size);
        for (size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::stable_sort(order.begin(), order.end(),
            [&counts](size_t a, size_t b) { return counts[a] > counts[b]; });

        std::vector<float> new_values(config_.size, 0.0f);
        std::vector<float> new_entanglement(config_.size * config_.size, 0.0f);

        for (size_t new_idx = 0; new_idx < order.size(); ++new_idx) {
            new_values[new_idx] = values_[order[new_idx]];
        }
        for (size_t i = 0; i < order.size(); ++i) {
            for (size_t j = 0; j < order.size(); ++j) {
                new_entanglement[i * config_.size + j] =
                    entanglement_[order[i] * config_.size + order[j]];
            }
        }

        values_ = std::move(new_values);
        entanglement_ = std::move(new_entanglement);
        layout_optimizations_++;
    }

    const std::deque<AccessEvent>& access_history() const { return history_; }
    size_t layout_optimizations() const { return layout_optimizations_; }

private:
    void check_index(size_t index) const {
        if (index >= config_.size) {
            throw std::out_of_range("Memory index " + std::to_string(index) +
                                    " out of range [0, " + std::to_string(config_.size) + ")");
        }
    }

    float& entangle_at(size_t a, size_t b) {
        return entanglement_[a * config_.size + b];
    }

    void record(AccessKind kind, size_t index) {
        history_.push_back({kind, index, now()});
        while (history_.size() > config_.history_capacity) {
            history_.pop_front();
        }
    }

    MemoryConfig config_;
    std::vector<float> values_;
    std::vector<float> entanglement_;  // Row-major size x size
    std::deque<AccessEvent> history_;
    std::mt19937 rng_;
    size_t layout_optimizations_ = 0;
};

} // namespace prana
