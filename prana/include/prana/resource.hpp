#pragma once
// Resource: how loaded is the machine right now
//
// A pure read. The orchestrator backs off when either gauge
// crosses its threshold.

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>

namespace prana {

struct ResourceSample {
    float cpu_percent = 0.0f;
    float mem_percent = 0.0f;
};

struct ResourceThresholds {
    float cpu_percent = 90.0f;
    float mem_percent = 90.0f;

    bool overloaded(const ResourceSample& s) const {
        return s.cpu_percent > cpu_percent || s.mem_percent > mem_percent;
    }
};

class ResourceMonitor {
public:
    virtual ~ResourceMonitor() = default;
    virtual ResourceSample sample() = 0;
};

// Fixed reading, for hosts that supply their own numbers
class StaticResourceMonitor : public ResourceMonitor {
public:
    explicit StaticResourceMonitor(ResourceSample s = {}) : sample_(s) {}

    ResourceSample sample() override { return sample_; }
    void set(ResourceSample s) { sample_ = s; }

private:
    ResourceSample sample_;
};

// Linux /proc reader. CPU is the busy share of jiffies since the previous
// sample (the first sample reports 0); memory is 1 - MemAvailable/MemTotal.
// Unreadable files report 0 rather than failing the tick.
class SystemResourceMonitor : public ResourceMonitor {
public:
    ResourceSample sample() override {
        ResourceSample s;
        s.cpu_percent = read_cpu();
        s.mem_percent = read_mem();
        return s;
    }

private:
    float read_cpu() {
        std::ifstream in("/proc/stat");
        std::string line;
        if (!in || !std::getline(in, line)) return 0.0f;

        std::istringstream iss(line);
        std::string label;
        iss >> label;
        if (label != "cpu") return 0.0f;

        uint64_t user = 0, nice = 0, system = 0, idle = 0;
        uint64_t iowait = 0, irq = 0, softirq = 0, steal = 0;
        iss >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;

        uint64_t idle_all = idle + iowait;
        uint64_t total = user + nice + system + idle + iowait + irq + softirq + steal;

        float pct = 0.0f;
        if (have_prev_ && total > prev_total_) {
            uint64_t dt = total - prev_total_;
            uint64_t di = idle_all >= prev_idle_ ? idle_all - prev_idle_ : 0;
            pct = 100.0f * static_cast<float>(dt - std::min(di, dt)) / static_cast<float>(dt);
        }
        prev_total_ = total;
        prev_idle_ = idle_all;
        have_prev_ = true;
        return pct;
    }

    static float read_mem() {
        std::ifstream in("/proc/meminfo");
        if (!in) return 0.0f;

        uint64_t total = 0, available = 0;
        std::string key;
        uint64_t value = 0;
        std::string unit;
        while (in >> key >> value) {
            std::getline(in, unit);
            if (key == "MemTotal:") total = value;
            else if (key == "MemAvailable:") available = value;
            if (total && available) break;
        }
        if (total == 0) return 0.0f;
        return 100.0f * (1.0f - static_cast<float>(available) / static_cast<float>(total));
    }

    uint64_t prev_total_ = 0;
    uint64_t prev_idle_ = 0;
    bool have_prev_ = false;
};

} // namespace prana
