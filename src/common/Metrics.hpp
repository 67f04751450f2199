#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace slob::common::metrics {

class Registry {
public:
    struct TimingSnapshot {
        std::uint64_t calls{0};
        std::optional<double> p50Ms{};
        std::optional<double> p99Ms{};
        std::optional<double> maxMs{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, TimingSnapshot> timings;
        std::unordered_map<std::string, std::uint64_t> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    // Records the wall time of a venue or storage call under the given key.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string key);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ScopedTimer(ScopedTimer&&) = delete;
        ScopedTimer& operator=(ScopedTimer&&) = delete;

    private:
        std::string key_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    void recordTiming(const std::string& key, double latencyMs);

    std::uint64_t counter(const std::string& counterKey) const;
    std::optional<double> gauge(const std::string& gaugeKey) const;
    Snapshot snapshot() const;

private:
    static constexpr std::size_t kMaxSamplesPerTiming = 4096;

    struct TimingSamples {
        std::uint64_t calls{0};
        std::vector<double> samplesMs;
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TimingSamples> timings_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeSnapshot> gauges_;
};

// Logs every counter and gauge at Info level, sorted by key.
void logSnapshot(const Registry::Snapshot& snapshot);

}  // namespace slob::common::metrics
