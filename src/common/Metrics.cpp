#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

#include "common/Log.hpp"

namespace slob::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string key)
    : key_(std::move(key)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    Registry::instance().recordTiming(key_, duration.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

void Registry::recordTiming(const std::string& key, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timing = timings_[key];
    ++timing.calls;
    if (timing.samplesMs.size() >= kMaxSamplesPerTiming) {
        timing.samplesMs.erase(timing.samplesMs.begin());
    }
    timing.samplesMs.push_back(latencyMs);
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

std::optional<double> Registry::gauge(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(gaugeKey);
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.timings.reserve(timings_.size());
    for (const auto& [key, timing] : timings_) {
        TimingSnapshot timingSnapshot;
        timingSnapshot.calls = timing.calls;
        if (!timing.samplesMs.empty()) {
            auto sorted = timing.samplesMs;
            std::sort(sorted.begin(), sorted.end());
            timingSnapshot.p50Ms = computeQuantile(sorted, 0.50);
            timingSnapshot.p99Ms = computeQuantile(sorted, 0.99);
            timingSnapshot.maxMs = sorted.back();
        }
        snapshot.timings.emplace(key, std::move(timingSnapshot));
    }

    snapshot.counters = counters_;
    snapshot.gauges = gauges_;
    return snapshot;
}

void logSnapshot(const Registry::Snapshot& snapshot) {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(snapshot.capturedAt - snapshot.startTime);
    LOG_INFO("metrics uptime_s=" << uptime.count());

    const std::map<std::string, std::uint64_t> counters(snapshot.counters.begin(), snapshot.counters.end());
    for (const auto& [key, value] : counters) {
        LOG_INFO("metrics counter " << key << '=' << value);
    }
    std::map<std::string, double> gauges;
    for (const auto& [key, gauge] : snapshot.gauges) {
        gauges.emplace(key, gauge.value);
    }
    for (const auto& [key, value] : gauges) {
        LOG_INFO("metrics gauge " << key << '=' << value);
    }
    std::map<std::string, Registry::TimingSnapshot> timings(snapshot.timings.begin(), snapshot.timings.end());
    for (const auto& [key, timing] : timings) {
        LOG_INFO("metrics timing " << key << " calls=" << timing.calls
                                   << " p50_ms=" << timing.p50Ms.value_or(0.0)
                                   << " p99_ms=" << timing.p99Ms.value_or(0.0)
                                   << " max_ms=" << timing.maxMs.value_or(0.0));
    }
}

}  // namespace slob::common::metrics
