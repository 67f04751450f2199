#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace slob::common {

struct Config {
    slob::log::Level logLevel = slob::log::Level::Info;
    std::string logFile;
    std::string configPath;
    std::string storage = "duck";
    std::string duckdbPath = "data/slob.duckdb";
    std::vector<std::string> symbols{"NQ"};

    std::string tickFile;
    std::uint32_t replayPaceMs = 0;

    std::int64_t bucketMs = 60000;
    std::int64_t maxFillSpanBuckets = 2;

    bool enableShort = true;
    bool enableLong = true;
    bool liq1OnWick = false;
    double stopBuffer = 2.0;
    double targetBuffer = 1.0;

    double initialEquity = 50000.0;
    double riskPerTrade = 0.02;
    double pointValue = 20.0;
    int maxContracts = 5;
    double warnDrawdown = 0.15;
    double haltDrawdown = 0.25;
    int maxSubmitAttempts = 3;

    std::uint32_t backoffBaseMs = 1000;
    std::uint32_t backoffCapMs = 60000;
    std::uint32_t maxReconnectAttempts = 10;
    std::uint32_t heartbeatAttempts = 5;
    std::uint32_t heartbeatIntervalMs = 30000;

    std::uint32_t shutdownTimeoutMs = 10000;
    std::uint32_t taskWaitMs = 3000;

    // Sets one option by its command line name without the leading dashes.
    void apply(const std::string& key, const std::string& value);
    // Applies every member of a JSON object; keys use underscores for dashes.
    void applyJson(const std::string& text);

    static Config fromArgs(int argc, char** argv);
};

}  // namespace slob::common
