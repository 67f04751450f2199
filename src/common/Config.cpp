#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

namespace slob::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + label + ": " + value);
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoull(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::int64_t parsePositiveInt(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            throw std::out_of_range("must be a positive integer");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

double parseDouble(const std::string& value, const std::string& label, double minValue, double maxValue) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed) || parsed < minValue || parsed > maxValue) {
            throw std::out_of_range("out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string parseStorage(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "memory" || normalized == "duck") {
        return normalized;
    }
    throw std::runtime_error("Invalid storage: " + value);
}

std::string jsonToOptionValue(const boost::json::value& value, const std::string& key) {
    switch (value.kind()) {
    case boost::json::kind::string: {
        const auto& str = value.get_string();
        return std::string(str.data(), str.size());
    }
    case boost::json::kind::bool_:
        return value.get_bool() ? "true" : "false";
    case boost::json::kind::int64:
        return std::to_string(value.get_int64());
    case boost::json::kind::uint64:
        return std::to_string(value.get_uint64());
    case boost::json::kind::double_: {
        std::ostringstream oss;
        oss << value.get_double();
        return oss.str();
    }
    case boost::json::kind::array: {
        std::string joined;
        for (const auto& item : value.get_array()) {
            if (!joined.empty()) {
                joined += ',';
            }
            joined += jsonToOptionValue(item, key);
        }
        return joined;
    }
    case boost::json::kind::null:
    case boost::json::kind::object:
        break;
    }
    throw std::runtime_error("Unsupported JSON value for " + key);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

// Option names, in the order they are applied from each source.
const std::vector<std::string>& optionKeys() {
    static const std::vector<std::string> keys{
        "log-level",
        "log-file",
        "storage",
        "duckdb",
        "symbols",
        "tick-file",
        "replay-pace-ms",
        "bucket-ms",
        "max-fill-span",
        "enable-short",
        "enable-long",
        "liq1-on-wick",
        "stop-buffer",
        "target-buffer",
        "equity",
        "risk-per-trade",
        "point-value",
        "max-contracts",
        "warn-drawdown",
        "halt-drawdown",
        "max-submit-attempts",
        "backoff-base-ms",
        "backoff-cap-ms",
        "max-reconnect-attempts",
        "heartbeat-attempts",
        "heartbeat-interval-ms",
        "shutdown-timeout-ms",
        "task-wait-ms",
    };
    return keys;
}

// Environment variable for an option: SLOB_ prefix, upper case, underscores.
std::string envName(const std::string& key) {
    std::string name = "SLOB_";
    for (const char ch : key) {
        name += ch == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return name;
}

}  // namespace

void Config::apply(const std::string& key, const std::string& rawValue) {
    const auto value = trim(rawValue);
    if (key == "log-level") {
        logLevel = slob::log::levelFromString(toLower(value));
    } else if (key == "log-file") {
        logFile = value;
    } else if (key == "storage") {
        storage = parseStorage(value);
    } else if (key == "duckdb") {
        if (value.empty()) {
            throw std::runtime_error("Invalid value for duckdb: empty path");
        }
        duckdbPath = value;
    } else if (key == "symbols") {
        auto list = parseCsvList(value);
        if (list.empty()) {
            throw std::runtime_error("Invalid value for symbols: " + rawValue);
        }
        symbols = std::move(list);
    } else if (key == "tick-file") {
        tickFile = value;
    } else if (key == "replay-pace-ms") {
        replayPaceMs = value == "0" ? 0U : parseDurationMs(value, key);
    } else if (key == "bucket-ms") {
        bucketMs = parsePositiveInt(value, key);
    } else if (key == "max-fill-span") {
        maxFillSpanBuckets = parsePositiveInt(value, key);
    } else if (key == "enable-short") {
        enableShort = parseBool(value, key);
    } else if (key == "enable-long") {
        enableLong = parseBool(value, key);
    } else if (key == "liq1-on-wick") {
        liq1OnWick = parseBool(value, key);
    } else if (key == "stop-buffer") {
        stopBuffer = parseDouble(value, key, 0.0, 1e6);
    } else if (key == "target-buffer") {
        targetBuffer = parseDouble(value, key, 0.0, 1e6);
    } else if (key == "equity") {
        initialEquity = parseDouble(value, key, 1e-9, 1e12);
    } else if (key == "risk-per-trade") {
        riskPerTrade = parseDouble(value, key, 1e-9, 0.5);
    } else if (key == "point-value") {
        pointValue = parseDouble(value, key, 1e-9, 1e6);
    } else if (key == "max-contracts") {
        maxContracts = static_cast<int>(std::min<std::int64_t>(parsePositiveInt(value, key), 10000));
    } else if (key == "warn-drawdown") {
        warnDrawdown = parseDouble(value, key, 0.0, 0.99);
    } else if (key == "halt-drawdown") {
        haltDrawdown = parseDouble(value, key, 0.0, 0.99);
    } else if (key == "max-submit-attempts") {
        maxSubmitAttempts = static_cast<int>(std::min<std::int64_t>(parsePositiveInt(value, key), 100));
    } else if (key == "backoff-base-ms") {
        backoffBaseMs = parseDurationMs(value, key);
    } else if (key == "backoff-cap-ms") {
        backoffCapMs = parseDurationMs(value, key);
    } else if (key == "max-reconnect-attempts") {
        maxReconnectAttempts = parseDurationMs(value, key);
    } else if (key == "heartbeat-attempts") {
        heartbeatAttempts = parseDurationMs(value, key);
    } else if (key == "heartbeat-interval-ms") {
        heartbeatIntervalMs = parseDurationMs(value, key);
    } else if (key == "shutdown-timeout-ms") {
        shutdownTimeoutMs = parseDurationMs(value, key);
    } else if (key == "task-wait-ms") {
        taskWaitMs = parseDurationMs(value, key);
    } else {
        throw std::runtime_error("Unknown option: " + key);
    }
}

void Config::applyJson(const std::string& text) {
    boost::json::error_code ec;
    const auto parsed = boost::json::parse(text, ec);
    if (ec) {
        throw std::runtime_error("Invalid config JSON: " + ec.message());
    }
    if (!parsed.is_object()) {
        throw std::runtime_error("Config JSON must be an object");
    }
    for (const auto& member : parsed.get_object()) {
        std::string key(member.key().data(), member.key().size());
        std::replace(key.begin(), key.end(), '_', '-');
        apply(key, jsonToOptionValue(member.value(), key));
    }
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envConfig = std::getenv("SLOB_CONFIG")) {
        config.configPath = trim(envConfig);
    }
    if (auto configArg = valueFromArgs(argc, argv, "--config"); !configArg.empty()) {
        config.configPath = trim(configArg);
    }
    if (!config.configPath.empty()) {
        std::ifstream input(config.configPath);
        if (!input) {
            throw std::runtime_error("Unable to open config file: " + config.configPath);
        }
        std::ostringstream contents;
        contents << input.rdbuf();
        config.applyJson(contents.str());
    }

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.apply("log-level", envLogLevel);
    }
    if (const char* envDuck = std::getenv("DUCKDB_PATH")) {
        auto pathValue = trim(envDuck);
        if (!pathValue.empty()) {
            config.duckdbPath = std::move(pathValue);
        }
    }
    for (const auto& key : optionKeys()) {
        if (const char* envValue = std::getenv(envName(key).c_str())) {
            config.apply(key, envValue);
        }
    }

    for (const auto& key : optionKeys()) {
        if (auto arg = valueFromArgs(argc, argv, "--" + key); !arg.empty()) {
            config.apply(key, arg);
        }
    }

    if (config.warnDrawdown >= config.haltDrawdown) {
        throw std::runtime_error("warn-drawdown must be below halt-drawdown");
    }
    if (config.backoffCapMs < config.backoffBaseMs) {
        throw std::runtime_error("backoff-cap-ms must not be below backoff-base-ms");
    }
    if (config.taskWaitMs >= config.shutdownTimeoutMs) {
        throw std::runtime_error("task-wait-ms must be below shutdown-timeout-ms");
    }

    return config;
}

}  // namespace slob::common
