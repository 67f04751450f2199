#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

// Restores every touched variable on exit.
struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names) : names_(std::move(names)) {
        for (const auto& name : names_) {
            const char* current = std::getenv(name.c_str());
            saved_.emplace_back(current != nullptr, current != nullptr ? current : "");
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (saved_[i].first) {
                ::setenv(names_[i].c_str(), saved_[i].second.c_str(), 1);
            } else {
                ::unsetenv(names_[i].c_str());
            }
        }
    }

    void set(const std::string& name, const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }
    void clear(const std::string& name) { ::unsetenv(name.c_str()); }

    std::vector<std::string> names_;
    std::vector<std::pair<bool, std::string>> saved_;
};

::slob::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::slob::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throws(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard env({"SLOB_CONFIG", "LOG_LEVEL", "DUCKDB_PATH", "SLOB_DUCKDB", "SLOB_SYMBOLS", "SLOB_RISK_PER_TRADE",
                  "SLOB_MAX_CONTRACTS", "SLOB_STORAGE", "SLOB_HALT_DRAWDOWN", "SLOB_LOG_FILE"});

    const auto defaults = runConfig({"slob_engine"});
    if (defaults.symbols != std::vector<std::string>{"NQ"} || defaults.duckdbPath != "data/slob.duckdb" ||
        defaults.storage != "duck") {
        std::cerr << "Unexpected defaults: duckdb=" << defaults.duckdbPath << " storage=" << defaults.storage << "\n";
        return 1;
    }
    if (defaults.riskPerTrade != 0.02 || defaults.maxContracts != 5 || defaults.maxReconnectAttempts != 10) {
        std::cerr << "Unexpected risk or connection defaults\n";
        return 1;
    }

    const auto journalPath =
        std::filesystem::temp_directory_path() / ("slob-journal-" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(journalPath);
    slob::log::openJournal(journalPath.string());
    LOG_WARN("journal line " << 42);
    slob::log::closeJournal();
    {
        std::ifstream in(journalPath);
        std::string line;
        std::getline(in, line);
        if (line.find("[WARN]") == std::string::npos || line.find("journal line 42") == std::string::npos) {
            std::cerr << "Journal line not written: " << line << "\n";
            return 1;
        }
    }
    std::filesystem::remove(journalPath);

    const auto configPath =
        std::filesystem::temp_directory_path() / ("slob-config-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(configPath);
        out << R"({"symbols": ["NQ", "ES"], "risk_per_trade": 0.01, "max_contracts": 3, "storage": "memory",)"
            << R"( "liq1_on_wick": true, "heartbeat_interval_ms": 15000})";
    }

    const auto fromFile = runConfig({"slob_engine", "--config", configPath.string()});
    if (fromFile.symbols != std::vector<std::string>{"NQ", "ES"} || fromFile.riskPerTrade != 0.01 ||
        fromFile.maxContracts != 3 || fromFile.storage != "memory" || !fromFile.liq1OnWick ||
        fromFile.heartbeatIntervalMs != 15000) {
        std::cerr << "Config file values were not applied\n";
        return 1;
    }

    // Environment overrides the file, the command line overrides both.
    env.set("SLOB_CONFIG", configPath.string());
    env.set("SLOB_RISK_PER_TRADE", "0.015");
    env.set("DUCKDB_PATH", "/tmp/slob/env.duckdb");
    const auto fromEnv = runConfig({"slob_engine"});
    if (fromEnv.riskPerTrade != 0.015 || fromEnv.maxContracts != 3 || fromEnv.duckdbPath != "/tmp/slob/env.duckdb") {
        std::cerr << "Environment did not override the config file\n";
        return 1;
    }

    const auto fromCli =
        runConfig({"slob_engine", "--risk-per-trade=0.005", "--duckdb", "/tmp/slob/cli.duckdb", "--symbols", "CL",
                   "--log-file", "/tmp/slob/engine.log"});
    if (fromCli.riskPerTrade != 0.005 || fromCli.logFile != "/tmp/slob/engine.log" || fromCli.duckdbPath != "/tmp/slob/cli.duckdb" ||
        fromCli.symbols != std::vector<std::string>{"CL"} || fromCli.maxContracts != 3) {
        std::cerr << "Command line did not take precedence\n";
        return 1;
    }
    env.clear("SLOB_CONFIG");
    env.clear("SLOB_RISK_PER_TRADE");
    env.clear("DUCKDB_PATH");

    if (!throws({"slob_engine", "--halt-drawdown", "0.1"})) {
        std::cerr << "Halt below warn should be rejected\n";
        return 1;
    }
    if (!throws({"slob_engine", "--enable-short", "maybe"})) {
        std::cerr << "Invalid boolean should be rejected\n";
        return 1;
    }
    if (!throws({"slob_engine", "--task-wait-ms", "20000"})) {
        std::cerr << "Task wait beyond the shutdown timeout should be rejected\n";
        return 1;
    }
    if (!throws({"slob_engine", "--shutdown-timeout-ms", "3000", "--task-wait-ms", "3000"})) {
        std::cerr << "Task wait equal to the shutdown timeout should be rejected\n";
        return 1;
    }
    if (!throws({"slob_engine", "--storage", "postgres"})) {
        std::cerr << "Unknown storage should be rejected\n";
        return 1;
    }

    {
        std::ofstream out(configPath);
        out << R"({"no_such_option": 1})";
    }
    if (!throws({"slob_engine", "--config", configPath.string()})) {
        std::cerr << "Unknown config key should be rejected\n";
        return 1;
    }
    {
        std::ofstream out(configPath);
        out << "{ not json";
    }
    if (!throws({"slob_engine", "--config", configPath.string()})) {
        std::cerr << "Malformed config JSON should be rejected\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::remove(configPath, ec);
    return 0;
}
