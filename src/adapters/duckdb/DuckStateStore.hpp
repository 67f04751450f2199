#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::duckdb {

// Durable IStateStore. Each call opens the database, runs inside a transaction
// where it writes, and closes again; calls are serialized by one mutex.
class DuckStateStore : public domain::IStateStore {
public:
    explicit DuckStateStore(std::string dbPath = "data/slob.duckdb");

    bool saveSetup(const domain::SetupCandidate& setup) override;
    std::vector<domain::SetupCandidate> loadActiveSetups() override;

    bool saveTrade(const domain::Trade& trade) override;
    std::vector<domain::Trade> loadOpenTrades() override;

    bool saveBracket(const domain::BracketOrder& bracket) override;
    std::vector<domain::BracketOrder> loadBrackets() override;

    bool saveAccount(const domain::AccountState& account) override;
    std::optional<domain::AccountState> loadAccount() override;

    bool saveCandle(const domain::Candle& candle) override;

    // Records skipped on load because they could not be decoded.
    std::size_t skippedRecords() const { return skipped_; }

private:
    std::string dbPath_;
    std::mutex mutex_;
    std::size_t skipped_{0};
};

}  // namespace adapters::duckdb
