#pragma once

#include <string>

namespace adapters::duckdb {

// Creates the engine schema: setups, trades, brackets and candles.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/slob.duckdb");

    void migrate();

    const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
};

}  // namespace adapters::duckdb
