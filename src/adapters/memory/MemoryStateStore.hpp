#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::memory {

// Volatile IStateStore for dry runs and tests. Setups are kept in their encoded
// form so a restore goes through the same decoding as the durable store.
class MemoryStateStore : public domain::IStateStore {
public:
    bool saveSetup(const domain::SetupCandidate& setup) override;
    std::vector<domain::SetupCandidate> loadActiveSetups() override;

    bool saveTrade(const domain::Trade& trade) override;
    std::vector<domain::Trade> loadOpenTrades() override;

    bool saveBracket(const domain::BracketOrder& bracket) override;
    std::vector<domain::BracketOrder> loadBrackets() override;

    bool saveAccount(const domain::AccountState& account) override;
    std::optional<domain::AccountState> loadAccount() override;

    bool saveCandle(const domain::Candle& candle) override;
    void flush() override;

    // Stores a raw setup payload under an id, bypassing encoding.
    void putRawSetup(const std::string& id, std::string payload);
    // Makes every later save fail.
    void setFailWrites(bool fail);

    std::size_t candleCount() const;
    std::size_t writeCount() const;
    std::size_t flushCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> setups_;
    std::map<std::string, domain::Trade> trades_;
    std::map<std::string, domain::BracketOrder> brackets_;
    std::map<std::pair<std::string, domain::TimestampMs>, domain::Candle> candles_;
    std::optional<domain::AccountState> account_;
    bool failWrites_{false};
    std::size_t writes_{0};
    std::size_t flushes_{0};
};

}  // namespace adapters::memory
