#include "adapters/memory/MemoryStateStore.hpp"

#include <exception>

#include "common/Log.hpp"
#include "domain/SetupCodec.hpp"

namespace adapters::memory {

bool MemoryStateStore::saveSetup(const domain::SetupCandidate& setup) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return false;
    }
    setups_[setup.id] = domain::codec::encodeSetup(setup);
    ++writes_;
    return true;
}

std::vector<domain::SetupCandidate> MemoryStateStore::loadActiveSetups() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::SetupCandidate> out;
    for (const auto& [id, payload] : setups_) {
        try {
            auto setup = domain::codec::decodeSetup(payload);
            if (!setup.isTerminal()) {
                out.push_back(std::move(setup));
            }
        } catch (const std::exception& ex) {
            LOG_WARN("MemoryStateStore: skipping corrupted setup record " << id << ": " << ex.what());
        }
    }
    return out;
}

bool MemoryStateStore::saveTrade(const domain::Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return false;
    }
    trades_[trade.setupId] = trade;
    ++writes_;
    return true;
}

std::vector<domain::Trade> MemoryStateStore::loadOpenTrades() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::Trade> out;
    for (const auto& [id, trade] : trades_) {
        if (trade.status == domain::TradeStatus::Open) {
            out.push_back(trade);
        }
    }
    return out;
}

bool MemoryStateStore::saveBracket(const domain::BracketOrder& bracket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return false;
    }
    brackets_[bracket.setupId] = bracket;
    ++writes_;
    return true;
}

std::vector<domain::BracketOrder> MemoryStateStore::loadBrackets() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::BracketOrder> out;
    for (const auto& [id, bracket] : brackets_) {
        if (bracket.status == domain::OrderStatus::Pending || bracket.status == domain::OrderStatus::Submitted ||
            bracket.status == domain::OrderStatus::Filled) {
            out.push_back(bracket);
        }
    }
    return out;
}

bool MemoryStateStore::saveAccount(const domain::AccountState& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return false;
    }
    account_ = account;
    ++writes_;
    return true;
}

std::optional<domain::AccountState> MemoryStateStore::loadAccount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return account_;
}

bool MemoryStateStore::saveCandle(const domain::Candle& candle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        return false;
    }
    candles_[{candle.symbol, candle.ts}] = candle;
    ++writes_;
    return true;
}

void MemoryStateStore::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++flushes_;
}

void MemoryStateStore::putRawSetup(const std::string& id, std::string payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    setups_[id] = std::move(payload);
}

void MemoryStateStore::setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = fail;
}

std::size_t MemoryStateStore::candleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return candles_.size();
}

std::size_t MemoryStateStore::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

std::size_t MemoryStateStore::flushCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flushes_;
}

}  // namespace adapters::memory
