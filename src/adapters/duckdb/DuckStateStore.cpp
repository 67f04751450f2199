#include "adapters/duckdb/DuckStateStore.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/SetupCodec.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

bool ensureParent(const std::string& path) {
    const fs::path dbPath{path};
    const auto parent = dbPath.parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        LOG_WARN("DuckStateStore failed to create database directory " << parent.string() << ": " << ec.message());
        return false;
    }
    return true;
}

void logRollbackFailure(const std::exception& ex) {
    LOG_WARN("DuckStateStore rollback failed: " << ex.what());
}

// Runs one upsert inside its own transaction.
bool upsert(const std::string& path, const char* what, const std::string& sql, DuckdbValueVector& parameters) {
    if (!ensureParent(path)) {
        return false;
    }
    slob::common::metrics::Registry::ScopedTimer timer("store_write");
    try {
        ::duckdb::DuckDB database(path);
        ::duckdb::Connection connection(database);
        connection.BeginTransaction();

        auto rollback = [&connection]() {
            try {
                connection.Rollback();
            } catch (const std::exception& ex) {
                logRollbackFailure(ex);
            }
        };

        auto statement = connection.Prepare(sql);
        if (!statement || statement->HasError()) {
            const std::string errorMessage =
                statement ? statement->GetError() : std::string{"failed to prepare statement"};
            LOG_WARN("DuckStateStore failed to prepare " << what << " upsert: " << errorMessage);
            rollback();
            return false;
        }
        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"failed to execute statement"};
            LOG_WARN("DuckStateStore " << what << " upsert failed: " << errorMessage);
            rollback();
            return false;
        }
        connection.Commit();
        return true;
    } catch (const std::exception& ex) {
        LOG_ERR("DuckStateStore " << what << " upsert exception path=" << path << " error=" << ex.what());
    }
    return false;
}

// Opens the database read side and hands every row to the visitor. A missing
// database file yields no rows.
template <typename Visitor>
void query(const std::string& path, const char* what, const std::string& sql, Visitor visit) {
    std::error_code ec;
    if (!fs::exists(fs::path{path}, ec)) {
        return;
    }
    try {
        ::duckdb::DuckDB database(path);
        ::duckdb::Connection connection(database);
        auto result = connection.Query(sql);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
            LOG_WARN("DuckStateStore " << what << " query failed: " << errorMessage);
            return;
        }
        while (auto chunk = result->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                visit(*chunk, row);
            }
        }
    } catch (const std::exception& ex) {
        LOG_ERR("DuckStateStore " << what << " query exception path=" << path << " error=" << ex.what());
    }
}

std::string textAt(::duckdb::DataChunk& chunk, ::duckdb::idx_t column, ::duckdb::idx_t row) {
    const auto value = chunk.GetValue(column, row);
    return value.IsNull() ? std::string{} : value.GetValue<std::string>();
}

double doubleAt(::duckdb::DataChunk& chunk, ::duckdb::idx_t column, ::duckdb::idx_t row) {
    const auto value = chunk.GetValue(column, row);
    if (value.IsNull()) {
        throw std::runtime_error("unexpected NULL in column " + std::to_string(column));
    }
    return value.GetValue<double>();
}

std::int64_t int64At(::duckdb::DataChunk& chunk, ::duckdb::idx_t column, ::duckdb::idx_t row) {
    const auto value = chunk.GetValue(column, row);
    return value.IsNull() ? 0 : value.GetValue<std::int64_t>();
}

}  // namespace

DuckStateStore::DuckStateStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    if (dbPath_.empty()) {
        throw std::invalid_argument("DuckStateStore: database path must not be empty");
    }
}

bool DuckStateStore::saveSetup(const domain::SetupCandidate& setup) {
    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.reserve(6);
    parameters.emplace_back(setup.id);
    parameters.emplace_back(setup.symbol);
    parameters.emplace_back(std::string{domain::toString(setup.state)});
    parameters.emplace_back(std::string{domain::toString(setup.direction)});
    parameters.emplace_back(::duckdb::Value::BIGINT(setup.updatedAt));
    parameters.emplace_back(domain::codec::encodeSetup(setup));
    return upsert(dbPath_, "setup",
                  "INSERT OR REPLACE INTO setups (id, symbol, state, direction, updated_ms, payload) "
                  "VALUES (?, ?, ?, ?, ?, ?)",
                  parameters);
}

std::vector<domain::SetupCandidate> DuckStateStore::loadActiveSetups() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::SetupCandidate> setups;
    query(dbPath_, "setups",
          "SELECT id, payload FROM setups WHERE state NOT IN ('SETUP_COMPLETE', 'INVALIDATED') "
          "ORDER BY updated_ms ASC, id ASC",
          [&](::duckdb::DataChunk& chunk, ::duckdb::idx_t row) {
              const auto id = textAt(chunk, 0, row);
              try {
                  auto setup = domain::codec::decodeSetup(textAt(chunk, 1, row));
                  if (setup.isTerminal()) {
                      LOG_WARN("DuckStateStore: setup " << id << " payload is terminal, skipped");
                      ++skipped_;
                      return;
                  }
                  setups.push_back(std::move(setup));
              } catch (const std::exception& ex) {
                  ++skipped_;
                  slob::common::metrics::Registry::instance().incrementCounter("store_corrupted_records_total");
                  LOG_WARN("DuckStateStore: skipping corrupted setup record " << id << ": " << ex.what());
              }
          });
    return setups;
}

bool DuckStateStore::saveTrade(const domain::Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.reserve(11);
    parameters.emplace_back(trade.setupId);
    parameters.emplace_back(trade.symbol);
    parameters.emplace_back(std::string{domain::toString(trade.direction)});
    parameters.emplace_back(::duckdb::Value::DOUBLE(trade.entryPrice));
    parameters.emplace_back(::duckdb::Value::DOUBLE(trade.exitPrice));
    parameters.emplace_back(::duckdb::Value::INTEGER(trade.size));
    parameters.emplace_back(std::string{domain::toString(trade.status)});
    parameters.emplace_back(std::string{domain::toString(trade.exitReason)});
    parameters.emplace_back(::duckdb::Value::DOUBLE(trade.pnl));
    parameters.emplace_back(::duckdb::Value::BIGINT(trade.openedAt));
    parameters.emplace_back(::duckdb::Value::BIGINT(trade.closedAt));
    return upsert(dbPath_, "trade",
                  "INSERT OR REPLACE INTO trades (setup_id, symbol, direction, entry_price, exit_price, size, "
                  "status, exit_reason, pnl, opened_ms, closed_ms) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                  parameters);
}

std::vector<domain::Trade> DuckStateStore::loadOpenTrades() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::Trade> trades;
    query(dbPath_, "trades",
          "SELECT setup_id, symbol, direction, entry_price, exit_price, size, status, exit_reason, pnl, "
          "opened_ms, closed_ms FROM trades WHERE status = 'OPEN' ORDER BY opened_ms ASC",
          [&](::duckdb::DataChunk& chunk, ::duckdb::idx_t row) {
              try {
                  domain::Trade trade;
                  trade.setupId = textAt(chunk, 0, row);
                  trade.symbol = textAt(chunk, 1, row);
                  const auto direction = domain::directionFromString(textAt(chunk, 2, row));
                  const auto exitReason = domain::exitReasonFromString(textAt(chunk, 7, row));
                  if (trade.setupId.empty() || !direction || !exitReason) {
                      throw std::runtime_error("invalid key or enum value");
                  }
                  trade.direction = *direction;
                  trade.entryPrice = doubleAt(chunk, 3, row);
                  trade.exitPrice = doubleAt(chunk, 4, row);
                  trade.size = static_cast<int>(int64At(chunk, 5, row));
                  trade.status = domain::TradeStatus::Open;
                  trade.exitReason = *exitReason;
                  trade.pnl = doubleAt(chunk, 8, row);
                  trade.openedAt = int64At(chunk, 9, row);
                  trade.closedAt = int64At(chunk, 10, row);
                  trades.push_back(std::move(trade));
              } catch (const std::exception& ex) {
                  ++skipped_;
                  slob::common::metrics::Registry::instance().incrementCounter("store_corrupted_records_total");
                  LOG_WARN("DuckStateStore: skipping corrupted trade record: " << ex.what());
              }
          });
    return trades;
}

bool DuckStateStore::saveBracket(const domain::BracketOrder& bracket) {
    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.reserve(16);
    parameters.emplace_back(bracket.setupId);
    parameters.emplace_back(bracket.symbol);
    parameters.emplace_back(std::string{domain::toString(bracket.direction)});
    parameters.emplace_back(bracket.idempotencyKey);
    parameters.emplace_back(::duckdb::Value::BIGINT(bracket.submittedAt));
    parameters.emplace_back(bracket.entryRef);
    parameters.emplace_back(bracket.stopRef);
    parameters.emplace_back(bracket.targetRef);
    parameters.emplace_back(bracket.entryOrderId);
    parameters.emplace_back(bracket.stopOrderId);
    parameters.emplace_back(bracket.targetOrderId);
    parameters.emplace_back(::duckdb::Value::INTEGER(bracket.quantity));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bracket.entryPrice));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bracket.stopPrice));
    parameters.emplace_back(::duckdb::Value::DOUBLE(bracket.targetPrice));
    parameters.emplace_back(std::string{domain::toString(bracket.status)});
    return upsert(dbPath_, "bracket",
                  "INSERT OR REPLACE INTO brackets (setup_id, symbol, direction, idempotency_key, submitted_ms, "
                  "entry_ref, stop_ref, target_ref, entry_order_id, stop_order_id, target_order_id, quantity, "
                  "entry_price, stop_price, target_price, status) "
                  "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                  parameters);
}

std::vector<domain::BracketOrder> DuckStateStore::loadBrackets() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::BracketOrder> brackets;
    query(dbPath_, "brackets",
          "SELECT setup_id, symbol, direction, idempotency_key, submitted_ms, entry_ref, stop_ref, target_ref, "
          "entry_order_id, stop_order_id, target_order_id, quantity, entry_price, stop_price, target_price, status "
          "FROM brackets WHERE status IN ('PENDING', 'SUBMITTED', 'FILLED') ORDER BY setup_id ASC",
          [&](::duckdb::DataChunk& chunk, ::duckdb::idx_t row) {
              try {
                  domain::BracketOrder bracket;
                  bracket.setupId = textAt(chunk, 0, row);
                  bracket.symbol = textAt(chunk, 1, row);
                  const auto direction = domain::directionFromString(textAt(chunk, 2, row));
                  const auto status = domain::orderStatusFromString(textAt(chunk, 15, row));
                  bracket.idempotencyKey = textAt(chunk, 3, row);
                  if (bracket.setupId.empty() || bracket.idempotencyKey.empty() || !direction || !status) {
                      throw std::runtime_error("invalid key or enum value");
                  }
                  bracket.direction = *direction;
                  bracket.status = *status;
                  bracket.submittedAt = int64At(chunk, 4, row);
                  bracket.entryRef = textAt(chunk, 5, row);
                  bracket.stopRef = textAt(chunk, 6, row);
                  bracket.targetRef = textAt(chunk, 7, row);
                  bracket.entryOrderId = textAt(chunk, 8, row);
                  bracket.stopOrderId = textAt(chunk, 9, row);
                  bracket.targetOrderId = textAt(chunk, 10, row);
                  bracket.quantity = static_cast<int>(int64At(chunk, 11, row));
                  bracket.entryPrice = doubleAt(chunk, 12, row);
                  bracket.stopPrice = doubleAt(chunk, 13, row);
                  bracket.targetPrice = doubleAt(chunk, 14, row);
                  brackets.push_back(std::move(bracket));
              } catch (const std::exception& ex) {
                  ++skipped_;
                  slob::common::metrics::Registry::instance().incrementCounter("store_corrupted_records_total");
                  LOG_WARN("DuckStateStore: skipping corrupted bracket record: " << ex.what());
              }
          });
    return brackets;
}

bool DuckStateStore::saveAccount(const domain::AccountState& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.reserve(5);
    parameters.emplace_back(::duckdb::Value::DOUBLE(account.equity));
    parameters.emplace_back(::duckdb::Value::DOUBLE(account.peakEquity));
    parameters.emplace_back(::duckdb::Value::DOUBLE(account.drawdown));
    parameters.emplace_back(::duckdb::Value::BOOLEAN(account.halted));
    parameters.emplace_back(::duckdb::Value::BIGINT(static_cast<std::int64_t>(account.trades)));
    return upsert(dbPath_, "account",
                  "INSERT OR REPLACE INTO account (id, equity, peak_equity, drawdown, halted, trades) "
                  "VALUES (1, ?, ?, ?, ?, ?)",
                  parameters);
}

std::optional<domain::AccountState> DuckStateStore::loadAccount() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<domain::AccountState> account;
    query(dbPath_, "account", "SELECT equity, peak_equity, drawdown, halted, trades FROM account WHERE id = 1",
          [&](::duckdb::DataChunk& chunk, ::duckdb::idx_t row) {
              try {
                  domain::AccountState state;
                  state.equity = doubleAt(chunk, 0, row);
                  state.peakEquity = doubleAt(chunk, 1, row);
                  state.drawdown = doubleAt(chunk, 2, row);
                  const auto halted = chunk.GetValue(3, row);
                  state.halted = !halted.IsNull() && halted.GetValue<bool>();
                  state.trades = static_cast<std::uint64_t>(int64At(chunk, 4, row));
                  account = state;
              } catch (const std::exception& ex) {
                  ++skipped_;
                  slob::common::metrics::Registry::instance().incrementCounter("store_corrupted_records_total");
                  LOG_WARN("DuckStateStore: skipping corrupted account record: " << ex.what());
              }
          });
    return account;
}

bool DuckStateStore::saveCandle(const domain::Candle& candle) {
    std::lock_guard<std::mutex> lock(mutex_);
    DuckdbValueVector parameters;
    parameters.reserve(8);
    parameters.emplace_back(candle.symbol);
    parameters.emplace_back(::duckdb::Value::BIGINT(candle.ts));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.o));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.h));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.l));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.c));
    parameters.emplace_back(::duckdb::Value::DOUBLE(candle.v));
    parameters.emplace_back(::duckdb::Value::INTEGER(static_cast<std::int32_t>(candle.tickCount)));
    return upsert(dbPath_, "candle",
                  "INSERT OR REPLACE INTO candles (symbol, ts, o, h, l, c, v, tick_count) "
                  "VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                  parameters);
}

}  // namespace adapters::duckdb
