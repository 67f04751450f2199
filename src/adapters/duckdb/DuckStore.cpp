#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr const char* kSchema[] = {
    R"SQL(
        CREATE TABLE IF NOT EXISTS setups (
            id TEXT PRIMARY KEY,
            symbol TEXT,
            state TEXT,
            direction TEXT,
            updated_ms BIGINT,
            payload TEXT
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS trades (
            setup_id TEXT PRIMARY KEY,
            symbol TEXT,
            direction TEXT,
            entry_price DOUBLE,
            exit_price DOUBLE,
            size INTEGER,
            status TEXT,
            exit_reason TEXT,
            pnl DOUBLE,
            opened_ms BIGINT,
            closed_ms BIGINT
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS brackets (
            setup_id TEXT PRIMARY KEY,
            symbol TEXT,
            direction TEXT,
            idempotency_key TEXT,
            submitted_ms BIGINT,
            entry_ref TEXT,
            stop_ref TEXT,
            target_ref TEXT,
            entry_order_id TEXT,
            stop_order_id TEXT,
            target_order_id TEXT,
            quantity INTEGER,
            entry_price DOUBLE,
            stop_price DOUBLE,
            target_price DOUBLE,
            status TEXT
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS candles (
            symbol TEXT,
            ts BIGINT,
            o DOUBLE,
            h DOUBLE,
            l DOUBLE,
            c DOUBLE,
            v DOUBLE,
            tick_count INTEGER,
            PRIMARY KEY(symbol, ts)
        )
    )SQL",
    R"SQL(
        CREATE TABLE IF NOT EXISTS account (
            id INTEGER PRIMARY KEY,
            equity DOUBLE,
            peak_equity DOUBLE,
            drawdown DOUBLE,
            halted BOOLEAN,
            trades BIGINT
        )
    )SQL",
};

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {}

void DuckStore::migrate() {
    const fs::path dbPath{dbPath_};

    if (dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStore: unable to create directory '" +
                                     dbPath.parent_path().string() + "': " + ec.message());
        }
    }

    ::duckdb::DuckDB db(dbPath.string());
    ::duckdb::Connection connection(db);

    for (const char* statement : kSchema) {
        auto result = connection.Query(statement);
        if (!result || result->HasError()) {
            const std::string errorMessage =
                result ? result->GetError() : std::string("unknown error creating schema");
            throw std::runtime_error("DuckStore: migration failed: " + errorMessage);
        }
    }

    LOG_INFO("DuckStore migration finished for " << dbPath.string());
}

}  // namespace adapters::duckdb
