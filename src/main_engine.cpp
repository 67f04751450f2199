#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "adapters/duckdb/DuckStateStore.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/memory/MemoryStateStore.hpp"
#include "adapters/paper/PaperVenue.hpp"
#include "adapters/paper/TickReplay.hpp"
#include "app/Engine.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

app::Engine::Config engineConfig(const slob::common::Config& config) {
    app::Engine::Config engine;
    engine.symbols = config.symbols;

    engine.aggregator.bucketMs = config.bucketMs;
    engine.aggregator.maxFillSpanBuckets = config.maxFillSpanBuckets;

    engine.tracker.enableShort = config.enableShort;
    engine.tracker.enableLong = config.enableLong;
    engine.tracker.liq1OnWick = config.liq1OnWick;
    engine.tracker.stopBuffer = config.stopBuffer;
    engine.tracker.targetBuffer = config.targetBuffer;

    engine.risk.initialEquity = config.initialEquity;
    engine.risk.riskPerTrade = config.riskPerTrade;
    engine.risk.pointValue = config.pointValue;
    engine.risk.maxContracts = config.maxContracts;
    engine.risk.warnDrawdown = config.warnDrawdown;
    engine.risk.haltDrawdown = config.haltDrawdown;

    engine.executor.maxSubmitAttempts = config.maxSubmitAttempts;
    engine.executor.pointValue = config.pointValue;

    engine.supervisor.backoffBase = std::chrono::milliseconds(config.backoffBaseMs);
    engine.supervisor.backoffCap = std::chrono::milliseconds(config.backoffCapMs);
    engine.supervisor.maxAttempts = config.maxReconnectAttempts;
    engine.supervisor.heartbeatAttempts = config.heartbeatAttempts;
    engine.supervisor.heartbeatInterval = std::chrono::milliseconds(config.heartbeatIntervalMs);

    engine.shutdownTimeout = std::chrono::milliseconds(config.shutdownTimeoutMs);
    engine.taskWait = std::chrono::milliseconds(config.taskWaitMs);
    return engine;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "slob_engine terminated: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "slob_engine terminated by a non-standard exception\n");
            }
        } else {
            std::fprintf(stderr, "slob_engine terminated without an active exception\n");
        }
        std::_Exit(1);
    });

    try {
        auto config = slob::common::Config::fromArgs(argc, argv);
        slob::log::setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            slob::log::openJournal(config.logFile);
        }

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << slob::log::levelToString(config.logLevel));
        LOG_INFO("  Symbols: " << joinList(config.symbols));
        LOG_INFO("  Storage: " << config.storage);
        LOG_INFO("  Risk: " << config.riskPerTrade * 100.0 << "% per trade, cap " << config.maxContracts
                            << " contract(s), drawdown warn/halt " << config.warnDrawdown << "/"
                            << config.haltDrawdown);
        LOG_INFO("  Reconnect: base " << config.backoffBaseMs << " ms, cap " << config.backoffCapMs << " ms, "
                                      << config.maxReconnectAttempts << " attempt(s)");

        std::unique_ptr<domain::IStateStore> store;
        if (config.storage == "duck") {
            adapters::duckdb::DuckStore schema(config.duckdbPath);
            schema.migrate();
            store = std::make_unique<adapters::duckdb::DuckStateStore>(config.duckdbPath);
            LOG_INFO("State store: DuckDB -> " << config.duckdbPath);
        } else {
            store = std::make_unique<adapters::memory::MemoryStateStore>();
            LOG_WARN("State store: memory, state is lost on exit");
        }

        boost::asio::io_context ioc;
        adapters::paper::PaperVenue venue;
        app::Engine engine(ioc, venue, *store, engineConfig(config));

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_INFO("Signal " << signal << " received, stopping engine...");
            ioc.stop();
        });

        engine.start();

        if (!config.tickFile.empty()) {
            auto replay = std::make_shared<adapters::paper::TickReplay>(
                ioc, venue, adapters::paper::loadTicksCsv(config.tickFile),
                std::chrono::milliseconds(config.replayPaceMs));
            engine.addBackgroundTask(replay);
            replay->start([&ioc]() {
                LOG_INFO("Tick replay complete, stopping engine...");
                ioc.stop();
            });
        }

        LOG_INFO("Engine running. Waiting for market data...");
        ioc.run();

        signals.cancel();
        const auto report = engine.shutdown();
        if (report.timedOut) {
            LOG_WARN("Shutdown incomplete after " << report.elapsed.count() << " ms");
        }
        if (const auto alerts = slob::log::criticalCount(); alerts > 0) {
            LOG_WARN("Session raised " << alerts << " critical alert(s)");
        }
        LOG_INFO("Shutdown complete");
        slob::log::closeJournal();
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal engine error: " << ex.what());
        slob::log::closeJournal();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
