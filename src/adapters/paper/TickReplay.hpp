#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "adapters/paper/PaperVenue.hpp"
#include "core/BackgroundTask.hpp"
#include "domain/Models.hpp"

namespace adapters::paper {

// Reads ticks from CSV lines `ts_ms,symbol,price,size`. A header line and blank
// lines are allowed; malformed lines are logged and skipped.
std::vector<domain::Tick> loadTicksCsv(const std::string& path);
std::vector<domain::Tick> parseTicksCsv(std::istream& input, std::size_t* skipped = nullptr);

// Feeds recorded ticks into a PaperVenue, one handler per tick on the io_context.
class TickReplay : public core::BackgroundTask, public std::enable_shared_from_this<TickReplay> {
public:
    TickReplay(boost::asio::io_context& ioc,
               PaperVenue& venue,
               std::vector<domain::Tick> ticks,
               std::chrono::milliseconds pace = std::chrono::milliseconds{0});

    void start(std::function<void()> onFinished = {});

    std::string name() const override { return "tick-replay"; }
    void cancel() override;
    bool finished() const override { return finished_; }

    std::size_t delivered() const { return next_; }

private:
    void step_();
    void finish_();

    boost::asio::io_context& ioc_;
    boost::asio::steady_timer timer_;
    PaperVenue& venue_;
    std::vector<domain::Tick> ticks_;
    std::chrono::milliseconds pace_;
    std::size_t next_{0};
    bool cancelled_{false};
    bool finished_{false};
    std::function<void()> onFinished_;
};

}  // namespace adapters::paper
