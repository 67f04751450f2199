#include "adapters/paper/TickReplay.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"

namespace adapters::paper {
namespace {

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, ',')) {
        const auto begin = field.find_first_not_of(" \t\r");
        const auto end = field.find_last_not_of(" \t\r");
        fields.push_back(begin == std::string::npos ? std::string{} : field.substr(begin, end - begin + 1));
    }
    return fields;
}

}  // namespace

std::vector<domain::Tick> parseTicksCsv(std::istream& input, std::size_t* skipped) {
    std::vector<domain::Tick> ticks;
    std::size_t bad = 0;
    std::size_t lineNo = 0;
    std::string line;
    while (std::getline(input, line)) {
        ++lineNo;
        const auto fields = splitFields(line);
        if (fields.empty() || (fields.size() == 1 && fields[0].empty())) {
            continue;
        }
        if (lineNo == 1 && fields[0] == "ts") {
            continue;
        }
        try {
            if (fields.size() < 3) {
                throw std::invalid_argument("expected ts,symbol,price[,size]");
            }
            domain::Tick tick;
            tick.ts = std::stoll(fields[0]);
            tick.symbol = fields[1];
            tick.price = std::stod(fields[2]);
            tick.size = fields.size() > 3 && !fields[3].empty() ? std::stod(fields[3]) : 0.0;
            if (tick.symbol.empty() || !std::isfinite(tick.price)) {
                throw std::invalid_argument("empty symbol or non-finite price");
            }
            ticks.push_back(std::move(tick));
        } catch (const std::exception& ex) {
            ++bad;
            LOG_WARN("TickReplay: skipping line " << lineNo << ": " << ex.what());
        }
    }
    if (skipped != nullptr) {
        *skipped = bad;
    }
    return ticks;
}

std::vector<domain::Tick> loadTicksCsv(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("TickReplay: unable to open '" + path + "'");
    }
    std::size_t skipped = 0;
    auto ticks = parseTicksCsv(input, &skipped);
    LOG_INFO("TickReplay: loaded " << ticks.size() << " tick(s) from " << path << " (" << skipped << " skipped)");
    return ticks;
}

TickReplay::TickReplay(boost::asio::io_context& ioc,
                       PaperVenue& venue,
                       std::vector<domain::Tick> ticks,
                       std::chrono::milliseconds pace)
    : ioc_(ioc), timer_(ioc), venue_(venue), ticks_(std::move(ticks)), pace_(pace) {}

void TickReplay::start(std::function<void()> onFinished) {
    onFinished_ = std::move(onFinished);
    auto self = shared_from_this();
    boost::asio::post(ioc_, [self]() { self->step_(); });
}

void TickReplay::cancel() {
    if (finished_) {
        return;
    }
    cancelled_ = true;
    timer_.cancel();
    finished_ = true;
    onFinished_ = nullptr;
    LOG_INFO("TickReplay: cancelled after " << next_ << "/" << ticks_.size() << " tick(s)");
}

void TickReplay::step_() {
    if (cancelled_ || finished_) {
        return;
    }
    if (next_ >= ticks_.size()) {
        finish_();
        return;
    }
    venue_.feedTick(ticks_[next_++]);

    auto self = shared_from_this();
    if (pace_.count() == 0) {
        boost::asio::post(ioc_, [self]() { self->step_(); });
        return;
    }
    timer_.expires_after(pace_);
    timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        self->step_();
    });
}

void TickReplay::finish_() {
    if (finished_) {
        return;
    }
    finished_ = true;
    LOG_INFO("TickReplay: finished, " << next_ << " tick(s) delivered");
    if (onFinished_) {
        auto callback = std::move(onFinished_);
        onFinished_ = nullptr;
        callback();
    }
}

}  // namespace adapters::paper
