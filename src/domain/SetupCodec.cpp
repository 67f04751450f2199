#include "domain/SetupCodec.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

namespace domain::codec {
namespace {

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    throw std::runtime_error("SetupCodec: unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    throw std::runtime_error("SetupCodec: unsupported JSON type for floating conversion");
}

std::string json_to_string(const boost::json::value& value) {
    if (!value.is_string()) {
        throw std::runtime_error("SetupCodec: expected string value");
    }
    const auto& str = value.as_string();
    return std::string(str.data(), str.size());
}

const boost::json::value& field(const boost::json::object& object, const char* key) {
    const auto* found = object.if_contains(key);
    if (found == nullptr) {
        throw std::runtime_error(std::string{"SetupCodec: missing field '"} + key + "'");
    }
    return *found;
}

}  // namespace

boost::json::value candleToJson(const Candle& candle) {
    boost::json::object row;
    row["symbol"] = candle.symbol;
    row["ts"] = candle.ts;
    row["o"] = candle.o;
    row["h"] = candle.h;
    row["l"] = candle.l;
    row["c"] = candle.c;
    row["v"] = candle.v;
    row["ticks"] = static_cast<std::int64_t>(candle.tickCount);
    return row;
}

Candle candleFromJson(const boost::json::value& value) {
    if (!value.is_object()) {
        throw std::runtime_error("SetupCodec: candle must be an object");
    }
    const auto& row = value.as_object();
    Candle candle;
    candle.symbol = json_to_string(field(row, "symbol"));
    candle.ts = json_to_int64(field(row, "ts"));
    candle.o = json_to_double(field(row, "o"));
    candle.h = json_to_double(field(row, "h"));
    candle.l = json_to_double(field(row, "l"));
    candle.c = json_to_double(field(row, "c"));
    candle.v = json_to_double(field(row, "v"));
    candle.tickCount = static_cast<std::uint32_t>(json_to_int64(field(row, "ticks")));
    return candle;
}

std::string encodeSetup(const SetupCandidate& setup) {
    boost::json::object payload;
    payload["id"] = setup.id;
    payload["symbol"] = setup.symbol;
    payload["direction"] = toString(setup.direction);
    payload["state"] = toString(setup.state);
    payload["session_high"] = setup.sessionHigh;
    payload["session_low"] = setup.sessionLow;
    payload["liq1_time"] = setup.liq1Time;
    payload["liq1_price"] = setup.liq1Price;

    boost::json::array consol;
    for (const auto& candle : setup.consolCandles) {
        consol.push_back(candleToJson(candle));
    }
    payload["consol_candles"] = std::move(consol);
    payload["consol_high"] = setup.consolHigh;
    payload["consol_low"] = setup.consolLow;
    payload["consol_frozen"] = setup.consolFrozen;
    payload["consol_confirmed_time"] = setup.consolConfirmedTime;
    payload["candles_since_consol"] = static_cast<std::int64_t>(setup.candlesSinceConsol);

    payload["nowick_candle"] = setup.noWickCandle ? candleToJson(*setup.noWickCandle) : boost::json::value{};
    payload["liq2_candle"] = setup.liq2Candle ? candleToJson(*setup.liq2Candle) : boost::json::value{};
    payload["liq2_time"] = setup.liq2Time;
    payload["candles_since_liq2"] = static_cast<std::int64_t>(setup.candlesSinceLiq2);

    payload["entry_price"] = setup.entryPrice;
    payload["stop_price"] = setup.stopPrice;
    payload["target_price"] = setup.targetPrice;
    payload["risk_reward"] = setup.riskReward;
    payload["atr_at_entry"] = setup.atrAtEntry;
    payload["entry_trigger_time"] = setup.entryTriggerTime;

    payload["created_at"] = setup.createdAt;
    payload["updated_at"] = setup.updatedAt;
    payload["invalidated_at"] = setup.invalidatedAt;
    payload["invalidation_reason"] = toString(setup.invalidationReason);

    return boost::json::serialize(payload);
}

SetupCandidate decodeSetup(std::string_view payload) {
    const auto parsed = boost::json::parse(boost::json::string_view{payload.data(), payload.size()});
    if (!parsed.is_object()) {
        throw std::runtime_error("SetupCodec: setup payload must be an object");
    }
    const auto& object = parsed.as_object();

    SetupCandidate setup;
    setup.id = json_to_string(field(object, "id"));
    setup.symbol = json_to_string(field(object, "symbol"));
    if (setup.id.empty()) {
        throw std::runtime_error("SetupCodec: empty setup id");
    }

    const auto direction = directionFromString(json_to_string(field(object, "direction")));
    const auto state = setupStateFromString(json_to_string(field(object, "state")));
    const auto reason = invalidationReasonFromString(json_to_string(field(object, "invalidation_reason")));
    if (!direction || !state || !reason) {
        throw std::runtime_error("SetupCodec: unknown enum value in setup " + setup.id);
    }
    setup.direction = *direction;
    setup.state = *state;
    setup.invalidationReason = *reason;

    setup.sessionHigh = json_to_double(field(object, "session_high"));
    setup.sessionLow = json_to_double(field(object, "session_low"));
    setup.liq1Time = json_to_int64(field(object, "liq1_time"));
    setup.liq1Price = json_to_double(field(object, "liq1_price"));

    const auto& consol = field(object, "consol_candles");
    if (!consol.is_array()) {
        throw std::runtime_error("SetupCodec: consol_candles must be an array");
    }
    for (const auto& row : consol.as_array()) {
        setup.consolCandles.push_back(candleFromJson(row));
    }
    setup.consolHigh = json_to_double(field(object, "consol_high"));
    setup.consolLow = json_to_double(field(object, "consol_low"));
    setup.consolFrozen = field(object, "consol_frozen").as_bool();
    setup.consolConfirmedTime = json_to_int64(field(object, "consol_confirmed_time"));
    setup.candlesSinceConsol = static_cast<std::uint32_t>(json_to_int64(field(object, "candles_since_consol")));

    if (const auto& noWick = field(object, "nowick_candle"); !noWick.is_null()) {
        setup.noWickCandle = candleFromJson(noWick);
    }
    if (const auto& liq2 = field(object, "liq2_candle"); !liq2.is_null()) {
        setup.liq2Candle = candleFromJson(liq2);
    }
    setup.liq2Time = json_to_int64(field(object, "liq2_time"));
    setup.candlesSinceLiq2 = static_cast<std::uint32_t>(json_to_int64(field(object, "candles_since_liq2")));

    setup.entryPrice = json_to_double(field(object, "entry_price"));
    setup.stopPrice = json_to_double(field(object, "stop_price"));
    setup.targetPrice = json_to_double(field(object, "target_price"));
    setup.riskReward = json_to_double(field(object, "risk_reward"));
    setup.atrAtEntry = json_to_double(field(object, "atr_at_entry"));
    setup.entryTriggerTime = json_to_int64(field(object, "entry_trigger_time"));

    setup.createdAt = json_to_int64(field(object, "created_at"));
    setup.updatedAt = json_to_int64(field(object, "updated_at"));
    setup.invalidatedAt = json_to_int64(field(object, "invalidated_at"));

    return setup;
}

}  // namespace domain::codec
