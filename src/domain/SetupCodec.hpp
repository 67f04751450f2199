#pragma once

#include <string>
#include <string_view>

#include <boost/json/value.hpp>

#include "domain/Models.hpp"

namespace domain::codec {

boost::json::value candleToJson(const Candle& candle);
Candle candleFromJson(const boost::json::value& value);

std::string encodeSetup(const SetupCandidate& setup);

// Throws std::runtime_error (or boost::system::system_error on a parse failure)
// when the payload is malformed.
SetupCandidate decodeSetup(std::string_view payload);

}  // namespace domain::codec
