#pragma once

#include <string>
#include "common/types.hpp"

namespace pmkt {

// Decimal rendering of 128-bit integers (neither iostreams nor
// std::to_string handle __int128)
std::string amount_to_string(Amount value);
std::string price_to_string(Price value);

// Strict decimal parsing. Throws std::invalid_argument on malformed input
// and std::out_of_range if the value does not fit.
Amount parse_amount(const std::string& text);
Price parse_price(const std::string& text);

// Render a x10000-scaled precision price as "12.3456"
std::string format_scaled_price(Price scaled);

} // namespace pmkt
