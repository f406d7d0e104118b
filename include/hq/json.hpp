#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace hq {

// s as a JSON string literal, quotes included. Control characters without a
// short escape are written as \u00XX.
std::string json_quote(std::string_view s);

// Writes v with the stream's current format, or null when v is NaN or
// infinite.
void write_json_number(std::ostream& os, double v);

} // namespace hq
