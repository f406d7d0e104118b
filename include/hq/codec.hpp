#pragma once

#include <string>
#include <string_view>

#include "hq/histogram.hpp"

namespace hq {

// Base64 text of the compressed V2 encoding, as found in log records.
// Throws InvalidArgumentError when the library cannot encode.
std::string encode_compressed_histogram(const Histogram& h);

// Throws LogFormatError for bad base64, unknown cookies or corrupt data.
Histogram decode_compressed_histogram(std::string_view base64_payload);

} // namespace hq
