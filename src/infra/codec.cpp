#include "hq/codec.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#include <hdr/hdr_histogram_log.h>

#include "hq/errors.hpp"

namespace hq {

namespace {

struct MallocFree {
    void operator()(char* p) const { std::free(p); }
};

std::string describe(int rc)
{
    const char* msg = hdr_strerror(rc);
    return msg ? msg : "error " + std::to_string(rc);
}

} // namespace

std::string encode_compressed_histogram(const Histogram& h)
{
    char* encoded = nullptr;
    // the encoder only reads the histogram
    const int rc = hdr_log_encode(const_cast<hdr_histogram*>(h.get()), &encoded);
    std::unique_ptr<char, MallocFree> owned(encoded);
    if (rc != 0 || !owned)
    {
        throw InvalidArgumentError("cannot encode histogram: " + describe(rc));
    }
    return std::string(owned.get());
}

Histogram decode_compressed_histogram(std::string_view base64_payload)
{
    // hdr_log_decode wants a mutable buffer
    std::string text(base64_payload);
    hdr_histogram* raw = nullptr;
    const int rc = hdr_log_decode(&raw, text.data(), text.size());
    HdrHistogramPtr decoded(raw);
    if (rc != 0 || !decoded)
    {
        throw LogFormatError("cannot decode histogram payload: " + describe(rc));
    }
    return Histogram(std::move(decoded));
}

} // namespace hq
