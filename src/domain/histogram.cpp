#include "hq/histogram.hpp"

#include <cerrno>
#include <cmath>
#include <string>
#include <utility>

#include "hq/errors.hpp"

namespace hq {

Histogram::Histogram(int64_t lowest, int64_t highest, int significant_figures)
{
    hdr_histogram* raw = nullptr;
    const int rc = hdr_init(lowest, highest, significant_figures, &raw);
    if (rc == ENOMEM)
    {
        throw InvalidArgumentError("out of memory allocating a histogram up to " + std::to_string(highest));
    }
    if (rc != 0 || raw == nullptr)
    {
        throw InvalidArgumentError(
            "invalid histogram range [" + std::to_string(lowest) + ", " +
            std::to_string(highest) + "] at " +
            std::to_string(significant_figures) + " significant figures");
    }
    h_.reset(raw);
}

Histogram::Histogram(HdrHistogramPtr h)
    : h_(std::move(h))
{
    if (!h_) throw InvalidArgumentError("null histogram handle");
}

void Histogram::record(int64_t value, int64_t count)
{
    if (!hdr_record_values(h_.get(), value, count))
    {
        throw InvalidArgumentError(
            "value " + std::to_string(value) + " outside the trackable range [0, " +
            std::to_string(h_->highest_trackable_value) + "]");
    }
}

void Histogram::add(const Histogram& other)
{
    const int64_t dropped = hdr_add(h_.get(), other.h_.get());
    if (dropped > 0)
    {
        throw InvalidArgumentError(
            std::to_string(dropped) + " merged value(s) do not fit below " +
            std::to_string(h_->highest_trackable_value));
    }
}

int64_t Histogram::value_at_percentile(double percentile) const
{
    if (!std::isfinite(percentile) || percentile < 0.0)
    {
        throw InvalidArgumentError("percentile must be a finite value >= 0, got " + std::to_string(percentile));
    }
    return hdr_value_at_percentile(h_.get(), percentile);
}

double Histogram::mean() const
{
    if (h_->total_count == 0) return 0.0;
    return hdr_mean(h_.get());
}

} // namespace hq
