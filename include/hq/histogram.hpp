#pragma once

#include <cstdint>
#include <memory>

#include <hdr/hdr_histogram.h>

namespace hq {

struct HdrHistogramCloser {
    void operator()(hdr_histogram* h) const { hdr_close(h); }
};

using HdrHistogramPtr = std::unique_ptr<hdr_histogram, HdrHistogramCloser>;

// Owning handle on an hdr_histogram. Values are recorded in raw units.
// Move-only; a moved-from Histogram must not be used.
class Histogram {
public:
    // Throws InvalidArgumentError when hdr_init rejects the range.
    Histogram(int64_t lowest, int64_t highest, int significant_figures);

    // Adopts a histogram produced by the library (decoder output).
    explicit Histogram(HdrHistogramPtr h);

    // Throws InvalidArgumentError for values outside the trackable range.
    void record(int64_t value, int64_t count = 1);

    // hdr_add: other's buckets are re-recorded at their lowest value, so the
    // layouts need not match. Throws InvalidArgumentError when some of
    // other's values were dropped.
    void add(const Histogram& other);

    // percentile must be finite and >= 0; above 100 counts as 100.
    int64_t value_at_percentile(double percentile) const;
    double  mean() const;

    int64_t total_count() const { return h_->total_count; }
    // Lowest equivalent value of the smallest sample, highest equivalent
    // value of the largest. Meaningless when total_count() == 0.
    int64_t min_value() const { return hdr_min(h_.get()); }
    int64_t max_value() const { return hdr_max(h_.get()); }

    int64_t highest_trackable_value() const { return h_->highest_trackable_value; }
    int     significant_figures() const { return h_->significant_figures; }

    const hdr_histogram* get() const { return h_.get(); }

private:
    HdrHistogramPtr h_;
};

} // namespace hq
