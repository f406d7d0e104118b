#pragma once

#include <vector>

#include "hq/histogram.hpp"
#include "hq/model.hpp"

namespace hq {

// Probability density of h over buckets of bucket_width_display (display
// units, or raw units when `raw`). Buckets whose cumulative percentile
// exceeds max_percentile are dropped. Empty curve when h has no samples.
// Bucket k covers (k-1)*w .. k*w in raw units, w rounded to a whole unit;
// the bucket holding k*w itself reports at level k (hdr linear iteration).
// xs: bucket midpoints; ys: count / (total * width), integrating to 1.
// Throws InvalidArgumentError when the width is not positive or rounds
// below one raw unit.
Curve density(const Histogram& h, double bucket_width_display, double max_percentile, bool raw);

// Running integral of a density curve, in percent, paired with the density's
// value axis: xs = percentile reached, ys = value.
Curve percentile_curve(const Curve& density_curve, double bucket_width_display);

// One density per slice, all sharing the x axis of the longest one (first
// on ties); shorter curves are padded with trailing zeros. Assumes every
// slice grid is a prefix of the longest. Throws NoStabilityDataError for
// fewer than two slices.
std::vector<Curve> stability_curves(const MetricSeries& series, double bucket_width_display,
                                    double max_percentile, bool raw);

} // namespace hq
