#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hq/histogram.hpp"

namespace hq {

// One time-windowed histogram for one metric tag. Immutable once decoded.
struct IntervalHistogram {
    std::string tag;
    int64_t     start_time_ms{};
    int64_t     end_time_ms{};
    Histogram   histogram;

    int64_t total_count() const { return histogram.total_count(); }
    int64_t min_value_raw() const { return histogram.min_value(); }
    int64_t max_value_raw() const { return histogram.max_value(); }
};

// Slices sharing one tag, ascending by start_time_ms.
using MetricSeries = std::vector<IntervalHistogram>;

struct Curve {
    std::vector<double> xs;
    std::vector<double> ys;
};

// Declaration order is the output order.
enum class PlotKind { Baseplot, Percentiles, Stability };

const char* plot_kind_str(PlotKind k);

// Throws UnknownPlotKindError.
PlotKind plot_kind_from_string(const std::string& name);

struct PlotData {
    PlotKind           kind{};
    std::vector<Curve> curves;
    double             x_step{}; // bucket width, display units
};

} // namespace hq
