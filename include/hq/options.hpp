#pragma once

#include <string>

namespace hq
{
inline constexpr double kDefaultMaxPercentile = 97.5;
inline constexpr int    kDefaultPlotPoints = 500;

struct Options
{
    std::string filename;          // histogram log (positional)
    bool inspect = false;          // detailed input breakdown
    std::string metric;            // tag; chosen interactively when empty
    double max_percentile = kDefaultMaxPercentile;
    int plot_points = kDefaultPlotPoints;
    // analyses
    bool baseplot = false;
    bool percentiles = false;
    bool stability = false;
    // outputs
    std::string plot_root;         // <root>_<kind>.png
    std::string dump_root;         // <root>_<kind>.dat
    bool force = false;            // overwrite existing outputs
    bool raw = false;              // keep histogram units
    bool json = false;             // inspection report as JSON
    int concurrency = 1;           // per-tag aggregation threads
    bool help = false;             // -h/--help was given
};
} // namespace hq
