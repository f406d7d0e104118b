#include "hq/distribution.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <hdr/hdr_histogram.h>

#include "hq/errors.hpp"
#include "hq/units.hpp"

namespace hq {

Curve density(const Histogram& h, double bucket_width_display, double max_percentile, bool raw)
{
    Curve out;
    if (h.total_count() == 0) return out;
    if (!(bucket_width_display > 0.0))
    {
        throw InvalidArgumentError("bucket width must be positive, got " + std::to_string(bucket_width_display));
    }

    const UnitConverter units(raw);
    const auto width_raw = static_cast<int64_t>(std::llround(units.to_raw(bucket_width_display)));
    if (width_raw < 1)
    {
        throw InvalidArgumentError("bucket width " + std::to_string(bucket_width_display) +
                                   " is below one raw unit");
    }
    const auto total = static_cast<double>(h.total_count());
    const double norm = total * units.to_display(static_cast<double>(width_raw));

    hdr_iter iter;
    hdr_iter_linear_init(&iter, h.get(), width_raw);
    while (hdr_iter_next(&iter))
    {
        // cumulative percentile never decreases
        const double percentile = 100.0 * static_cast<double>(iter.cumulative_count) / total;
        if (percentile > max_percentile) break;
        const double mid = 0.5 * static_cast<double>(iter.value_iterated_from + iter.value_iterated_to);
        out.xs.push_back(units.to_display(mid));
        out.ys.push_back(static_cast<double>(iter.specifics.linear.count_added_in_this_iteration_step) / norm);
    }
    return out;
}

Curve percentile_curve(const Curve& density_curve, double bucket_width_display)
{
    Curve out;
    out.xs.reserve(density_curve.ys.size());
    double running = 0.0;
    for (double y : density_curve.ys)
    {
        running += y;
        out.xs.push_back(running * bucket_width_display * 100.0);
    }
    out.ys = density_curve.xs;
    return out;
}

std::vector<Curve> stability_curves(const MetricSeries& series, double bucket_width_display,
                                    double max_percentile, bool raw)
{
    if (series.size() < 2)
    {
        const std::string tag = series.empty() ? std::string() : series.front().tag;
        throw NoStabilityDataError("metric \"" + tag + "\" has " + std::to_string(series.size()) +
                                   " slice(s); stability analysis needs at least 2");
    }

    std::vector<Curve> curves;
    curves.reserve(series.size());
    for (const auto& sl : series)
    {
        curves.push_back(density(sl.histogram, bucket_width_display, max_percentile, raw));
    }

    const auto longest = std::ranges::max_element(
        curves, {}, [](const Curve& c) { return c.xs.size(); });
    const std::vector<double> full_xs = longest->xs;

    for (auto& c : curves)
    {
        c.ys.resize(full_xs.size(), 0.0);
        c.xs = full_xs;
    }
    return curves;
}

} // namespace hq
