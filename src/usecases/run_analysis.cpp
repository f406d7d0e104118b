#include "hq/usecases.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "hq/aggregate.hpp"
#include "hq/distribution.hpp"
#include "hq/errors.hpp"
#include "hq/units.hpp"

namespace hq {

const char* const kNoStabilityWarning = "Nothing to plot for stability analysis.";

AnalysisRequest make_analysis_request(const Options& opt)
{
    AnalysisRequest req;
    req.max_percentile = opt.max_percentile;
    req.plot_points = opt.plot_points;
    req.baseplot = opt.baseplot;
    req.percentiles = opt.percentiles;
    req.stability = opt.stability;
    req.raw = opt.raw;
    return req;
}

AnalysisResult run_analysis(const SliceRepository& repo,
                            const std::string& metric,
                            const AnalysisRequest& req,
                            const ProgressCallback& on_progress)
{
    if (req.plot_points <= 0)
    {
        throw InvalidArgumentError("plot size must be positive, got " + std::to_string(req.plot_points));
    }
    if (!std::isfinite(req.max_percentile) || req.max_percentile < 0.0 || req.max_percentile > 100.0)
    {
        throw InvalidArgumentError("max percentile must lie in [0, 100], got " +
                                   std::to_string(req.max_percentile));
    }

    const MetricSeries& series = repo.series(metric);
    const UnitConverter units(req.raw);
    const Histogram full = aggregate_series(series);

    AnalysisResult res;
    res.metric = metric;
    const int64_t max_raw = full.value_at_percentile(req.max_percentile);
    if (max_raw <= 0)
    {
        throw InvalidArgumentError("metric \"" + metric + "\": value at " + std::to_string(req.max_percentile) +
                                   "th percentile is 0, cannot derive a bucket width");
    }
    // buckets are whole raw units
    const int64_t width_raw = std::max<int64_t>(
        1, std::llround(static_cast<double>(max_raw) / req.plot_points));
    res.x_step = units.to_display(static_cast<double>(width_raw));

    auto progress = [&](PlotKind k, bool done)
    {
        if (on_progress) on_progress(k, done);
    };

    Curve base;
    bool have_base = false;
    if (req.baseplot)
    {
        progress(PlotKind::Baseplot, false);
        base = density(full, res.x_step, req.max_percentile, req.raw);
        have_base = true;
        res.plots.push_back(PlotData{PlotKind::Baseplot, {base}, res.x_step});
        progress(PlotKind::Baseplot, true);
    }

    if (req.stability)
    {
        try
        {
            PlotData stab{PlotKind::Stability,
                          stability_curves(series, res.x_step, req.max_percentile, req.raw),
                          res.x_step};
            progress(PlotKind::Stability, false);
            res.plots.push_back(std::move(stab));
            progress(PlotKind::Stability, true);
        }
        catch (const NoStabilityDataError&)
        {
            res.warnings.emplace_back(kNoStabilityWarning);
        }
    }

    if (req.percentiles)
    {
        progress(PlotKind::Percentiles, false);
        if (!have_base) base = density(full, res.x_step, req.max_percentile, req.raw);
        res.plots.push_back(PlotData{PlotKind::Percentiles, {percentile_curve(base, res.x_step)}, res.x_step});
        progress(PlotKind::Percentiles, true);
    }

    std::ranges::sort(res.plots, {}, [](const PlotData& p) { return static_cast<int>(p.kind); });
    return res;
}

std::string resolve_metric(const SliceRepository& repo,
                           const std::string& requested,
                           const MetricSelector& select)
{
    std::string metric = requested;
    if (metric.empty())
    {
        if (repo.empty()) throw InvalidArgumentError("no metrics available in the log");
        if (!select) throw InvalidArgumentError("no metric given and no way to choose one");
        metric = select(repo.tags());
    }
    if (!repo.contains(metric))
    {
        throw InvalidArgumentError("unknown metric \"" + metric + "\"");
    }
    return metric;
}

} // namespace hq
