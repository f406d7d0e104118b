#pragma once

#include <functional>
#include <string>
#include <vector>

#include "hq/model.hpp"
#include "hq/options.hpp"
#include "hq/repository.hpp"

namespace hq {

struct AnalysisRequest {
    double max_percentile = kDefaultMaxPercentile;
    int    plot_points = kDefaultPlotPoints;
    bool   baseplot = false;
    bool   percentiles = false;
    bool   stability = false;
    bool   raw = false;
};

struct AnalysisResult {
    std::string              metric;
    double                   x_step{};   // display units
    std::vector<PlotData>    plots;      // one per requested kind, in PlotKind order
    std::vector<std::string> warnings;
};

// Warning recorded when the metric has fewer than two slices.
extern const char* const kNoStabilityWarning;

// Called with done == false before an analysis starts and done == true after.
// A skipped stability analysis reports no progress.
using ProgressCallback = std::function<void(PlotKind /*kind*/, bool /*done*/)>;

// Aggregates the metric's series, derives the bucket width from the value at
// max_percentile (divided by plot_points, rounded to whole raw units, at least
// one) and computes every requested curve set. Lack of stability
// data is reported in `warnings`; any other failure throws, including a
// max_percentile that is not a finite value in [0, 100].
AnalysisResult run_analysis(const SliceRepository& repo,
                            const std::string& metric,
                            const AnalysisRequest& req,
                            const ProgressCallback& on_progress = {});

AnalysisRequest make_analysis_request(const Options& opt);

// Receives the sorted tags, returns the chosen one.
using MetricSelector = std::function<std::string(const std::vector<std::string>&)>;

// `requested` when non-empty, otherwise the selector's choice. The result
// must name a tag of repo, else InvalidArgumentError.
std::string resolve_metric(const SliceRepository& repo,
                           const std::string& requested,
                           const MetricSelector& select);

} // namespace hq
