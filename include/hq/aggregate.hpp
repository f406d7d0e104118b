#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "hq/histogram.hpp"
#include "hq/model.hpp"
#include "hq/repository.hpp"
#include "hq/units.hpp"

namespace hq {

// Precision of the histograms written by the load generator.
inline constexpr int kSignificantFigures = 3;

// Fresh histogram over [1, maxRaw + 1] holding every slice of the series,
// merged with hdr_add.
// Throws EmptySeriesError when no slice has samples.
Histogram aggregate_series(const MetricSeries& series, int significant_figures = kSignificantFigures);

struct Aggregation {
    double  min{};
    double  avg{};
    double  max{};
    int64_t count{};
    std::vector<std::pair<int,double>> percentiles; // (p, value)
};

// Statistics of a histogram in the converter's units; zeros when empty.
Aggregation summarize_histogram(const Histogram& h, const std::vector<int>& pctl, const UnitConverter& units);

struct TagAggregation {
    std::string              tag;
    std::optional<Histogram> histogram;
    std::string              error;     // valid if !histogram
};

// aggregate_series for every tag, at most `concurrency` tags at a time.
// An empty tag is reported in its own entry and does not affect the others.
std::vector<TagAggregation> aggregate_all(const SliceRepository& repo,
                                          int significant_figures,
                                          int concurrency);

} // namespace hq
