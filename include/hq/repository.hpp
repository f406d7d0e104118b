#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "hq/model.hpp"
#include "hq/units.hpp"

namespace hq {

// Interval histograms grouped by tag, each group sorted by start time
// (stable: ties keep file order). Never mutated after construction.
class SliceRepository {
public:
    static SliceRepository load(const std::string& path);
    static SliceRepository from_slices(std::vector<IntervalHistogram> slices);

    std::vector<std::string> tags() const;
    bool contains(const std::string& tag) const;
    // Throws InvalidArgumentError for an unknown tag.
    const MetricSeries& series(const std::string& tag) const;

    const std::map<std::string, MetricSeries>& by_tag() const { return by_tag_; }
    bool empty() const { return by_tag_.empty(); }

private:
    std::map<std::string, MetricSeries> by_tag_;
};

// Single slice
double slice_min_value(const IntervalHistogram& slice, const UnitConverter& units);
double slice_max_value(const IntervalHistogram& slice, const UnitConverter& units);

// Series reductions. Time and min/max queries throw EmptySeriesError when
// there is nothing to reduce; counts return 0.
int64_t series_start_ms(const MetricSeries& series);
int64_t series_end_ms(const MetricSeries& series);
double  series_min_value(const MetricSeries& series, const UnitConverter& units);
double  series_max_value(const MetricSeries& series, const UnitConverter& units);
int64_t series_count_nonempty(const MetricSeries& series);
int64_t series_value_count(const MetricSeries& series);

// Whole repository
int64_t repository_start_ms(const SliceRepository& repo);
int64_t repository_end_ms(const SliceRepository& repo);
int64_t repository_value_count(const SliceRepository& repo);

} // namespace hq
