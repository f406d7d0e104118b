#include "hq/repository.hpp"

#include <algorithm>
#include <limits>

#include "hq/errors.hpp"
#include "hq/log_reader.hpp"

namespace hq {

SliceRepository SliceRepository::load(const std::string& path)
{
    return from_slices(read_interval_histograms(path));
}

SliceRepository SliceRepository::from_slices(std::vector<IntervalHistogram> slices)
{
    SliceRepository repo;
    for (auto& sl : slices)
    {
        repo.by_tag_[sl.tag].push_back(std::move(sl));
    }
    for (auto& [tag, series] : repo.by_tag_)
    {
        std::ranges::stable_sort(series, {}, &IntervalHistogram::start_time_ms);
    }
    return repo;
}

std::vector<std::string> SliceRepository::tags() const
{
    std::vector<std::string> out;
    out.reserve(by_tag_.size());
    for (const auto& [tag, series] : by_tag_) out.push_back(tag);
    return out;
}

bool SliceRepository::contains(const std::string& tag) const
{
    return by_tag_.find(tag) != by_tag_.end();
}

const MetricSeries& SliceRepository::series(const std::string& tag) const
{
    auto it = by_tag_.find(tag);
    if (it == by_tag_.end())
    {
        throw InvalidArgumentError("no metric tagged \"" + tag + "\" in the log");
    }
    return it->second;
}

double slice_min_value(const IntervalHistogram& slice, const UnitConverter& units)
{
    return units.to_display(static_cast<double>(slice.min_value_raw()));
}

double slice_max_value(const IntervalHistogram& slice, const UnitConverter& units)
{
    return units.to_display(static_cast<double>(slice.max_value_raw()));
}

int64_t series_start_ms(const MetricSeries& series)
{
    if (series.empty()) throw EmptySeriesError("start time of an empty series");
    return std::ranges::min_element(series, {}, &IntervalHistogram::start_time_ms)->start_time_ms;
}

int64_t series_end_ms(const MetricSeries& series)
{
    if (series.empty()) throw EmptySeriesError("end time of an empty series");
    return std::ranges::max_element(series, {}, &IntervalHistogram::end_time_ms)->end_time_ms;
}

double series_min_value(const MetricSeries& series, const UnitConverter& units)
{
    int64_t lowest = std::numeric_limits<int64_t>::max();
    bool any = false;
    for (const auto& sl : series)
    {
        if (sl.total_count() == 0) continue;
        lowest = std::min(lowest, sl.min_value_raw());
        any = true;
    }
    if (!any) throw EmptySeriesError("min value of a series without samples");
    return units.to_display(static_cast<double>(lowest));
}

double series_max_value(const MetricSeries& series, const UnitConverter& units)
{
    int64_t highest = 0;
    bool any = false;
    for (const auto& sl : series)
    {
        if (sl.total_count() == 0) continue;
        highest = std::max(highest, sl.max_value_raw());
        any = true;
    }
    if (!any) throw EmptySeriesError("max value of a series without samples");
    return units.to_display(static_cast<double>(highest));
}

int64_t series_count_nonempty(const MetricSeries& series)
{
    return std::ranges::count_if(series, [](const IntervalHistogram& sl) { return sl.total_count() > 0; });
}

int64_t series_value_count(const MetricSeries& series)
{
    int64_t total = 0;
    for (const auto& sl : series) total += sl.total_count();
    return total;
}

int64_t repository_start_ms(const SliceRepository& repo)
{
    if (repo.empty()) throw EmptySeriesError("start time of an empty log");
    int64_t t0 = std::numeric_limits<int64_t>::max();
    for (const auto& [tag, series] : repo.by_tag()) t0 = std::min(t0, series_start_ms(series));
    return t0;
}

int64_t repository_end_ms(const SliceRepository& repo)
{
    if (repo.empty()) throw EmptySeriesError("end time of an empty log");
    int64_t t1 = std::numeric_limits<int64_t>::min();
    for (const auto& [tag, series] : repo.by_tag()) t1 = std::max(t1, series_end_ms(series));
    return t1;
}

int64_t repository_value_count(const SliceRepository& repo)
{
    int64_t total = 0;
    for (const auto& [tag, series] : repo.by_tag()) total += series_value_count(series);
    return total;
}

} // namespace hq
