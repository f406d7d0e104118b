#include "hq/report.hpp"

#include <utility>

namespace hq {

InspectReport build_inspect_report(const SliceRepository& repo,
                                   const std::string& filename,
                                   const UnitConverter& units,
                                   int concurrency)
{
    InspectReport rep;
    rep.filename = filename;
    rep.unit_name = units.unit_name();
    rep.start_ms = repository_start_ms(repo);
    rep.end_ms = repository_end_ms(repo);

    std::vector<TagAggregation> aggs = aggregate_all(repo, kSignificantFigures, concurrency);

    size_t i = 0;
    for (const auto& [tag, series] : repo.by_tag())
    {
        TagReport tr;
        tr.tag = tag;
        tr.value_count = series_value_count(series);
        tr.nonempty_slices = series_count_nonempty(series);
        tr.has_values = tr.nonempty_slices > 0;
        if (tr.has_values)
        {
            tr.min = series_min_value(series, units);
            tr.max = series_max_value(series, units);
        }
        tr.start_ms = series_start_ms(series);
        tr.end_ms = series_end_ms(series);

        tr.slices.reserve(series.size());
        for (const auto& sl : series)
        {
            SliceRow row{sl.total_count(), sl.start_time_ms, sl.end_time_ms, 0.0, 0.0};
            if (row.count > 0)
            {
                row.min = slice_min_value(sl, units);
                row.max = slice_max_value(sl, units);
            }
            tr.slices.push_back(row);
        }

        const TagAggregation& ag = aggs[i++];
        if (ag.histogram)
        {
            tr.aggregation = summarize_histogram(*ag.histogram, kReportPercentiles, units);
        }
        else
        {
            tr.aggregation_error = ag.error;
        }
        rep.tags.push_back(std::move(tr));
    }
    return rep;
}

} // namespace hq
