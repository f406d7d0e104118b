#include "hq/aggregate.hpp"

#include <algorithm>
#include <string>

#include "hq/concurrency.hpp"
#include "hq/errors.hpp"

namespace hq {

Histogram aggregate_series(const MetricSeries& series, int significant_figures)
{
    int64_t max_raw = 0;
    bool any = false;
    for (const auto& sl : series)
    {
        if (sl.total_count() == 0) continue;
        max_raw = std::max(max_raw, sl.max_value_raw());
        any = true;
    }
    if (!any)
    {
        const std::string tag = series.empty() ? std::string() : series.front().tag;
        throw EmptySeriesError("metric \"" + tag + "\" has no samples to aggregate");
    }

    // a series whose only samples are zeros still needs a valid range
    Histogram full(1, std::max<int64_t>(max_raw + 1, 2), significant_figures);
    for (const auto& sl : series) full.add(sl.histogram);
    return full;
}

Aggregation summarize_histogram(const Histogram& h, const std::vector<int>& pctl, const UnitConverter& units)
{
    Aggregation ag{};
    if (h.total_count() == 0) return ag;

    ag.min = units.to_display(static_cast<double>(h.min_value()));
    ag.max = units.to_display(static_cast<double>(h.max_value()));
    ag.avg = units.to_display(h.mean());
    ag.count = h.total_count();

    ag.percentiles.reserve(pctl.size());
    for (int p : pctl)
    {
        int pc = std::clamp(p, 0, 100);
        ag.percentiles.emplace_back(
            p, units.to_display(static_cast<double>(h.value_at_percentile(pc))));
    }
    return ag;
}

std::vector<TagAggregation> aggregate_all(const SliceRepository& repo,
                                          int significant_figures,
                                          int concurrency)
{
    std::vector<const MetricSeries*> work;
    std::vector<TagAggregation> out;
    for (const auto& [tag, series] : repo.by_tag())
    {
        work.push_back(&series);
        out.push_back(TagAggregation{tag, std::nullopt, {}});
    }

    // each task writes only its own slot
    auto do_one = [&](int i, const std::atomic<bool>&)
    {
        TagAggregation& slot = out[i - 1];
        try
        {
            slot.histogram = aggregate_series(*work[i - 1], significant_figures);
        }
        catch (const EmptySeriesError& e)
        {
            slot.error = e.what();
        }
    };

    for_each_index_batched_cancelable(static_cast<int>(work.size()), concurrency, do_one);
    return out;
}

} // namespace hq
