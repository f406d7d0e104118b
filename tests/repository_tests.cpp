#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "hq/errors.hpp"
#include "hq/repository.hpp"
#include "hq/units.hpp"

using namespace hq;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static bool approx(double a, double b, double eps = 1e-9)
{
    return std::fabs(a - b) <= eps;
}

template <typename E, typename Fn>
static bool throws(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const E&)
    {
        return true;
    }
    return false;
}

static IntervalHistogram slice(const std::string& tag, int64_t start_ms, int64_t end_ms,
                               std::vector<int64_t> values)
{
    Histogram h(1, 1LL << 40, 3);
    for (int64_t v : values) h.record(v);
    return IntervalHistogram{tag, start_ms, end_ms, std::move(h)};
}

static SliceRepository sample_repo()
{
    std::vector<IntervalHistogram> slices;
    slices.push_back(slice("read", 3000, 4000, {1000, 2000}));
    slices.push_back(slice("write", 500, 1500, {}));
    slices.push_back(slice("read", 1000, 2000, {500}));
    slices.push_back(slice("read", 1000, 2500, {})); // same start, later in file
    slices.push_back(slice("write", 1500, 2500, {700, 800, 900}));
    return SliceRepository::from_slices(std::move(slices));
}

static void test_unit_converter()
{
    UnitConverter ms;
    assert_true(!ms.raw() && approx(ms.scale(), kValueScale), "default converts to ms");
    assert_true(approx(ms.to_display(2500000.0), 2.5), "ns -> ms");
    assert_true(approx(ms.to_raw(2.5), 2500000.0), "ms -> ns");
    assert_true(std::string(ms.unit_name()) == "ms", "ms unit name");

    for (double v : {0.0, 1.0, 0.001, 97.5, 1234.5678, 3.6e6})
    {
        assert_true(approx(ms.to_display(ms.to_raw(v)), v, std::fabs(v) * 1e-15), "display -> raw -> display");
        assert_true(approx(ms.to_raw(ms.to_display(v)), v, std::fabs(v) * 1e-15), "raw -> display -> raw");
    }

    UnitConverter raw(true);
    assert_true(approx(raw.to_display(1234.0), 1234.0) && approx(raw.to_raw(1234.0), 1234.0), "raw identity");
    assert_true(std::string(raw.unit_name()) == "RU", "raw unit name");
}

static void test_grouping_and_order()
{
    const SliceRepository repo = sample_repo();
    const auto tags = repo.tags();
    assert_true(tags.size() == 2 && tags[0] == "read" && tags[1] == "write", "sorted tags");
    assert_true(repo.contains("read") && !repo.contains("nope"), "contains");
    assert_true(!repo.empty(), "not empty");

    const MetricSeries& read = repo.series("read");
    assert_true(read.size() == 3, "three read slices");
    assert_true(read[0].start_time_ms == 1000 && read[0].total_count() == 1, "earliest first");
    assert_true(read[1].start_time_ms == 1000 && read[1].total_count() == 0, "ties keep file order");
    assert_true(read[2].start_time_ms == 3000, "latest last");

    assert_true(throws<InvalidArgumentError>([&] { (void) repo.series("nope"); }), "unknown tag");
    assert_true(SliceRepository::from_slices({}).empty(), "no slices, no tags");
}

static void test_series_summaries()
{
    const SliceRepository repo = sample_repo();
    const MetricSeries& read = repo.series("read");
    const UnitConverter raw(true);

    assert_true(series_start_ms(read) == 1000, "series start");
    assert_true(series_end_ms(read) == 4000, "series end");
    assert_true(series_value_count(read) == 3, "value count");
    assert_true(series_count_nonempty(read) == 2, "non-empty slices");
    assert_true(approx(series_min_value(read, raw), 500.0), "min over non-empty slices");
    assert_true(approx(series_max_value(read, raw), 2000.0), "max over non-empty slices");

    const UnitConverter ms;
    assert_true(approx(series_max_value(read, ms), 0.002), "max in ms");
    assert_true(approx(slice_min_value(read[2], raw), 1000.0), "slice min");
    assert_true(approx(slice_max_value(read[2], raw), 2000.0), "slice max");
}

static void test_empty_series_errors()
{
    const MetricSeries none;
    const UnitConverter raw(true);
    assert_true(throws<EmptySeriesError>([&] { (void) series_start_ms(none); }), "start of empty");
    assert_true(throws<EmptySeriesError>([&] { (void) series_end_ms(none); }), "end of empty");
    assert_true(series_value_count(none) == 0 && series_count_nonempty(none) == 0, "counts of empty");

    MetricSeries silent;
    silent.push_back(slice("x", 0, 10, {}));
    assert_true(throws<EmptySeriesError>([&] { (void) series_min_value(silent, raw); }), "min without samples");
    assert_true(throws<EmptySeriesError>([&] { (void) series_max_value(silent, raw); }), "max without samples");
    assert_true(series_start_ms(silent) == 0 && series_end_ms(silent) == 10, "time range without samples");
}

static void test_repository_summaries()
{
    const SliceRepository repo = sample_repo();
    assert_true(repository_start_ms(repo) == 500, "log start");
    assert_true(repository_end_ms(repo) == 4000, "log end");
    assert_true(repository_value_count(repo) == 6, "log value count");

    const SliceRepository empty = SliceRepository::from_slices({});
    assert_true(throws<EmptySeriesError>([&] { (void) repository_start_ms(empty); }), "start of empty log");
    assert_true(repository_value_count(empty) == 0, "empty log count");
}

int main()
{
    test_unit_converter();
    test_grouping_and_order();
    test_series_summaries();
    test_empty_series_errors();
    test_repository_summaries();
    std::cout << "repository tests: OK" << std::endl;
    return 0;
}
