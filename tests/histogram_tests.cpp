#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <utility>

#include "hq/errors.hpp"
#include "hq/histogram.hpp"

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

template <typename Fn>
static bool throws_invalid_argument(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const InvalidArgumentError&)
    {
        return true;
    }
    return false;
}

static void test_construction_limits()
{
    assert_true(throws_invalid_argument([] { Histogram h(0, 100, 3); }), "lowest 0 rejected");
    assert_true(throws_invalid_argument([] { Histogram h(1, 100, 0); }), "0 significant figures rejected");
    assert_true(throws_invalid_argument([] { Histogram h(1, 100, 6); }), "6 significant figures rejected");
    assert_true(throws_invalid_argument([] { Histogram h(10, 15, 3); }), "highest < 2*lowest rejected");
    assert_true(throws_invalid_argument([] { Histogram h{HdrHistogramPtr()}; }), "null handle rejected");

    Histogram h(1, 3600LL * 1000 * 1000 * 1000, 3);
    assert_true(h.total_count() == 0, "fresh histogram is empty");
    assert_true(h.get() != nullptr, "handle allocated");
    assert_true(h.significant_figures() == 3, "sig figs kept");
    assert_true(h.highest_trackable_value() == 3600LL * 1000 * 1000 * 1000, "highest trackable kept");
    assert_true(h.mean() == 0.0, "mean of an empty histogram is 0");
}

static void test_record_and_stats()
{
    Histogram h(1, 100000, 3);
    for (int v = 1; v <= 10; ++v) h.record(v);
    h.record(5, 3);
    assert_true(h.total_count() == 13, "total count");
    assert_true(h.min_value() == 1, "min");
    assert_true(h.max_value() == 10, "max");
    assert_true(approx(h.mean(), (55.0 + 15.0) / 13.0), "mean of exact values");
    assert_true(hdr_count_at_value(h.get(), 5) == 4, "repeated value counted");

    assert_true(throws_invalid_argument([&] { h.record(-1); }), "negative value rejected");
    assert_true(throws_invalid_argument([&] { h.record(1LL << 40); }), "untrackable value rejected");
    assert_true(h.total_count() == 13, "rejected values not counted");
}

static void test_value_at_percentile()
{
    Histogram h(1, 100000, 3);
    for (int v = 1; v <= 100; ++v) h.record(v);
    assert_true(h.value_at_percentile(50) == 50, "p50");
    assert_true(h.value_at_percentile(99) == 99, "p99");
    assert_true(h.value_at_percentile(100) == 100, "p100");
    assert_true(h.value_at_percentile(250) == 100, "percentile clamped to 100");
    assert_true(h.value_at_percentile(0) == 1, "p0 is the lowest value");
    assert_true(throws_invalid_argument([&] { (void)h.value_at_percentile(std::nan("")); }), "NaN percentile");
    assert_true(throws_invalid_argument([&] { (void)h.value_at_percentile(-1.0); }), "negative percentile");

    Histogram coarse(1, 1LL << 40, 3);
    coarse.record(1000000);
    assert_true(coarse.value_at_percentile(50) == 1000447, "highest equivalent reported");
    assert_true(coarse.value_at_percentile(0) == 999936, "p0 reports lowest equivalent");
    assert_true(coarse.min_value() == 999936, "min is the lowest equivalent");
    assert_true(coarse.max_value() == 1000447, "max is the highest equivalent");

    Histogram empty(1, 1000, 3);
    assert_true(empty.value_at_percentile(50) == 0, "empty histogram -> 0");
}

static void test_add_same_layout()
{
    Histogram a(1, 100000, 3);
    Histogram b(1, 100000, 3);
    a.record(3, 2);
    b.record(7, 5);
    b.record(1);
    a.add(b);
    assert_true(a.total_count() == 8, "merged total");
    assert_true(a.min_value() == 1 && a.max_value() == 7, "merged min/max");
    assert_true(hdr_count_at_value(a.get(), 7) == 5, "merged bucket");
    assert_true(b.total_count() == 6, "source left untouched");
}

static void test_add_different_layout()
{
    Histogram target(1, 1LL << 40, 3);
    Histogram src(1, 5000, 3);
    src.record(4000, 2);
    src.record(12);
    target.add(src);
    assert_true(target.total_count() == 3, "value-wise merge total");
    assert_true(hdr_count_at_value(target.get(), 4000) == 2, "value-wise merge bucket");

    Histogram small(1, 100, 3);
    assert_true(throws_invalid_argument([&] { small.add(target); }), "merge of values that do not fit");

    Histogram none(1, 100, 3);
    Histogram fresh(1, 100, 3);
    fresh.add(none);
    assert_true(fresh.total_count() == 0, "merging an empty histogram is a no-op");
}

static void test_move_transfers_ownership()
{
    Histogram a(1, 100000, 3);
    a.record(42, 2);
    const hdr_histogram* handle = a.get();

    Histogram b(std::move(a));
    assert_true(b.get() == handle, "move construction keeps the handle");
    assert_true(b.total_count() == 2, "counts follow the handle");

    Histogram c(1, 10, 1);
    c = std::move(b);
    assert_true(c.get() == handle && c.max_value() == 42, "move assignment keeps the handle");
}

int main()
{
    test_construction_limits();
    test_record_and_stats();
    test_value_at_percentile();
    test_add_same_layout();
    test_add_different_layout();
    test_move_transfers_ownership();
    std::cout << "histogram tests: OK" << std::endl;
    return 0;
}
