#include "hq/output.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "hq/report.hpp"
#include "hq/repository.hpp"

namespace hq {

std::string format_timestamp(int64_t epoch_ms)
{
    int64_t secs = epoch_ms / 1000;
    int64_t millis = epoch_ms % 1000;
    if (millis < 0)
    {
        millis += 1000;
        --secs;
    }
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << millis * 1000;
    return os.str();
}

static void write_range(std::ostringstream& os, double lo, double hi, int width, const std::string& unit)
{
    os << std::setw(width) << lo << " to " << std::setw(width) << hi << ' ' << unit;
}

std::string format_inspect_text(const InspectReport& rep)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "HDR log details for \"" << rep.filename << "\"\n";
    os << "  Start time: " << format_timestamp(rep.start_ms) << '\n';
    os << "  End time:   " << format_timestamp(rep.end_ms) << '\n';
    os << "  Time interval covered: " << rep.end_ms - rep.start_ms << " ms\n";
    os << "    (time refs below are relative to \"Start time\")\n";
    os << "  Tags (" << rep.tags.size() << " total):\n";
    for (const auto& t : rep.tags)
    {
        os << "    Tag \"" << t.tag << "\", " << t.slices.size() << " slices.\n";
        os << "      Values: " << t.value_count;
        if (t.has_values)
        {
            os << " (ranging ";
            write_range(os, t.min, t.max, 0, rep.unit_name);
            os << ')';
        }
        os << '\n';
        os << "      Time interval: " << std::setw(6) << t.start_ms - rep.start_ms
           << " to " << std::setw(6) << t.end_ms - rep.start_ms
           << " (" << std::setw(6) << t.end_ms - t.start_ms << " ms total)\n";
        if (t.aggregation)
        {
            os << "      Aggregate:";
            for (const auto& [p, v] : t.aggregation->percentiles)
            {
                os << " p" << p << '=' << v;
            }
            os << " mean=" << t.aggregation->avg << ' ' << rep.unit_name << '\n';
        }
        else
        {
            os << "      Aggregate: unavailable (" << t.aggregation_error << ")\n";
        }
        os << "      Slices:\n";
        for (size_t i = 0; i < t.slices.size(); ++i)
        {
            const SliceRow& s = t.slices[i];
            os << "        (" << std::setw(3) << i << ") " << std::setw(12) << s.count << " vals"
               << ", t = " << std::setw(6) << s.start_ms - rep.start_ms
               << " to " << std::setw(6) << s.end_ms - rep.start_ms
               << " (" << std::setw(6) << s.end_ms - s.start_ms << " ms)";
            if (s.count > 0)
            {
                os << ", ranging ";
                write_range(os, s.min, s.max, 8, rep.unit_name);
            }
            os << '\n';
        }
    }
    return os.str();
}

std::string format_metric_menu(const SliceRepository& repo, const std::vector<std::string>& tags)
{
    std::ostringstream os;
    os << "Available metrics to analyse:\n";
    for (size_t i = 0; i < tags.size(); ++i)
    {
        const MetricSeries& s = repo.series(tags[i]);
        const int64_t covers = s.empty() ? 0 : series_end_ms(s) - series_start_ms(s);
        os << "  (" << std::setw(2) << i << ") "
           << std::setw(52) << ('"' + tags[i] + '"')
           << " (" << std::setw(2) << series_count_nonempty(s) << " non-empty slices, "
           << std::setw(9) << series_value_count(s) << " values, covers "
           << std::setw(6) << covers << " ms)\n";
    }
    return os.str();
}

static const char* progress_label(PlotKind kind)
{
    switch (kind)
    {
        case PlotKind::Baseplot: return "base plot";
        case PlotKind::Percentiles: return "percentile plot";
        case PlotKind::Stability: return "stability plot";
    }
    return "plot";
}

std::string format_progress_text(PlotKind kind, bool done)
{
    if (done) return "done.\n";
    return std::string("  * Calculating ") + progress_label(kind) + " ... ";
}

} // namespace hq
