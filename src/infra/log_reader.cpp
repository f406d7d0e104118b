#include "hq/log_reader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <string_view>

#include "hq/codec.hpp"
#include "hq/errors.hpp"
#include "hq/units.hpp"

using namespace std::string_view_literals;

namespace hq {

namespace {

constexpr double kOneYearSec = 365.0 * 24 * 3600;

bool parse_seconds(std::string_view s, double& out)
{
    if (s.empty()) return false;
    for (char c : s)
    {
        if ((c < '0' || c > '9') && c != '.') return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// Leading "<number>" of a header comment such as "1441812279.474 (seconds since epoch)".
bool parse_leading_seconds(std::string_view s, double& out)
{
    size_t end = 0;
    while (end < s.size() && ((s[end] >= '0' && s[end] <= '9') || s[end] == '.')) ++end;
    return parse_seconds(s.substr(0, end), out);
}

} // namespace

HistogramLogReader::HistogramLogReader(std::istream& in)
    : in_(in)
{}

void HistogramLogReader::parse_header_comment(const std::string& line)
{
    std::string_view v = line;
    double sec = 0.0;
    if (v.starts_with("#[StartTime: "sv))
    {
        if (!parse_leading_seconds(v.substr(13), sec))
        {
            throw LogFormatError("line " + std::to_string(line_no_) + ": malformed StartTime header");
        }
        start_time_sec_ = sec;
        observed_start_time_ = true;
    }
    else if (v.starts_with("#[BaseTime: "sv))
    {
        if (!parse_leading_seconds(v.substr(12), sec))
        {
            throw LogFormatError("line " + std::to_string(line_no_) + ": malformed BaseTime header");
        }
        base_time_sec_ = sec;
        observed_base_time_ = true;
    }
}

IntervalHistogram HistogramLogReader::parse_record(const std::string& line)
{
    const std::string where = "line " + std::to_string(line_no_) + ": ";
    std::string_view rest = line;
    std::string tag;
    if (rest.starts_with("Tag="sv))
    {
        size_t comma = rest.find(',');
        if (comma == std::string_view::npos)
        {
            throw LogFormatError(where + "tag without interval fields");
        }
        tag = std::string(rest.substr(4, comma - 4));
        rest.remove_prefix(comma + 1);
    }

    std::string_view fields[3];
    for (auto& f : fields)
    {
        size_t comma = rest.find(',');
        if (comma == std::string_view::npos)
        {
            throw LogFormatError(where + "expected start,interval,max,payload");
        }
        f = rest.substr(0, comma);
        rest.remove_prefix(comma + 1);
    }

    double start_sec = 0.0, interval_sec = 0.0, interval_max = 0.0;
    if (!parse_seconds(fields[0], start_sec)) throw LogFormatError(where + "bad start timestamp");
    if (!parse_seconds(fields[1], interval_sec)) throw LogFormatError(where + "bad interval length");
    if (!parse_seconds(fields[2], interval_max)) throw LogFormatError(where + "bad interval max");
    while (!rest.empty() && (rest.back() == '\r' || rest.back() == ' ')) rest.remove_suffix(1);
    if (rest.empty()) throw LogFormatError(where + "missing histogram payload");

    if (!observed_start_time_)
    {
        start_time_sec_ = start_sec;
        observed_start_time_ = true;
    }
    if (!observed_base_time_)
    {
        // timestamps more than a year before StartTime are relative to it
        base_time_sec_ = start_sec < start_time_sec_ - kOneYearSec ? start_time_sec_ : 0.0;
        observed_base_time_ = true;
    }

    Histogram h = [&] {
        try { return decode_compressed_histogram(rest); }
        catch (const LogFormatError& e)
        {
            throw LogFormatError(where + e.what());
        }
    }();

    const double absolute_start = start_sec + base_time_sec_;
    IntervalHistogram slice{
        std::move(tag),
        static_cast<int64_t>(std::llround(absolute_start * 1000.0)),
        static_cast<int64_t>(std::llround((absolute_start + interval_sec) * 1000.0)),
        std::move(h),
    };
    return slice;
}

std::optional<IntervalHistogram> HistogramLogReader::next_interval_histogram()
{
    std::string line;
    while (std::getline(in_, line))
    {
        ++line_no_;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        if (line[0] == '#')
        {
            parse_header_comment(line);
            continue;
        }
        if (line.starts_with("\"StartTimestamp\"")) continue;
        return parse_record(line);
    }
    if (in_.bad())
    {
        throw LogFormatError("read error after line " + std::to_string(line_no_));
    }
    return std::nullopt;
}

std::vector<IntervalHistogram> read_interval_histograms(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw LogFormatError("cannot open histogram log \"" + path + "\"");
    }
    HistogramLogReader reader(in);
    std::vector<IntervalHistogram> slices;
    while (auto slice = reader.next_interval_histogram())
    {
        slices.push_back(std::move(*slice));
    }
    return slices;
}

// ---------------------- HistogramLogWriter ----------------------

void HistogramLogWriter::write_header(double start_time_sec)
{
    out_ << "#[Histogram log format version 1.3]\n";
    out_ << std::fixed << std::setprecision(3);
    out_ << "#[StartTime: " << start_time_sec << " (seconds since epoch)]\n";
}

void HistogramLogWriter::write_base_time(double base_time_sec)
{
    out_ << std::fixed << std::setprecision(3);
    out_ << "#[BaseTime: " << base_time_sec << " (seconds since epoch)]\n";
}

void HistogramLogWriter::write_legend()
{
    out_ << "\"StartTimestamp\",\"Interval_Length\",\"Interval_Max\",\"Interval_Compressed_Histogram\"\n";
}

void HistogramLogWriter::write_interval(const std::string& tag, double start_sec,
                                        double interval_sec, const Histogram& h)
{
    const UnitConverter units;
    out_ << std::fixed << std::setprecision(3);
    if (!tag.empty()) out_ << "Tag=" << tag << ',';
    out_ << start_sec << ',' << interval_sec << ','
         << units.to_display(static_cast<double>(h.max_value())) << ','
         << encode_compressed_histogram(h) << '\n';
}

} // namespace hq
