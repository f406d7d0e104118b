#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "hq/model.hpp"

namespace hq {

// Reads interval histograms from a text histogram log:
//   #[StartTime: <sec> ...]   #[BaseTime: <sec> ...]   "StartTimestamp",...
//   [Tag=<tag>,]<start sec>,<interval sec>,<interval max>,<base64 payload>
// Malformed records raise LogFormatError with the line number.
class HistogramLogReader {
public:
    explicit HistogramLogReader(std::istream& in);

    // std::nullopt once the input is exhausted.
    std::optional<IntervalHistogram> next_interval_histogram();

    double start_time_sec() const { return start_time_sec_; }
    double base_time_sec() const { return base_time_sec_; }

private:
    void parse_header_comment(const std::string& line);
    IntervalHistogram parse_record(const std::string& line);

    std::istream& in_;
    size_t line_no_ = 0;
    double start_time_sec_ = 0.0;
    double base_time_sec_ = 0.0;
    bool   observed_start_time_ = false;
    bool   observed_base_time_ = false;
};

// Every record of the file, in file order. Throws LogFormatError.
std::vector<IntervalHistogram> read_interval_histograms(const std::string& path);

class HistogramLogWriter {
public:
    explicit HistogramLogWriter(std::ostream& out) : out_(out) {}

    void write_header(double start_time_sec);
    void write_base_time(double base_time_sec);
    void write_legend();
    // max column is in display units, as the load generator writes it
    void write_interval(const std::string& tag, double start_sec, double interval_sec,
                        const Histogram& h);

private:
    std::ostream& out_;
};

} // namespace hq
