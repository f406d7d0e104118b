#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "hq/model.hpp"

namespace hq
{
// Forward declarations to avoid heavy includes in header
struct InspectReport;
class SliceRepository;

// Local time, "%Y-%m-%d %H:%M:%S.<microseconds>"
std::string format_timestamp(int64_t epoch_ms);

// Text formatting (complete text blocks with trailing newlines)
std::string format_inspect_text(const InspectReport &rep);

std::string format_metric_menu(const SliceRepository &repo,
                               const std::vector<std::string> &tags);

std::string format_progress_text(PlotKind kind, bool done);

// Final JSON (single object string without trailing newline)
std::string build_inspect_json(const InspectReport &rep);

// "<root>_<kind>.<ext>"
std::string output_file_name(const std::string &root, PlotKind kind,
                             const std::string &ext);

// True when path may be written: overwrite requested or no regular file there.
bool can_create_file(const std::string &path, bool overwrite);

// Tab separated "%e" columns, one row per point, no trailing newline.
// Stability rows hold x followed by one y per curve.
std::string format_datafile(const PlotData &plot);

bool write_datafile(const PlotData &plot, const std::string &path);

// gnuplot program rendering plot to a PNG at path, data inlined.
std::string build_gnuplot_script(const PlotData &plot,
                                 const std::string &metric,
                                 const std::string &path,
                                 const std::string &unit_name);

// False when gnuplot is missing or fails.
bool write_figure(const PlotData &plot,
                  const std::string &metric,
                  const std::string &path,
                  const std::string &unit_name);
} // namespace hq
