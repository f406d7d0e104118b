#include "hq/output.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include "hq/errors.hpp"

namespace hq {

static void append_e(std::string& out, double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%e", v);
    out += buf;
}

std::string output_file_name(const std::string& root, PlotKind kind, const std::string& ext)
{
    return root + "_" + plot_kind_str(kind) + "." + ext;
}

bool can_create_file(const std::string& path, bool overwrite)
{
    std::error_code ec;
    return overwrite || !std::filesystem::is_regular_file(path, ec);
}

std::string format_datafile(const PlotData& plot)
{
    std::string out;
    switch (plot.kind)
    {
        case PlotKind::Baseplot:
        case PlotKind::Percentiles:
        {
            if (plot.curves.empty()) return out;
            const Curve& c = plot.curves.front();
            const size_t n = std::min(c.xs.size(), c.ys.size());
            for (size_t i = 0; i < n; ++i)
            {
                if (i) out += '\n';
                append_e(out, c.xs[i]);
                out += '\t';
                append_e(out, c.ys[i]);
            }
            return out;
        }
        case PlotKind::Stability:
        {
            // curves share the first curve's xs
            if (plot.curves.empty()) return out;
            size_t n = plot.curves.front().xs.size();
            for (const auto& c : plot.curves) n = std::min(n, c.ys.size());
            for (size_t i = 0; i < n; ++i)
            {
                if (i) out += '\n';
                append_e(out, plot.curves.front().xs[i]);
                for (const auto& c : plot.curves)
                {
                    out += '\t';
                    append_e(out, c.ys[i]);
                }
            }
            return out;
        }
    }
    throw UnknownPlotKindError("unknown plot kind " + std::to_string(static_cast<int>(plot.kind)));
}

bool write_datafile(const PlotData& plot, const std::string& path)
{
    const std::string content = format_datafile(plot);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << content;
    out.flush();
    return static_cast<bool>(out);
}

} // namespace hq
