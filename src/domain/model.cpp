#include "hq/model.hpp"

#include "hq/errors.hpp"

namespace hq {

const char* error_kind_str(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::LogFormat: return "log-format";
        case ErrorKind::EmptySeries: return "empty-series";
        case ErrorKind::NoStabilityData: return "no-stability-data";
        case ErrorKind::UnknownPlotKind: return "unknown-plot-kind";
        case ErrorKind::InvalidArgument: return "invalid-argument";
    }
    return "unknown";
}

const char* plot_kind_str(PlotKind k)
{
    switch (k)
    {
        case PlotKind::Baseplot: return "baseplot";
        case PlotKind::Percentiles: return "percentiles";
        case PlotKind::Stability: return "stability";
    }
    return "unknown";
}

PlotKind plot_kind_from_string(const std::string& name)
{
    if (name == "baseplot") return PlotKind::Baseplot;
    if (name == "percentiles") return PlotKind::Percentiles;
    if (name == "stability") return PlotKind::Stability;
    throw UnknownPlotKindError("unknown plot type \"" + name + "\"");
}

} // namespace hq
