#include "hq/output.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>

#include "hq/errors.hpp"
#include "hq/gnuplot.hpp"

namespace hq {

namespace {

// gnuplot single-quoted string: a quote is doubled
std::string gp_quote(const std::string& s)
{
    std::string out = "'";
    for (char c : s)
    {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += '\'';
    return out;
}

// matplotlib "winter": blue (t = 0) to spring green (t = 1)
std::string winter_color(size_t i, size_t n)
{
    const double t = n > 1 ? static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;
    const int g = static_cast<int>(t * 255.0 + 0.5);
    const int b = static_cast<int>((1.0 - 0.5 * t) * 255.0 + 0.5);
    std::ostringstream os;
    os << "#00" << std::hex << std::setfill('0') << std::setw(2) << g << std::setw(2) << b;
    return os.str();
}

void write_inline_data(std::ostringstream& os, const std::vector<double>& xs, const std::vector<double>& ys)
{
    const size_t n = std::min(xs.size(), ys.size());
    for (size_t i = 0; i < n; ++i) os << xs[i] << ' ' << ys[i] << '\n';
    os << "e\n";
}

void write_preamble(std::ostringstream& os, const std::string& path, int w, int h)
{
    os << "set terminal pngcairo size " << w << ',' << h << '\n';
    os << "set output " << gp_quote(path) << '\n';
}

void baseplot_script(std::ostringstream& os, const PlotData& plot, const std::string& metric,
                     const std::string& unit)
{
    static const Curve empty;
    const Curve& c = plot.curves.empty() ? empty : plot.curves.front();
    double sum_xy = 0.0, sum_y = 0.0;
    for (size_t i = 0; i < c.xs.size() && i < c.ys.size(); ++i)
    {
        sum_xy += c.xs[i] * c.ys[i];
        sum_y += c.ys[i];
    }
    const double average = sum_y > 0.0 ? sum_xy / sum_y : 0.0;

    std::ostringstream title;
    title << std::fixed << std::setprecision(2)
          << "Distribution for \"" << metric << "\" (avg = " << average << ' ' << unit << ')';

    os << "set xlabel " << gp_quote("t [" + unit + "]") << '\n';
    os << "set ylabel " << gp_quote("p(t) [1/" + unit + "]") << '\n';
    os << "set yrange [0:*]\n";
    os << "set title " << gp_quote(title.str()) << '\n';
    os << "set boxwidth " << plot.x_step << " absolute\n";
    os << "set style fill solid 1.0 noborder\n";
    if (c.xs.empty())
    {
        os << "plot NaN notitle\n";
        return;
    }
    os << "plot '-' using 1:2 with boxes lc rgb '#1f77b4' notitle\n";
    write_inline_data(os, c.xs, c.ys);
}

void stability_script(std::ostringstream& os, const PlotData& plot, const std::string& metric,
                      const std::string& unit)
{
    os << "set xlabel " << gp_quote("t [" + unit + "]") << '\n';
    os << "set ylabel " << gp_quote("p(t) [1/" + unit + "]") << '\n';
    os << "set yrange [0:*]\n";
    os << "set key top right\n";
    os << "set title " << gp_quote("Stability analysis for \"" + metric + "\"") << '\n';

    std::vector<size_t> drawn;
    for (size_t i = 0; i < plot.curves.size(); ++i)
    {
        if (!plot.curves[i].xs.empty()) drawn.push_back(i);
    }
    if (drawn.empty())
    {
        os << "plot NaN notitle\n";
        return;
    }
    os << "plot ";
    for (size_t k = 0; k < drawn.size(); ++k)
    {
        const size_t i = drawn[k];
        if (k) os << ", ";
        os << "'-' using 1:2 with lines lw 3 lc rgb '" << winter_color(i, plot.curves.size())
           << "' title 'Slice " << i << "'";
    }
    os << '\n';
    for (size_t i : drawn) write_inline_data(os, plot.curves[i].xs, plot.curves[i].ys);
}

void percentiles_script(std::ostringstream& os, const PlotData& plot, const std::string& metric,
                        const std::string& unit)
{
    static const Curve empty;
    static const int xticks[] = {0, 10, 20, 30, 40, 50, 60, 70, 80, 90, 95, 100};
    const Curve& c = plot.curves.empty() ? empty : plot.curves.front();

    os << "set xlabel 'Percentile'\n";
    os << "set ylabel " << gp_quote("t [" + unit + "]") << '\n';
    os << "set yrange [0:*]\n";
    os << "set grid\n";
    os << "set title " << gp_quote("Percentiles for \"" + metric + "\"") << '\n';

    os << "set xtics (";
    for (size_t k = 0; k < std::size(xticks); ++k) os << (k ? ", " : "") << xticks[k];
    os << ")\n";

    // one y tic at the first curve value reaching each x tic
    std::vector<double> yticks;
    for (int xt : xticks)
    {
        for (size_t i = 0; i < c.xs.size() && i < c.ys.size(); ++i)
        {
            if (c.xs[i] >= xt)
            {
                yticks.push_back(c.ys[i]);
                break;
            }
        }
    }
    if (!yticks.empty())
    {
        os << "set ytics (";
        for (size_t k = 0; k < yticks.size(); ++k) os << (k ? ", " : "") << yticks[k];
        os << ")\n";
    }

    if (c.xs.empty())
    {
        os << "plot NaN notitle\n";
        return;
    }
    os << "plot '-' using 1:2 with lines lw 2 notitle\n";
    write_inline_data(os, c.xs, c.ys);
}

} // namespace

std::string build_gnuplot_script(const PlotData& plot,
                                 const std::string& metric,
                                 const std::string& path,
                                 const std::string& unit_name)
{
    std::ostringstream os;
    os << std::setprecision(10);
    switch (plot.kind)
    {
        case PlotKind::Baseplot:
            write_preamble(os, path, 2000, 1400);
            baseplot_script(os, plot, metric, unit_name);
            break;
        case PlotKind::Stability:
            write_preamble(os, path, 2000, 1400);
            stability_script(os, plot, metric, unit_name);
            break;
        case PlotKind::Percentiles:
            write_preamble(os, path, 1400, 2000);
            percentiles_script(os, plot, metric, unit_name);
            break;
        default:
            throw UnknownPlotKindError("unknown plot kind " + std::to_string(static_cast<int>(plot.kind)));
    }
    os << "unset output\n";
    return os.str();
}

bool write_figure(const PlotData& plot,
                  const std::string& metric,
                  const std::string& path,
                  const std::string& unit_name)
{
    switch (run_gnuplot(build_gnuplot_script(plot, metric, path, unit_name)))
    {
        case GnuplotStatus::Ok: return true;
        case GnuplotStatus::NotAvailable:
            std::cerr << "      ** gnuplot not available! **\n";
            return false;
        case GnuplotStatus::Failed: return false;
    }
    return false;
}

} // namespace hq
