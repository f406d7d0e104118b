#include "hq/cli.hpp"

#include <charconv>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hq/errors.hpp"
#include "hq/output.hpp"

using namespace std::string_view_literals;

namespace hq {

void print_usage(const char *prog, std::ostream &os)
{
    os << "HDR histogram log analyzer\n";
    os << "Usage: " << prog << " [options] <logfile>\n";
    os << "Options:\n";
    os << "  -i, --inspect          Detailed input breakdown\n";
    os << "  -m, --metric TAG       Metric tag to analyse (interactive choice if omitted)\n";
    os << "  -t, --threshold P      Max percentile kept in the plots, 0 to 100 (default: 97.5)\n";
    os << "  -z, --plotsize N       Number of points in the curves (default: 500)\n";
    os << "  -b, --baseplot         Distribution of the whole series\n";
    os << "  -c, --percentiles      Percentile curve\n";
    os << "  -s, --stability        One distribution per time slice\n";
    os << "  -p, --plot ROOT        Write images to ROOT_<kind>.png (gnuplot)\n";
    os << "  -d, --dump ROOT        Write data files to ROOT_<kind>.dat\n";
    os << "  -f, --force            Overwrite existing output files\n";
    os << "  -r, --raw              Keep the histogram units (no ms conversion)\n";
    os << "      --json             Inspection report as JSON\n";
    os << "      --concurrency K    Tags aggregated in parallel for the report (default: 1)\n";
    os << "  -h, --help             Show this help\n";
    os << "\n";
    os << "Examples:\n";
    os << "  " << prog << " -i latencies.hlog\n";
    os << "  " << prog << " -m read -b -c -s -p plots/read latencies.hlog\n";
}

namespace {

enum class Match { None, Value, Missing };

// "-x VALUE", "--long VALUE" or "--long=VALUE"
Match option_value(std::string_view a, std::string_view short_name, std::string_view long_name,
                   int &i, int argc, char **argv, std::string &val)
{
    if (a == short_name || a == long_name)
    {
        if (i + 1 >= argc) return Match::Missing;
        val = argv[++i];
        return Match::Value;
    }
    if (a.size() > long_name.size() && a.starts_with(long_name) && a[long_name.size()] == '=')
    {
        val = std::string(a.substr(long_name.size() + 1));
        return Match::Value;
    }
    return Match::None;
}

template <typename T>
bool parse_number(const std::string &s, T &out)
{
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// single-letter switches, possibly grouped as in "-bcs"
bool apply_switch(char c, Options &opt)
{
    switch (c)
    {
        case 'i': opt.inspect = true; return true;
        case 'b': opt.baseplot = true; return true;
        case 'c': opt.percentiles = true; return true;
        case 's': opt.stability = true; return true;
        case 'f': opt.force = true; return true;
        case 'r': opt.raw = true; return true;
        default: return false;
    }
}

} // namespace

bool parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        Match m = Match::None;
        if (a == "-h"sv || a == "--help"sv)
        {
            opt.help = true;
            print_usage(argv[0], std::cout);
            return false;
        }
        if (a == "--inspect"sv) opt.inspect = true;
        else if (a == "--baseplot"sv) opt.baseplot = true;
        else if (a == "--percentiles"sv) opt.percentiles = true;
        else if (a == "--stability"sv) opt.stability = true;
        else if (a == "--force"sv) opt.force = true;
        else if (a == "--raw"sv) opt.raw = true;
        else if (a == "--json"sv) opt.json = true;
        else if ((m = option_value(a, "-m"sv, "--metric"sv, i, argc, argv, val)) != Match::None)
        {
            if (m == Match::Missing)
            {
                std::cerr << "invalid --metric usage\n";
                return false;
            }
            opt.metric = std::move(val);
        }
        else if ((m = option_value(a, "-t"sv, "--threshold"sv, i, argc, argv, val)) != Match::None)
        {
            if (m == Match::Missing || !parse_number(val, opt.max_percentile) ||
                !std::isfinite(opt.max_percentile) || opt.max_percentile < 0.0 || opt.max_percentile > 100.0)
            {
                std::cerr << "invalid threshold: " << val << '\n';
                return false;
            }
        }
        else if ((m = option_value(a, "-z"sv, "--plotsize"sv, i, argc, argv, val)) != Match::None)
        {
            if (m == Match::Missing || !parse_number(val, opt.plot_points) || opt.plot_points <= 0)
            {
                std::cerr << "invalid plot size: " << val << '\n';
                return false;
            }
        }
        else if ((m = option_value(a, "-p"sv, "--plot"sv, i, argc, argv, val)) != Match::None)
        {
            if (m == Match::Missing)
            {
                std::cerr << "invalid --plot usage\n";
                return false;
            }
            opt.plot_root = std::move(val);
        }
        else if ((m = option_value(a, "-d"sv, "--dump"sv, i, argc, argv, val)) != Match::None)
        {
            if (m == Match::Missing)
            {
                std::cerr << "invalid --dump usage\n";
                return false;
            }
            opt.dump_root = std::move(val);
        }
        else if ((m = option_value(a, "--concurrency"sv, "--concurrency"sv, i, argc, argv, val)) != Match::None)
        {
            if (m == Match::Missing || !parse_number(val, opt.concurrency))
            {
                std::cerr << "invalid concurrency: " << val << '\n';
                return false;
            }
            if (opt.concurrency <= 0) opt.concurrency = 1;
        }
        else if (a.size() >= 2 && a[0] == '-' && a[1] != '-')
        {
            for (char c : a.substr(1))
            {
                if (!apply_switch(c, opt))
                {
                    std::cerr << "unknown option: " << a << '\n';
                    return false;
                }
            }
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "unknown option: " << a << '\n';
            return false;
        }
        else if (opt.filename.empty())
        {
            opt.filename = std::string(a);
        }
        else
        {
            std::cerr << "unexpected argument: " << a << '\n';
            return false;
        }
    }
    if (opt.filename.empty())
    {
        std::cerr << "missing <logfile>\n";
        print_usage(argv[0], std::cerr);
        return false;
    }
    return true;
}

std::string nothing_to_do_reason(const Options &opt)
{
    const bool analysis = opt.baseplot || opt.percentiles || opt.stability;
    if (!analysis && !opt.inspect) return "Nothing to do.";
    if (analysis && opt.plot_root.empty() && opt.dump_root.empty()) return "No output mode(s) provided.";
    return {};
}

MetricSelector make_interactive_selector(const SliceRepository &repo, std::istream &in, std::ostream &out)
{
    return [&repo, &in, &out](const std::vector<std::string> &tags)
    {
        if (tags.empty()) throw InvalidArgumentError("no metrics to choose from");
        out << format_metric_menu(repo, tags);
        out << "Please choose a metric index (0-" << tags.size() - 1 << "): " << std::flush;

        std::string line;
        if (!std::getline(in, line)) throw InvalidArgumentError("no metric index given");
        while (!line.empty() && (line.back() == ' ' || line.back() == '\r')) line.pop_back();
        size_t start = line.find_first_not_of(' ');
        if (start != std::string::npos) line.erase(0, start);

        size_t index = 0;
        if (!parse_number(line, index) || index >= tags.size())
        {
            throw InvalidArgumentError("invalid metric index \"" + line + "\"");
        }
        return tags[index];
    };
}

} // namespace hq
