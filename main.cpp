// HDR histogram log analyzer (C++23)

#include <iostream>
#include <string>

#include "hq/cli.hpp"
#include "hq/errors.hpp"
#include "hq/options.hpp"
#include "hq/output.hpp"
#include "hq/report.hpp"
#include "hq/repository.hpp"
#include "hq/units.hpp"
#include "hq/usecases.hpp"

using namespace hq;

static void emit_outputs(const AnalysisResult &res, const Options &opt, const UnitConverter &units)
{
    for (const auto &plot : res.plots)
    {
        std::cout << "  * Output for \"" << plot_kind_str(plot.kind) << "\": \n";
        if (!opt.plot_root.empty())
        {
            const std::string file = output_file_name(opt.plot_root, plot.kind, "png");
            if (!can_create_file(file, opt.force))
            {
                std::cout << "      *SKIPPING*: " << file << '\n';
            }
            else if (write_figure(plot, res.metric, file, units.unit_name()))
            {
                std::cout << "      " << file << '\n';
            }
            else
            {
                std::cout << "      *FAILED*: " << file << '\n';
            }
        }
        if (!opt.dump_root.empty())
        {
            const std::string file = output_file_name(opt.dump_root, plot.kind, "dat");
            if (!can_create_file(file, opt.force))
            {
                std::cout << "      *SKIPPING*: " << file << '\n';
            }
            else if (write_datafile(plot, file))
            {
                std::cout << "      " << file << '\n';
            }
            else
            {
                std::cout << "      *FAILED*: " << file << '\n';
            }
        }
    }
}

int main(int argc, char **argv)
{
    Options opt;
    if (!parse_args(argc, argv, opt)) return opt.help ? 0 : 1;

    const std::string reason = nothing_to_do_reason(opt);
    if (!reason.empty())
    {
        std::cerr << "*WARNING*: " << reason << "\n\n";
        print_usage(argv[0], std::cout);
        return 0;
    }

    try
    {
        const UnitConverter units(opt.raw);
        const SliceRepository repo = SliceRepository::load(opt.filename);
        if (repo.empty())
        {
            std::cerr << "error: no interval histograms in \"" << opt.filename << "\"\n";
            return 1;
        }

        if (opt.inspect)
        {
            const InspectReport rep = build_inspect_report(repo, opt.filename, units, opt.concurrency);
            if (opt.json) std::cout << build_inspect_json(rep) << '\n';
            else std::cout << format_inspect_text(rep);
        }

        if (!(opt.baseplot || opt.percentiles || opt.stability)) return 0;

        const std::string metric =
            resolve_metric(repo, opt.metric, make_interactive_selector(repo, std::cin, std::cout));

        const AnalysisResult res = run_analysis(
            repo, metric, make_analysis_request(opt),
            [](PlotKind kind, bool done) { std::cout << format_progress_text(kind, done) << std::flush; });

        for (const auto &w : res.warnings) std::cerr << "*WARNING*: " << w << '\n';

        emit_outputs(res, opt, units);
    }
    catch (const Error &e)
    {
        std::cout << std::flush;
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
