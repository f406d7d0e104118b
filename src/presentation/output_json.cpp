#include "hq/output.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include "hq/json.hpp"
#include "hq/report.hpp"

namespace hq
{
static void write_field(std::ostringstream &os, const char *key, double v)
{
    os << ",\"" << key << "\":";
    write_json_number(os, v);
}

// min and max, both null when the range holds no sample.
static void write_range(std::ostringstream &os, bool valid, double lo, double hi)
{
    if (!valid)
    {
        os << R"(,"min":null,"max":null)";
        return;
    }
    write_field(os, "min", lo);
    write_field(os, "max", hi);
}

static void write_aggregation(std::ostringstream &os, const Aggregation &ag)
{
    os << R"({"count":)" << ag.count;
    write_field(os, "min", ag.min);
    write_field(os, "avg", ag.avg);
    write_field(os, "max", ag.max);
    os << R"(,"percentiles":{)";
    for (size_t i = 0; i < ag.percentiles.size(); ++i)
    {
        if (i) os << ',';
        os << json_quote(std::to_string(ag.percentiles[i].first)) << ':';
        write_json_number(os, ag.percentiles[i].second);
    }
    os << "}}";
}

static void write_slice(std::ostringstream &os, const SliceRow &s, int64_t t0)
{
    os << R"({"count":)" << s.count
       << R"(,"start_ms":)" << s.start_ms - t0
       << R"(,"end_ms":)" << s.end_ms - t0;
    write_range(os, s.count > 0, s.min, s.max);
    os << "}";
}

std::string build_inspect_json(const InspectReport &rep)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << R"({"file":)" << json_quote(rep.filename)
       << R"(,"unit":)" << json_quote(rep.unit_name)
       << R"(,"start":)" << json_quote(format_timestamp(rep.start_ms))
       << R"(,"end":)" << json_quote(format_timestamp(rep.end_ms));
    os << R"(,"start_ms":)" << rep.start_ms
       << R"(,"end_ms":)" << rep.end_ms
       << R"(,"interval_ms":)" << rep.end_ms - rep.start_ms;
    os << R"(,"tags":[)";
    for (size_t i = 0; i < rep.tags.size(); ++i)
    {
        const TagReport &t = rep.tags[i];
        if (i) os << ',';
        os << R"({"tag":)" << json_quote(t.tag)
           << R"(,"slices":)" << t.slices.size()
           << R"(,"nonempty_slices":)" << t.nonempty_slices
           << R"(,"values":)" << t.value_count;
        write_range(os, t.has_values, t.min, t.max);
        os << R"(,"start_ms":)" << t.start_ms - rep.start_ms
           << R"(,"end_ms":)" << t.end_ms - rep.start_ms;
        if (t.aggregation)
        {
            os << R"(,"aggregate":)";
            write_aggregation(os, *t.aggregation);
        }
        else
        {
            os << R"(,"aggregate":null,"aggregate_error":)" << json_quote(t.aggregation_error);
        }
        os << R"(,"slice_list":[)";
        for (size_t k = 0; k < t.slices.size(); ++k)
        {
            if (k) os << ',';
            write_slice(os, t.slices[k], rep.start_ms);
        }
        os << "]}";
    }
    os << "]}";
    return os.str();
}
} // namespace hq
