#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hq/aggregate.hpp"
#include "hq/repository.hpp"

namespace hq {

inline const std::vector<int> kReportPercentiles{50, 90, 99};

struct SliceRow {
    int64_t count{};
    int64_t start_ms{};   // absolute
    int64_t end_ms{};
    double  min{};        // valid if count > 0
    double  max{};
};

struct TagReport {
    std::string tag;
    int64_t     value_count{};
    int64_t     nonempty_slices{};
    bool        has_values{};
    double      min{};        // valid if has_values
    double      max{};
    int64_t     start_ms{};
    int64_t     end_ms{};
    std::vector<SliceRow> slices;
    std::optional<Aggregation> aggregation;
    std::string aggregation_error;   // valid if !aggregation
};

struct InspectReport {
    std::string filename;
    std::string unit_name;
    int64_t     start_ms{};
    int64_t     end_ms{};
    std::vector<TagReport> tags;   // sorted by tag
};

// Breakdown of every tag of a non-empty repository. Per-tag aggregation runs
// `concurrency` tags at a time; a tag without samples gets an error entry.
InspectReport build_inspect_report(const SliceRepository& repo,
                                   const std::string& filename,
                                   const UnitConverter& units,
                                   int concurrency);

} // namespace hq
