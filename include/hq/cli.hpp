#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "hq/options.hpp"
#include "hq/repository.hpp"
#include "hq/usecases.hpp"

namespace hq {

void print_usage(const char* prog, std::ostream& os);

// False when the program should stop: help was requested (opt.help set,
// usage printed) or the arguments are invalid (message printed).
bool parse_args(int argc, char** argv, Options& opt);

// Empty when opt asks for some work, otherwise the reason it does not.
std::string nothing_to_do_reason(const Options& opt);

// Prints the metric menu to out and reads the chosen index from in.
// Non-numeric or out-of-range input raises InvalidArgumentError.
MetricSelector make_interactive_selector(const SliceRepository& repo, std::istream& in, std::ostream& out);

} // namespace hq
