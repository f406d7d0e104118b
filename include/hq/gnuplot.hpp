#pragma once

#include <string>

namespace hq {

enum class GnuplotStatus { Ok, NotAvailable, Failed };

// Pipes script into a `gnuplot` child process and waits for it.
// SIGPIPE is ignored while writing.
GnuplotStatus run_gnuplot(const std::string& script);

} // namespace hq
