#include "hq/gnuplot.hpp"

#include <csignal>
#include <cstdio>

#include <sys/wait.h>

namespace hq {

namespace {

class SigpipeIgnored {
public:
    SigpipeIgnored()
    {
        struct sigaction ignore{};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        active_ = sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }
    ~SigpipeIgnored()
    {
        if (active_) sigaction(SIGPIPE, &previous_, nullptr);
    }
    SigpipeIgnored(const SigpipeIgnored&) = delete;
    SigpipeIgnored& operator=(const SigpipeIgnored&) = delete;

private:
    struct sigaction previous_{};
    bool active_ = false;
};

} // namespace

GnuplotStatus run_gnuplot(const std::string& script)
{
    SigpipeIgnored guard;

    FILE* pipe = popen("gnuplot", "w");
    if (!pipe) return GnuplotStatus::NotAvailable;

    const size_t written = std::fwrite(script.data(), 1, script.size(), pipe);
    const int status = pclose(pipe);
    if (status == -1) return GnuplotStatus::Failed;
    // 127: the shell could not find the command
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) return GnuplotStatus::NotAvailable;
    if (written != script.size()) return GnuplotStatus::Failed;
    return WIFEXITED(status) && WEXITSTATUS(status) == 0 ? GnuplotStatus::Ok : GnuplotStatus::Failed;
}

} // namespace hq
