#include "hq/concurrency.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace hq {

namespace {

// Launches [first, first + count) as threads and joins them all.
template <typename Fn>
void run_batch(int first, int count, Fn&& fn)
{
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (int i = 0; i < count; ++i)
    {
        const int index = first + i;
        threads.emplace_back([&fn, index] { fn(index); });
    }
    for (auto& th : threads)
    {
        if (th.joinable()) th.join();
    }
}

} // namespace

void for_each_index_batched_cancelable(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel)
{
    if (total <= 0) return;

    Cancellation local;
    Cancellation& token = cancel ? *cancel : local;

    std::mutex ex_mtx;
    std::exception_ptr first_ex;

    auto guarded = [&](int idx)
    {
        if (token.is_cancelled()) return;
        try
        {
            fn(idx, token.flag());
        }
        catch (...)
        {
            {
                std::scoped_lock lk(ex_mtx);
                if (!first_ex) first_ex = std::current_exception();
            }
            token.cancel();
        }
    };

    if (concurrency <= 1)
    {
        for (int i = 1; i <= total && !token.is_cancelled(); ++i) guarded(i);
    }
    else
    {
        for (int next = 1; next <= total && !token.is_cancelled();)
        {
            const int batch = std::min(concurrency, total - next + 1);
            run_batch(next, batch, guarded);
            next += batch;
        }
    }

    if (first_ex) std::rethrow_exception(first_ex);
}

} // namespace hq
