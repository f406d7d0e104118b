#pragma once

#include <atomic>
#include <functional>

namespace hq {

class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Runs fn(index, flag) for index = 1..total, at most `concurrency` at a time
// (sequentially when concurrency <= 1). The first exception thrown by fn
// cancels the remaining batches and is rethrown once the running tasks joined.
void for_each_index_batched_cancelable(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel = nullptr);

} // namespace hq
