#pragma once
#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace runway {

// requested=0 时取 hardware_concurrency；不会超过工作项个数，至少 1
inline unsigned ResolveWorkerCount(unsigned requested, std::size_t work_items) {
  unsigned n = requested;
  if (n == 0) n = std::max(1u, std::thread::hardware_concurrency());
  if (work_items < n) n = static_cast<unsigned>(std::max<std::size_t>(work_items, 1));
  return n;
}

// 把 [0, n) 切成连续块分给 workers 个线程：fn(begin, end, worker_index)。
// 各块写互不相交的输出槽，不需要加锁。
// worker 中抛出的异常在 join 之后重新抛出（取第一个）。
template <class Fn>
void ParallelFor(std::size_t n, unsigned workers, Fn&& fn) {
  if (n == 0) return;
  workers = ResolveWorkerCount(workers, n);
  if (workers <= 1) {
    fn(std::size_t{0}, n, 0u);
    return;
  }

  std::vector<std::exception_ptr> errors(workers);
  std::vector<std::thread> threads;
  threads.reserve(workers);

  const std::size_t chunk = (n + workers - 1) / workers;
  for (unsigned w = 0; w < workers; ++w) {
    const std::size_t begin = std::min(n, w * chunk);
    const std::size_t end = std::min(n, begin + chunk);
    threads.emplace_back([&, begin, end, w]() {
      try {
        if (begin < end) fn(begin, end, w);
      } catch (...) {
        errors[w] = std::current_exception();
      }
    });
  }
  for (auto& t : threads) t.join();

  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
}

} // namespace runway
