#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace uncertain::core {

inline std::size_t bounded_thread_count(std::size_t requested) {
  const std::size_t hw = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  if (requested == 0) {
    return hw;
  }
  return std::min(requested, hw);
}

// Runs fn(begin, end) over contiguous blocks of [0, total_items). The block layout depends only on
// total_items and the thread count. The first exception thrown by a block is rethrown after every
// worker has joined.
template <typename Func>
void parallel_blocks(std::size_t total_items, std::size_t requested_threads, Func&& fn) {
  if (total_items == 0) {
    return;
  }

  const std::size_t thread_count = std::max<std::size_t>(
      1, std::min(bounded_thread_count(requested_threads), total_items));

  if (thread_count == 1) {
    fn(std::size_t{0}, total_items);
    return;
  }

  const std::size_t block = total_items / thread_count;
  const std::size_t remainder = total_items % thread_count;

  std::vector<std::exception_ptr> failures(thread_count);
  std::vector<std::thread> workers;
  workers.reserve(thread_count - 1);

  std::size_t begin = 0;
  for (std::size_t i = 0; i < thread_count; ++i) {
    const std::size_t length = block + (i < remainder ? 1 : 0);
    const std::size_t end = begin + length;

    auto run_block = [begin, end, i, &fn, &failures]() {
      try {
        fn(begin, end);
      } catch (...) {
        failures[i] = std::current_exception();
      }
    };

    if (i + 1 == thread_count) {
      run_block();
    } else {
      workers.emplace_back(run_block);
    }

    begin = end;
  }

  for (auto& worker : workers) {
    worker.join();
  }

  for (const auto& failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }
}

}  // namespace uncertain::core
