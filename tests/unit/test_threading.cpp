#include <doctest/doctest.h>

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "uncertain/core/threading.hpp"

TEST_CASE("parallel_blocks covers every index exactly once") {
  for (const std::size_t threads : {std::size_t{1}, std::size_t{2}, std::size_t{5}, std::size_t{0}}) {
    std::vector<int> hits(103, 0);
    uncertain::core::parallel_blocks(hits.size(), threads, [&](std::size_t begin, std::size_t end) {
      for (std::size_t i = begin; i < end; ++i) {
        ++hits[i];
      }
    });
    for (const int count : hits) {
      CHECK(count == 1);
    }
  }
}

TEST_CASE("parallel_blocks skips empty ranges") {
  std::atomic<int> calls{0};
  uncertain::core::parallel_blocks(0, 4, [&](std::size_t, std::size_t) { ++calls; });
  CHECK(calls.load() == 0);
}

TEST_CASE("parallel_blocks rethrows a block failure after joining") {
  CHECK_THROWS_AS(uncertain::core::parallel_blocks(64, 4,
                                                   [](std::size_t begin, std::size_t) {
                                                     if (begin == 0) {
                                                       throw std::runtime_error("block failed");
                                                     }
                                                   }),
                  std::runtime_error);
}
