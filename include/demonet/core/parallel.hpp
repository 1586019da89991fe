/* Static fork-join helpers for the per-index reduction phases. */
#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include <omp.h>

namespace demonet::core {

// Thread count to use: requested if > 0, otherwise omp_get_max_threads().
[[nodiscard]] int resolve_num_threads(int requested) noexcept;

// Contiguous [begin, end) ranges covering ids 1..n, one per worker. Chunk
// sizes differ by at most one and earlier chunks are the larger ones. Workers
// beyond n receive no chunk.
[[nodiscard]] std::vector<std::pair<std::int32_t, std::int32_t>>
static_chunks(std::int32_t n, int nthreads);

// Run fn(i) for every id i in [1, n]. Ids are split by static_chunks and each
// chunk is walked by exactly one worker; fn must only touch per-id state. Runs
// inline when nthreads <= 1 or n < threshold.
template <typename Fn>
void parallel_for_static(std::int32_t n, int nthreads, std::int32_t threshold, Fn&& fn) {
  if (n <= 0) return;
  if (nthreads <= 1 || n < threshold) {
    for (std::int32_t i = 1; i <= n; ++i) fn(i);
    return;
  }
  const auto chunks = static_chunks(n, nthreads);
  const int nchunks = static_cast<int>(chunks.size());
#pragma omp parallel num_threads(nchunks)
  {
    // The runtime may grant fewer threads than requested.
    const int team = omp_get_num_threads();
    for (int c = omp_get_thread_num(); c < nchunks; c += team) {
      const auto [begin, end] = chunks[static_cast<std::size_t>(c)];
      for (std::int32_t i = begin; i < end; ++i) fn(i);
    }
  }
}

} // namespace demonet::core
