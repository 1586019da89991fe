/*
  Parallel orchestrator helpers: thread-count resolution and static chunking.
*/
#include "demonet/core/parallel.hpp"

#include <algorithm>

namespace demonet::core {

int resolve_num_threads(int requested) noexcept {
  if (requested > 0) return requested;
  return std::max(1, omp_get_max_threads());
}

std::vector<std::pair<std::int32_t, std::int32_t>>
static_chunks(std::int32_t n, int nthreads) {
  std::vector<std::pair<std::int32_t, std::int32_t>> out;
  if (n <= 0 || nthreads <= 0) return out;
  const auto workers = std::min<std::int32_t>(n, nthreads);
  const std::int32_t base = n / workers;
  const std::int32_t extra = n % workers;
  out.reserve(static_cast<std::size_t>(workers));
  std::int32_t begin = 1;
  for (std::int32_t w = 0; w < workers; ++w) {
    std::int32_t len = base + (w < extra ? 1 : 0);
    out.emplace_back(begin, begin + len);
    begin += len;
  }
  return out;
}

} // namespace demonet::core
