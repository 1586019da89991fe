/* Option structs for the redistribution entry points. */
#pragma once

#include <cstdint>

namespace demonet::core {

struct DistributeOptions {
  // Worker threads for the initialise/calc_differences phases.
  // 0 means use the OpenMP default (omp_get_max_threads()).
  int num_threads { 0 };
  // Index ranges shorter than this run inline on the calling thread.
  std::int32_t parallel_threshold { 1024 };
};

} // namespace demonet::core
