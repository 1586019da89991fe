/*
  RandomGenerator: PCG32 (XSH-RR) with bounded draws and state round-trip.
*/
#include "demonet/core/random.hpp"
#include "demonet/core/error.hpp"

#include <string>

namespace demonet::core {

RandomGenerator::RandomGenerator(std::uint64_t seed, std::uint64_t stream) noexcept {
  state_ = 0U;
  inc_ = (stream << 1u) | 1u;
  next();
  state_ += seed;
  next();
}

RandomGenerator RandomGenerator::from_state(const State& s) {
  if ((s[1] & 1u) == 0u) {
    throw InvalidArgument("RandomGenerator::from_state: increment must be odd");
  }
  RandomGenerator g;
  g.state_ = s[0];
  g.inc_ = s[1];
  return g;
}

std::uint32_t RandomGenerator::next() noexcept {
  std::uint64_t oldstate = state_;
  state_ = oldstate * 6364136223846793005ULL + inc_;
  auto xorshifted = static_cast<std::uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
  auto rot = static_cast<std::uint32_t>(oldstate >> 59u);
  return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

std::int32_t RandomGenerator::uniform_int(std::int32_t n) {
  if (n < 1) {
    throw InvalidArgument("uniform_int: n must be >= 1 (got " + std::to_string(n) + ")");
  }
  // Reject the low values that would bias a plain modulo.
  const auto bound = static_cast<std::uint32_t>(n);
  const std::uint32_t threshold = (0u - bound) % bound;
  for (;;) {
    std::uint32_t r = next();
    if (r >= threshold) return static_cast<std::int32_t>(r % bound);
  }
}

std::vector<RandomGenerator> make_thread_generators(RandomGenerator& rng, int nthreads) {
  if (nthreads < 1) {
    throw InvalidArgument("make_thread_generators: nthreads must be >= 1");
  }
  std::vector<std::uint64_t> seeds;
  seeds.reserve(static_cast<std::size_t>(nthreads));
  for (int i = 1; i < nthreads; ++i) {
    std::uint64_t hi = rng.next();
    std::uint64_t lo = rng.next();
    seeds.push_back((hi << 32u) | lo);
  }
  std::vector<RandomGenerator> out;
  out.reserve(static_cast<std::size_t>(nthreads));
  out.push_back(rng);
  for (int i = 1; i < nthreads; ++i) {
    out.emplace_back(seeds[static_cast<std::size_t>(i - 1)],
                     RandomGenerator::kDefaultStream + static_cast<std::uint64_t>(i));
  }
  return out;
}

} // namespace demonet::core
