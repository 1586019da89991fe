/* RandomGenerator: PCG32 stream used by the remainder repair phase. */
#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace demonet::core {

// PCG-XSH-RR 32-bit generator with 64-bit state and a selectable stream.
// Stateful and not thread-safe: each worker owns its own instance.
class RandomGenerator {
public:
  // Opaque integer-array encoding: {state, increment}.
  using State = std::array<std::uint64_t, 2>;

  static constexpr std::uint64_t kDefaultStream = 0xda3e39cb94b95bdbULL;

  explicit RandomGenerator(std::uint64_t seed, std::uint64_t stream = kDefaultStream) noexcept;

  // Rebuild a generator from state(). Throws InvalidArgument if the increment is even.
  [[nodiscard]] static RandomGenerator from_state(const State& s);
  [[nodiscard]] State state() const noexcept { return {state_, inc_}; }

  std::uint32_t next() noexcept;
  // Uniform integer in [0, n). Requires n >= 1.
  std::int32_t uniform_int(std::int32_t n);

  friend bool operator==(const RandomGenerator& a, const RandomGenerator& b) noexcept {
    return a.state_ == b.state_ && a.inc_ == b.inc_;
  }

private:
  RandomGenerator() noexcept = default;
  std::uint64_t state_ {0};
  std::uint64_t inc_ {1};  // must be odd
};

// One generator per worker thread. Seeds for workers 1..n-1 are drawn from rng
// (which advances); worker 0 continues rng's stream from the post-draw state.
[[nodiscard]] std::vector<RandomGenerator> make_thread_generators(RandomGenerator& rng, int nthreads);

} // namespace demonet::core
