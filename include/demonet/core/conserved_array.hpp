/* ConservedView: borrowed 1-indexed view over a per-entity array. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "demonet/core/types.hpp"

namespace demonet::core {

// Per-entity storage: length N+1, slot 0 is an unused sentinel.
using ConservedArray = std::vector<Count>;

// ConservedView wraps the full N+1 buffer of a ConservedArray (or the ifrom/ito
// id arrays) owned by Nodes/Links. It never owns, resizes or frees storage and
// is only valid while the owning collection is alive.
//
// size() is the number of real entities N. operator[] is unchecked and
// accepts 0..N; at() checks 1..N and throws std::out_of_range.
template <typename T>
class ConservedView {
public:
  ConservedView() noexcept = default;
  explicit ConservedView(std::span<T> buffer) noexcept : buf_(buffer) {}

  [[nodiscard]] std::int32_t size() const noexcept {
    return buf_.empty() ? 0 : static_cast<std::int32_t>(buf_.size() - 1);
  }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  T& operator[](std::int32_t i) const noexcept { return buf_[static_cast<std::size_t>(i)]; }

  T& at(std::int32_t i) const {
    if (i < 1 || i > size()) {
      throw std::out_of_range("ConservedView::at: index " + std::to_string(i) +
                              " outside [1, " + std::to_string(size()) + "]");
    }
    return buf_[static_cast<std::size_t>(i)];
  }

  // Raw buffer including the sentinel slot.
  [[nodiscard]] T* data() const noexcept { return buf_.data(); }
  [[nodiscard]] std::span<T> span() const noexcept { return buf_; }
  // Populated entries only (ids 1..N).
  [[nodiscard]] std::span<T> values() const noexcept {
    return buf_.empty() ? buf_ : buf_.subspan(1);
  }

private:
  std::span<T> buf_ {};
};

} // namespace demonet::core
