/*
  Profiler implementations: the shared NullProfiler and TimingProfiler.
*/
#include "demonet/core/profiler.hpp"

#include <cstdio>
#include <utility>

namespace demonet::core {

PhaseHandle& PhaseHandle::operator=(PhaseHandle&& other) noexcept {
  if (this != &other) {
    stop();
    owner_ = other.owner_;
    token_ = other.token_;
    other.owner_ = nullptr;
  }
  return *this;
}

void PhaseHandle::stop() noexcept {
  if (owner_ == nullptr) return;
  owner_->stop_phase(token_);
  owner_ = nullptr;
}

Profiler& null_profiler() noexcept {
  static NullProfiler instance;
  return instance;
}

PhaseHandle TimingProfiler::start(std::string_view name) {
  Record r;
  r.name = std::string(name);
  for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
    if (!it->finished) {
      r.depth = it->depth + 1;
      break;
    }
  }
  records_.push_back(std::move(r));
  started_.push_back(Clock::now());
  return PhaseHandle(this, first_token_ + static_cast<std::int64_t>(records_.size() - 1));
}

void TimingProfiler::stop_phase(std::int64_t token) noexcept {
  if (token < first_token_) return;
  auto idx = static_cast<std::size_t>(token - first_token_);
  if (idx >= records_.size() || records_[idx].finished) return;
  auto elapsed = Clock::now() - started_[idx];
  records_[idx].duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();
  records_[idx].finished = true;
}

double TimingProfiler::total_ms(std::string_view name) const noexcept {
  double total = 0.0;
  for (auto const& r : records_) {
    if (r.finished && r.name == name) total += r.duration_ms;
  }
  return total;
}

std::string TimingProfiler::to_string() const {
  std::string out;
  char buf[64];
  for (auto const& r : records_) {
    out.append(static_cast<std::size_t>(r.depth) * 2, ' ');
    out += r.name;
    if (r.finished) {
      std::snprintf(buf, sizeof(buf), ": %.3f ms\n", r.duration_ms);
      out += buf;
    } else {
      out += ": (running)\n";
    }
  }
  return out;
}

void TimingProfiler::clear() noexcept {
  first_token_ += static_cast<std::int64_t>(records_.size());
  records_.clear();
  started_.clear();
}

} // namespace demonet::core
