/*
  Profiler: named-phase stopwatch around algorithmic stages.

  start(name) opens a phase and returns a PhaseHandle; stop() (or the handle's
  destructor) closes it. NullProfiler is a no-op usable wherever timing is not
  needed.
*/
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace demonet::core {

class Profiler;

// Move-only handle to an open phase.
class PhaseHandle {
public:
  PhaseHandle() noexcept = default;
  PhaseHandle(Profiler* owner, std::int64_t token) noexcept : owner_(owner), token_(token) {}
  PhaseHandle(const PhaseHandle&) = delete;
  PhaseHandle& operator=(const PhaseHandle&) = delete;
  PhaseHandle(PhaseHandle&& other) noexcept : owner_(other.owner_), token_(other.token_) {
    other.owner_ = nullptr;
  }
  PhaseHandle& operator=(PhaseHandle&& other) noexcept;
  ~PhaseHandle() noexcept { stop(); }

  // Idempotent.
  void stop() noexcept;
  [[nodiscard]] bool active() const noexcept { return owner_ != nullptr; }

private:
  Profiler* owner_ {nullptr};
  std::int64_t token_ {-1};
};

class Profiler {
public:
  virtual ~Profiler() noexcept = default;
  [[nodiscard]] virtual PhaseHandle start(std::string_view name) = 0;

protected:
  friend class PhaseHandle;
  virtual void stop_phase(std::int64_t token) noexcept = 0;
};

class NullProfiler final : public Profiler {
public:
  PhaseHandle start(std::string_view) override { return PhaseHandle{}; }

protected:
  void stop_phase(std::int64_t) noexcept override {}
};

// Process-wide no-op instance used as the default argument.
[[nodiscard]] Profiler& null_profiler() noexcept;

// TimingProfiler records wall-clock durations with steady_clock. Phases may
// nest: a new phase sits one level below the most recently started phase that
// is still open, whatever order earlier phases were stopped in. Handles opened
// before clear() no longer refer to any record.
class TimingProfiler final : public Profiler {
public:
  struct Record {
    std::string name;
    int depth {0};
    double duration_ms {0.0};
    bool finished {false};
  };

  PhaseHandle start(std::string_view name) override;

  // Records in start order.
  [[nodiscard]] const std::vector<Record>& records() const noexcept { return records_; }
  // Sum of finished durations recorded under name.
  [[nodiscard]] double total_ms(std::string_view name) const noexcept;
  // Indented report, one line per phase.
  [[nodiscard]] std::string to_string() const;

  void clear() noexcept;

protected:
  void stop_phase(std::int64_t token) noexcept override;

private:
  using Clock = std::chrono::steady_clock;
  std::vector<Record> records_;
  std::vector<Clock::time_point> started_;
  std::int64_t first_token_ {0};
};

} // namespace demonet::core
