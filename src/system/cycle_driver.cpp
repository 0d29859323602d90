#include "system/cycle_driver.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include "core/log.h"

namespace hydra {

CycleDriver::CycleDriver(std::int64_t period_ms, ClockFn clock,
                         SleepUntilFn sleep_until)
    : period_ms_(std::max<std::int64_t>(1, period_ms)),
      clock_(std::move(clock)),
      sleep_until_(std::move(sleep_until)) {}

std::int64_t CycleDriver::NextTickAfter(std::int64_t start_ms,
                                        std::int64_t period_ms,
                                        std::int64_t now_ms) {
  if (period_ms <= 0) {
    return now_ms + 1;
  }
  if (now_ms < start_ms) {
    return start_ms;
  }
  const std::int64_t elapsed_ticks = (now_ms - start_ms) / period_ms;
  return start_ms + (elapsed_ticks + 1) * period_ms;
}

std::int64_t CycleDriver::Run(const TickFn& tick, std::int64_t max_cycles,
                              const std::atomic<bool>* stop) {
  const std::int64_t start_ms = clock_();
  std::int64_t next_tick_ms = start_ms;
  std::int64_t cycles = 0;
  while (stop == nullptr || !stop->load()) {
    if (!sleep_until_(next_tick_ms)) {
      break;
    }
    tick(clock_());
    ++cycles;
    if (max_cycles > 0 && cycles >= max_cycles) {
      break;
    }
    const std::int64_t after_ms = clock_();
    const std::int64_t following =
        NextTickAfter(start_ms, period_ms_, std::max(after_ms, next_tick_ms));
    const std::int64_t missed = (following - next_tick_ms) / period_ms_ - 1;
    if (missed > 0) {
      skipped_ticks_ += missed;
      LogError("CYCLE_OVERRUN: skipped_ticks=" + std::to_string(missed) +
               ", elapsed_ms=" + std::to_string(after_ms - next_tick_ms));
    }
    next_tick_ms = following;
  }
  return cycles;
}

CycleDriver::SleepUntilFn WallClockSleeper(const std::atomic<bool>* stop) {
  return [stop](std::int64_t until_ms) {
    while (true) {
      if (stop != nullptr && stop->load()) {
        return false;
      }
      const std::int64_t remaining = until_ms - SystemClockMs();
      if (remaining <= 0) {
        return true;
      }
      std::this_thread::sleep_for(
          std::chrono::milliseconds(std::min<std::int64_t>(remaining, 100)));
    }
  };
}

}  // namespace hydra
