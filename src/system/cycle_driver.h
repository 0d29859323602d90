#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

#include "core/clock.h"

namespace hydra {

/**
 * @brief 固定周期驱动器
 *
 * 以 start + k * period 为节拍调用 tick；周期超时错过的节拍直接跳过，
 * 不排队补跑。时钟与等待函数可注入：实盘为墙钟 + sleep，回放为虚拟时钟。
 */
class CycleDriver {
 public:
  using TickFn = std::function<void(std::int64_t now_ms)>;
  /// 等待到指定时刻；返回 false 表示被中断。
  using SleepUntilFn = std::function<bool(std::int64_t until_ms)>;

  CycleDriver(std::int64_t period_ms, ClockFn clock, SleepUntilFn sleep_until);

  /**
   * @brief 运行直到达到 max_cycles（0 表示不限）或 stop 置位
   * @return 实际执行的周期数
   */
  std::int64_t Run(const TickFn& tick, std::int64_t max_cycles,
                   const std::atomic<bool>* stop);

  std::int64_t skipped_ticks() const { return skipped_ticks_; }

  /// 严格晚于 now 的下一个节拍时刻。
  static std::int64_t NextTickAfter(std::int64_t start_ms, std::int64_t period_ms,
                                    std::int64_t now_ms);

 private:
  std::int64_t period_ms_;
  ClockFn clock_;
  SleepUntilFn sleep_until_;
  std::int64_t skipped_ticks_{0};
};

/// 墙钟等待：分片 sleep，stop 置位时提前返回 false。
CycleDriver::SleepUntilFn WallClockSleeper(const std::atomic<bool>* stop);

}  // namespace hydra
