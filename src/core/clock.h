#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace hydra {

/// 毫秒时钟（可注入：实盘用墙钟，回放用虚拟时钟）。
using ClockFn = std::function<std::int64_t()>;

/// 系统墙钟毫秒。
inline std::int64_t SystemClockMs() {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  return now.time_since_epoch().count();
}

}  // namespace hydra
