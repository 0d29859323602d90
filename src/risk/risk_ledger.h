#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "core/config.h"

namespace hydra {

/// 组合级风控状态：仅能通过 RiskLedger 修改。
struct RiskState {
  double capital{0.0};                 ///< 初始资金 + 累计已实现盈亏。
  double equity_high_water_mark{0.0};
  double daily_realized_pnl{0.0};
  double daily_start_capital{0.0};     ///< 交易日开始时的资金，日内熔断以此为基数。
  std::map<std::string, double> open_exposure_by_asset;
  double open_exposure_total{0.0};
  int consecutive_losses{0};
  std::int64_t cooldown_until_ms{0};
  int trades_today{0};
  std::int64_t trading_day{-1};        ///< 交易日序号（UTC 偏移后按日取整）。
  bool kill_switch_tripped{false};     ///< 当日锁存，跨日复位。
  bool halted{false};                  ///< 不变量破坏后锁死，仅人工恢复。
  std::string halt_reason;
};

/// 平仓入账后触发的状态跃迁（用于通知）。
struct CloseEffect {
  bool kill_switch_tripped_now{false};
  bool cooldown_armed_now{false};
};

/**
 * @brief 风控账本（可注入对象）
 *
 * 所有读写在同一把互斥量下完成；风控逐个提案加锁评估，
 * 执行层失败回滚与平仓入账也走同一把锁。
 */
class RiskLedger {
 public:
  explicit RiskLedger(RiskLimits limits);

  const RiskLimits& limits() const { return limits_; }

  /// 在独占区内执行 fn(RiskState&)，返回其结果。
  template <typename Fn>
  auto Exclusive(Fn&& fn) -> decltype(fn(std::declval<RiskState&>())) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn(state_);
  }

  RiskState Snapshot() const;

  /// 直接替换状态（运维恢复用，调用方负责一致性）。
  void RestoreState(const RiskState& state);

  /// 成交失败/超时：释放预占敞口。
  void ReleaseExposure(const std::string& asset, double notional);

  /// 平仓：释放敞口、记录已实现盈亏、更新连亏与日内熔断锁存。
  CloseEffect ApplyClose(const std::string& asset, double notional, double pnl,
                         std::int64_t now_ms);

  /// 人工解除 halt；返回是否确有解除。
  bool ResumeAfterHalt(const std::string& operator_note);

  /// 跨日复位（日内盈亏、交易次数、熔断锁存）；无锁，调用方需已持锁。
  void RollTradingDayLocked(RiskState* state, std::int64_t now_ms) const;

  std::int64_t TradingDayOf(std::int64_t now_ms) const;

  /// 日内亏损上限（正数）；日初资金缺失时退回当前资金。
  static double DailyLossLimit(const RiskState& state, const RiskLimits& limits);

  /// 账本一致性：敞口非负且有限、分资产之和等于总量。
  static bool CheckInvariants(const RiskState& state, std::string* out_error);

  /// 指定资产与总敞口不超过按当前资金计算的上限。
  static bool CheckCaps(const RiskState& state, const RiskLimits& limits,
                        const std::string& asset, std::string* out_error);

 private:
  static void SubtractExposure(RiskState* state, const std::string& asset,
                               double notional);

  RiskLimits limits_;
  mutable std::mutex mutex_;
  RiskState state_{};
};

}  // namespace hydra
