#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "exchange/price_feed.h"
#include "risk/risk_ledger.h"

namespace hydra {

/// 单个平仓事件：已实现结果 + 账本状态跃迁。
struct ClosedPosition {
  Position position;
  RealizedOutcome outcome;
  CloseEffect ledger_effect;
};

/// 单周期生命周期处理结果。
struct LifecycleReport {
  std::vector<ClosedPosition> closed;
  std::vector<Position> unpriced;       ///< 本周期取价失败的持仓（仍保持开仓）。
  int trailing_adjustments{0};
};

/**
 * @brief 持仓生命周期管理器
 *
 * 职责：
 * 1. 成交回报开仓（以实际成交价重锚止损/止盈距离）；
 * 2. 每周期取价，执行止损 / 止盈 / 移动止损；
 * 3. 平仓时释放敞口并把已实现盈亏写回风控账本。
 *
 * 约束：持仓仅由本类修改；止损只会收紧不会放宽；
 * 取价失败不得平仓，只累计 unpriced_cycles 并告警。
 */
class PositionManager {
 public:
  explicit PositionManager(LifecycleConfig config = {}) : config_(config) {}

  /// 成交开仓；成交价/数量非法时返回 nullopt。
  std::optional<Position> OpenFromFill(const ApprovedOrder& order,
                                       const FillReport& fill,
                                       std::int64_t now_ms);

  /// 逐个持仓取价并处理退出。
  LifecycleReport OnCycle(const PriceFeed& feed, RiskLedger* ledger,
                          std::int64_t now_ms);

  /// 按给定价格检查单个持仓（测试与回放用）；命中退出时平仓。
  std::optional<ClosedPosition> OnPrice(const std::string& position_id,
                                        double price, RiskLedger* ledger,
                                        std::int64_t now_ms);

  /// 人工平仓。
  std::optional<ClosedPosition> ManualExit(const std::string& position_id,
                                           double price, RiskLedger* ledger,
                                           std::int64_t now_ms);

  std::vector<Position> OpenPositions() const;
  std::optional<Position> Find(const std::string& position_id) const;
  std::size_t open_count() const { return positions_.size(); }

  /**
   * @brief 推进移动止损
   *
   * 价格走完 entry->target 距离的 activation_fraction 后激活；
   * 激活后止损至少到保本，并以 best_price - distance_r * 初始风险 跟随。
   * @return 止损是否被收紧
   */
  static bool AdvanceTrailing(Position* position, double price,
                              const LifecycleConfig& config);

  /// 根据当前止损/止盈判断是否退出。
  static std::optional<ExitReason> CheckExit(const Position& position,
                                             double price);

  static double RealizedPnl(const Position& position, double exit_price);
  static double RMultiple(const Position& position, double pnl);

 private:
  ClosedPosition Close(const Position& position, double exit_price,
                       ExitReason reason, RiskLedger* ledger,
                       std::int64_t now_ms);

  LifecycleConfig config_;
  std::map<std::string, Position> positions_;  ///< position_id -> 持仓（有序，便于确定性遍历）。
  std::uint64_t position_seq_{0};
};

}  // namespace hydra
