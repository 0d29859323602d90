#pragma once

#include <cstdint>
#include <optional>

#include "core/config.h"
#include "core/types.h"
#include "risk/risk_ledger.h"

namespace hydra {

/**
 * @brief 风控管理器 (Risk Manager)
 *
 * 系统的"最高法庭"：每个提案在账本独占区内依次经过
 * 跨日复位 -> halt -> 日内熔断 -> 冷却 -> 日交易上限 -> 提案合法性
 * -> half-Kelly 定量 -> 单仓/单资产/总敞口裁剪 -> 入账与不变量复核。
 *
 * 限额不可被任何策略覆盖；不变量破坏时回滚本次入账并锁死账本。
 */
class RiskManager {
 public:
  RiskManager() = default;

  /**
   * @brief 评估单个提案
   *
   * @param proposal 排序后的候选交易
   * @param ledger 风控账本（批准时已预占敞口并计入当日交易次数）
   * @param now_ms 当前时间
   * @param asset_volatility 资产日度波动率（小数），缺失时使用默认值
   */
  RiskDecision Evaluate(const TradeProposal& proposal, RiskLedger* ledger,
                        std::int64_t now_ms,
                        std::optional<double> asset_volatility = std::nullopt) const;

  /// 胜率映射：p = base + slope * confidence。
  static double WinProbability(const RiskLimits& limits, double confidence);
  /// Kelly 比例（未乘 multiplier，可为负）。
  static double KellyFraction(double reward_to_risk, double win_probability);
  /// 波动率缩放：clamp(1 - slope * vol, min_vol_scalar, 1)。
  static double VolatilityScalar(const RiskLimits& limits, double daily_volatility);
  /// 提案合法性（有限值、价格方向、盈亏比）。
  static bool ValidateProposal(const TradeProposal& proposal, std::string* out_error);
};

}  // namespace hydra
