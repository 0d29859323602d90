#pragma once

#include <cstdint>
#include <string>

namespace hydra {

/// 单一来源对单一资产的打分观测。
struct Signal {
  std::string source_id;              ///< 来源标识（如 funding_rate）。
  std::string asset{"BTCUSDT"};
  std::string name;                   ///< 人类可读标签，仅用于日志展示。
  double direction{0.0};              ///< [-1, 1]，-1 看空，+1 看多。
  double strength{0.0};               ///< [0, 1]。
  double reliability_weight{0.5};     ///< (0, 1]，由来源适配器标注。
  std::int64_t timestamp_ms{0};
  std::int64_t half_life_ms{3600000};  ///< 半衰期（毫秒）。
};

/// 单资产聚合结果：每个周期重算，不跨周期保存。
struct AggregatedScore {
  std::string asset;
  double net_direction{0.0};          ///< [-1, 1]
  double confidence{0.0};             ///< [0, 1]
  int contributing_signal_count{0};
  double total_effective_weight{0.0};
  std::string dominant_source_id{"none"};
};

/// 市场状态：六个有效态 + UNKNOWN（初始/观察态）。
enum class Regime {
  kUnknown,
  kTrendingUp,
  kTrendingDown,
  kMeanReverting,
  kHighVolExpansion,
  kCrash,
  kRecovery,
};

/// Regime 判定特征向量。
struct RegimeFeatures {
  double volatility_level{0.0};       ///< 年化波动率（百分数口径，35 = 35%）。
  double volatility_term_slope{0.0};  ///< 远端减近端；<0 表示 backwardation。
  double trend_strength{0.0};         ///< [-1, 1]
  double mean_reversion_score{0.5};   ///< [0, 1]，越大越均值回归。
  int sample_count{0};                ///< 参与计算的 bar 数。
};

/// Regime 运行态快照（每周期覆盖，仅保留上一态用于 CRASH->RECOVERY）。
struct RegimeState {
  Regime regime{Regime::kUnknown};
  double confidence{0.0};
  RegimeFeatures features{};
  Regime previous_regime{Regime::kUnknown};
  std::int64_t classified_at_ms{0};
};

/// K 线（价格源边界输入）。
struct OhlcBar {
  std::int64_t ts_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

/// 策略候选交易：由风控恰好消费一次。
struct TradeProposal {
  std::string strategy_id;
  std::string asset;
  int direction{0};                   ///< +1 做多，-1 做空。
  double entry{0.0};
  double stop{0.0};
  double target{0.0};
  double confidence{0.0};
  double reward_to_risk{0.0};         ///< |target-entry| / |entry-stop|
  double requested_notional{0.0};     ///< <=0 表示不设上限，由风控定量。
  bool trailing_enabled{false};
  std::string rationale;
};

/// 风控拒绝原因（限额类为预期事件，不升级）。
enum class RejectReason {
  kNone,
  kKillSwitch,
  kExposureLimit,
  kCooldown,
  kDailyTradeCap,
  kInvalidProposal,
  kSizeTooSmall,
  kHalted,
};

/// 风控判定：Approved{sized_notional} | Rejected{reason}。
struct RiskDecision {
  bool approved{false};
  double sized_notional{0.0};
  RejectReason reason{RejectReason::kNone};
  std::string detail;
  bool clamped{false};                ///< 是否被仓位/资产/总敞口限额裁剪。
  double kelly_fraction{0.0};         ///< half-Kelly 系数（审计用）。
  double vol_scalar{1.0};
};

/// 已批准待执行订单（交给外部 Executor）。
struct ApprovedOrder {
  std::string order_id;
  TradeProposal proposal;
  double sized_notional{0.0};
  std::int64_t approved_at_ms{0};
};

/// Executor 回报：fill 或 rejected，二者之外视为未完成。
struct FillReport {
  std::string order_id;
  bool filled{false};
  double fill_price{0.0};
  double filled_notional{0.0};
  std::string error;
};

/// 移动止损运行态。
struct TrailingState {
  bool enabled{false};
  bool activated{false};
  double best_price{0.0};             ///< 持仓期间最有利价格。
};

/// 持仓：仅由 PositionManager 修改。
struct Position {
  std::string position_id;
  std::string asset;
  int direction{0};
  double entry_price{0.0};
  double stop{0.0};
  double initial_stop{0.0};
  double target{0.0};
  TrailingState trailing{};
  double notional{0.0};
  double quantity{0.0};
  std::int64_t opened_at_ms{0};
  std::string owning_strategy_id;
  int unpriced_cycles{0};             ///< 连续取价失败周期数（告警用）。
};

/// 平仓原因。
enum class ExitReason {
  kStop,
  kTrailingStop,
  kTarget,
  kManual,
};

/// 已实现结果：回灌策略权重。
struct RealizedOutcome {
  std::string position_id;
  std::string strategy_id;
  std::string asset;
  double exit_price{0.0};
  double pnl{0.0};
  double r_multiple{0.0};
  bool win{false};
  ExitReason exit_reason{ExitReason::kManual};
  std::int64_t closed_at_ms{0};
};

/// 策略权重：[0.3, 2.0]，由已实现结果周期性更新。
struct StrategyWeight {
  std::string strategy_id;
  double weight{1.0};
  double trailing_win_rate{0.0};
  int sample_count{0};
};

/// Regime 文本化（用于日志与快照）。
inline const char* ToString(Regime regime) {
  switch (regime) {
    case Regime::kUnknown:
      return "UNKNOWN";
    case Regime::kTrendingUp:
      return "TRENDING_UP";
    case Regime::kTrendingDown:
      return "TRENDING_DOWN";
    case Regime::kMeanReverting:
      return "MEAN_REVERTING";
    case Regime::kHighVolExpansion:
      return "HIGH_VOL_EXPANSION";
    case Regime::kCrash:
      return "CRASH";
    case Regime::kRecovery:
      return "RECOVERY";
  }
  return "UNKNOWN";
}

/// RejectReason 文本化。
inline const char* ToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return "NONE";
    case RejectReason::kKillSwitch:
      return "KILL_SWITCH";
    case RejectReason::kExposureLimit:
      return "EXPOSURE_LIMIT";
    case RejectReason::kCooldown:
      return "COOLDOWN";
    case RejectReason::kDailyTradeCap:
      return "DAILY_TRADE_CAP";
    case RejectReason::kInvalidProposal:
      return "INVALID_PROPOSAL";
    case RejectReason::kSizeTooSmall:
      return "SIZE_TOO_SMALL";
    case RejectReason::kHalted:
      return "HALTED";
  }
  return "UNKNOWN";
}

/// ExitReason 文本化。
inline const char* ToString(ExitReason reason) {
  switch (reason) {
    case ExitReason::kStop:
      return "STOP";
    case ExitReason::kTrailingStop:
      return "TRAILING_STOP";
    case ExitReason::kTarget:
      return "TARGET";
    case ExitReason::kManual:
      return "MANUAL";
  }
  return "UNKNOWN";
}

}  // namespace hydra
