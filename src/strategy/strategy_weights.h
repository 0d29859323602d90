#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace hydra {

/// 单次权重更新动作（审计日志用）。
struct WeightUpdateAction {
  std::string strategy_id;
  double weight_before{1.0};
  double weight_after{1.0};
  double win_rate{0.0};
  int sample_count{0};
};

/**
 * @brief 策略权重簿
 *
 * 记录每个策略最近 `window` 笔已实现结果；每隔 `update_interval_cycles`
 * 个周期按 `clamp(multiplier * win_rate, min, max)` 重算权重。
 * 样本不足 `min_outcomes` 的策略保持 1.0。
 *
 * 非职责：不做任何模型拟合，仅是胜率的受限线性映射。
 */
class StrategyWeightBook {
 public:
  explicit StrategyWeightBook(WeightConfig config = {}) : config_(config) {}

  void RecordOutcome(const RealizedOutcome& outcome);

  /// 周期计数 +1；到达更新间隔时重算并返回发生变化的策略。
  std::vector<WeightUpdateAction> OnCycle();

  /// 立即按当前窗口重算（不检查周期间隔）。
  std::vector<WeightUpdateAction> Recompute();

  /// 当前权重；未知策略返回 1.0。
  double WeightOf(const std::string& strategy_id) const;

  std::vector<StrategyWeight> Snapshot() const;

 private:
  struct Book {
    std::deque<bool> wins;
    double weight{1.0};
  };

  std::vector<WeightUpdateAction> RecomputeLocked();

  WeightConfig config_;
  mutable std::mutex mutex_;
  std::map<std::string, Book> books_;
  int cycles_since_update_{0};
};

}  // namespace hydra
