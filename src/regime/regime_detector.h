#pragma once

#include <cstdint>

#include "core/config.h"
#include "core/types.h"

namespace hydra {

/**
 * @brief Regime 分类器
 *
 * 设计目标：
 * 1. 分类是特征与上一态的纯函数（同输入重复调用输出一致）；
 * 2. 规则按固定优先级首个命中生效，RECOVERY 仅能由 CRASH 进入；
 * 3. 置信度低于阈值时按 UNKNOWN 输出，策略层据此全部观望。
 */
class RegimeDetector {
 public:
  explicit RegimeDetector(RegimeConfig config = {}) : config_(config) {}

  /// 纯分类：不读写任何内部状态。
  RegimeState Classify(const RegimeFeatures& features, Regime previous) const;

  /// 有状态入口：以上一次分类结果作为 previous，并记录本次结果。
  RegimeState Update(const RegimeFeatures& features, std::int64_t now_ms);

  const RegimeState& last_state() const { return last_state_; }

  /// 波动率分档（0/0.2/0.4/0.6/0.8/1.0）。
  static double VolatilityScore(double volatility_level);

 private:
  RegimeConfig config_;
  RegimeState last_state_{};
};

}  // namespace hydra
