#pragma once

#include <optional>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace hydra {

/**
 * @brief 从基准资产收盘序列提取 Regime 特征
 *
 * 特征口径：
 * 1. volatility_level：短窗口对数收益率年化标准差，百分数；
 * 2. volatility_term_slope：长窗口波动率 - 短窗口波动率（<0 为倒挂）；
 * 3. trend_strength：5/20/50 bar 动量加权，截断到 [-1,1]；
 * 4. mean_reversion_score：0.5 - 近 30 根收益率一阶自相关，截断到 [0,1]。
 */
class RegimeFeatureExtractor {
 public:
  explicit RegimeFeatureExtractor(RegimeConfig config = {}) : config_(config) {}

  /**
   * @brief 计算特征
   *
   * @param bars 按时间升序的 K 线（仅使用 close，非正价格被跳过）
   * @param volatility_index 外部波动率指数（如 VIX），存在时覆盖 volatility_level
   * @param volatility_term 远月波动率指数，与上者同时存在时覆盖期限斜率
   */
  RegimeFeatures Extract(const std::vector<OhlcBar>& bars,
                         std::optional<double> volatility_index = std::nullopt,
                         std::optional<double> volatility_term = std::nullopt) const;

  static double TrendStrength(const std::vector<double>& closes);
  static double MeanReversionScore(const std::vector<double>& closes);
  /// 最近 window 根对数收益率的年化波动率（百分数）；样本不足返回 0。
  static double AnnualizedVolatility(const std::vector<double>& closes,
                                     int window, double bars_per_year);
  /// 日度波动率（小数口径，供风控 vol_scalar 使用）；样本不足返回 nullopt。
  static std::optional<double> DailyVolatility(const std::vector<OhlcBar>& bars,
                                               double bars_per_year);

 private:
  RegimeConfig config_;
};

}  // namespace hydra
