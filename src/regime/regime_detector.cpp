#include "regime/regime_detector.h"

#include <algorithm>
#include <cmath>

namespace hydra {

double RegimeDetector::VolatilityScore(double volatility_level) {
  if (volatility_level < 12.0) return 0.0;
  if (volatility_level < 16.0) return 0.2;
  if (volatility_level < 20.0) return 0.4;
  if (volatility_level < 25.0) return 0.6;
  if (volatility_level < 35.0) return 0.8;
  return 1.0;
}

RegimeState RegimeDetector::Classify(const RegimeFeatures& features,
                                     Regime previous) const {
  RegimeState state;
  state.features = features;
  state.previous_regime = previous;

  if (features.sample_count < config_.min_samples) {
    state.regime = Regime::kUnknown;
    state.confidence = 0.0;
    return state;
  }

  const double vol = features.volatility_level;
  const double slope = features.volatility_term_slope;
  const double trend = features.trend_strength;
  const double mr = features.mean_reversion_score;
  const double vol_score = VolatilityScore(vol);

  Regime regime = Regime::kUnknown;
  double confidence = 0.3;
  if (vol > config_.crash_volatility && trend < -config_.crash_trend) {
    regime = Regime::kCrash;
    confidence = std::min(1.0, vol_score + 0.2);
  } else if (previous == Regime::kCrash && trend > config_.recovery_trend &&
             vol > config_.recovery_volatility) {
    // RECOVERY 先于 HIGH_VOL 判定。
    regime = Regime::kRecovery;
    confidence = 0.6;
  } else if (vol > config_.high_volatility && slope < 0.0) {
    regime = Regime::kHighVolExpansion;
    confidence = 0.6 + 0.3 * vol_score;
  } else if (std::fabs(trend) > config_.trend_threshold &&
             mr < config_.trend_max_mean_reversion) {
    regime = trend > 0.0 ? Regime::kTrendingUp : Regime::kTrendingDown;
    confidence = std::fabs(trend);
  } else if (mr > config_.mean_reversion_threshold &&
             vol < config_.high_volatility) {
    regime = Regime::kMeanReverting;
    confidence = mr;
  }

  confidence = std::clamp(confidence, 0.0, 1.0);
  if (regime != Regime::kUnknown && confidence < config_.min_confidence) {
    regime = Regime::kUnknown;
  }
  state.regime = regime;
  state.confidence = confidence;
  return state;
}

RegimeState RegimeDetector::Update(const RegimeFeatures& features,
                                   std::int64_t now_ms) {
  RegimeState state = Classify(features, last_state_.regime);
  state.classified_at_ms = now_ms;
  last_state_ = state;
  return state;
}

}  // namespace hydra
