#include "regime/regime_features.h"

#include <algorithm>
#include <cmath>

namespace hydra {

namespace {

constexpr double kEpsilon = 1e-12;
constexpr double kTradingDaysPerYear = 252.0;

std::vector<double> ValidCloses(const std::vector<OhlcBar>& bars) {
  std::vector<double> closes;
  closes.reserve(bars.size());
  for (const auto& bar : bars) {
    if (std::isfinite(bar.close) && bar.close > kEpsilon) {
      closes.push_back(bar.close);
    }
  }
  return closes;
}

double Momentum(const std::vector<double>& closes, std::size_t lookback) {
  const double base = closes[closes.size() - lookback];
  if (base <= kEpsilon) {
    return 0.0;
  }
  return (closes.back() - base) / base;
}

}  // namespace

double RegimeFeatureExtractor::TrendStrength(const std::vector<double>& closes) {
  if (closes.size() < 50) {
    return 0.0;
  }
  const double raw = (0.5 * Momentum(closes, 5) + 0.3 * Momentum(closes, 20) +
                      0.2 * Momentum(closes, 50)) *
                     100.0;
  return std::clamp(raw / 5.0, -1.0, 1.0);
}

double RegimeFeatureExtractor::MeanReversionScore(
    const std::vector<double>& closes) {
  if (closes.size() < 30) {
    return 0.5;
  }
  std::vector<double> returns;
  const std::size_t begin = std::max<std::size_t>(1, closes.size() - 30);
  for (std::size_t i = begin; i < closes.size(); ++i) {
    returns.push_back((closes[i] - closes[i - 1]) / closes[i - 1]);
  }
  if (returns.size() < 10) {
    return 0.5;
  }
  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());
  double variance = 0.0;
  for (double r : returns) {
    variance += (r - mean) * (r - mean);
  }
  if (variance <= kEpsilon * kEpsilon) {
    return 0.5;
  }
  double covariance = 0.0;
  for (std::size_t i = 1; i < returns.size(); ++i) {
    covariance += (returns[i] - mean) * (returns[i - 1] - mean);
  }
  const double autocorr = covariance / variance;
  return std::clamp(0.5 - autocorr, 0.0, 1.0);
}

double RegimeFeatureExtractor::AnnualizedVolatility(
    const std::vector<double>& closes, int window, double bars_per_year) {
  if (window < 2 || closes.size() < 3) {
    return 0.0;
  }
  const std::size_t returns_available = closes.size() - 1;
  const std::size_t count =
      std::min(returns_available, static_cast<std::size_t>(window));
  if (count < 2) {
    return 0.0;
  }
  std::vector<double> log_returns;
  log_returns.reserve(count);
  for (std::size_t i = closes.size() - count; i < closes.size(); ++i) {
    log_returns.push_back(std::log(closes[i] / closes[i - 1]));
  }
  double mean = 0.0;
  for (double r : log_returns) {
    mean += r;
  }
  mean /= static_cast<double>(log_returns.size());
  double sum_sq = 0.0;
  for (double r : log_returns) {
    sum_sq += (r - mean) * (r - mean);
  }
  const double stdev =
      std::sqrt(sum_sq / static_cast<double>(log_returns.size() - 1));
  return stdev * std::sqrt(std::max(1.0, bars_per_year)) * 100.0;
}

std::optional<double> RegimeFeatureExtractor::DailyVolatility(
    const std::vector<OhlcBar>& bars, double bars_per_year) {
  const std::vector<double> closes = ValidCloses(bars);
  if (closes.size() < 3) {
    return std::nullopt;
  }
  const int window = static_cast<int>(closes.size() - 1);
  const double annual_pct = AnnualizedVolatility(closes, window, bars_per_year);
  return annual_pct / 100.0 / std::sqrt(kTradingDaysPerYear);
}

RegimeFeatures RegimeFeatureExtractor::Extract(
    const std::vector<OhlcBar>& bars,
    std::optional<double> volatility_index,
    std::optional<double> volatility_term) const {
  RegimeFeatures features;
  std::vector<double> closes = ValidCloses(bars);
  const std::size_t max_bars =
      static_cast<std::size_t>(std::max(1, config_.history_bars));
  if (closes.size() > max_bars) {
    closes.erase(closes.begin(),
                 closes.end() - static_cast<std::ptrdiff_t>(max_bars));
  }
  features.sample_count = static_cast<int>(closes.size());

  const double short_vol = AnnualizedVolatility(
      closes, config_.short_vol_window, config_.bars_per_year);
  features.volatility_level = short_vol;
  // 长窗口样本不足时斜率为 0，避免窗口重叠造成伪倒挂。
  if (closes.size() > static_cast<std::size_t>(config_.long_vol_window)) {
    const double long_vol = AnnualizedVolatility(
        closes, config_.long_vol_window, config_.bars_per_year);
    features.volatility_term_slope = long_vol - short_vol;
  }

  if (volatility_index.has_value() && std::isfinite(*volatility_index) &&
      *volatility_index > 0.0) {
    features.volatility_level = *volatility_index;
    features.volatility_term_slope = 0.0;
    if (volatility_term.has_value() && std::isfinite(*volatility_term) &&
        *volatility_term > 0.0) {
      features.volatility_term_slope = *volatility_term - *volatility_index;
    }
  }

  features.trend_strength = TrendStrength(closes);
  features.mean_reversion_score = MeanReversionScore(closes);
  return features;
}

}  // namespace hydra
