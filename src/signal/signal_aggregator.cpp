#include "signal/signal_aggregator.h"

#include <algorithm>
#include <cmath>

namespace hydra {

namespace {

constexpr double kEpsilon = 1e-12;

bool Finite(double value) { return std::isfinite(value); }

double AgeMs(const Signal& signal, std::int64_t now_ms) {
  // 时钟偏差导致的"未来信号"按 age=0 处理。
  return static_cast<double>(std::max<std::int64_t>(0, now_ms - signal.timestamp_ms));
}

}  // namespace

bool SignalAggregator::ValidateSignal(const Signal& signal,
                                      std::string* out_error) {
  const auto fail = [&](const std::string& message) {
    if (out_error != nullptr) {
      *out_error = message + " (source=" + signal.source_id +
                   ", asset=" + signal.asset + ")";
    }
    return false;
  };
  if (signal.source_id.empty() || signal.asset.empty()) {
    return fail("信号 source_id/asset 不能为空");
  }
  if (!Finite(signal.direction) || !Finite(signal.strength) ||
      !Finite(signal.reliability_weight)) {
    return fail("信号包含非有限数值");
  }
  if (signal.direction < -1.0 || signal.direction > 1.0) {
    return fail("信号 direction 超出 [-1,1]");
  }
  if (signal.strength < 0.0 || signal.strength > 1.0) {
    return fail("信号 strength 超出 [0,1]");
  }
  if (signal.reliability_weight <= 0.0 || signal.reliability_weight > 1.0) {
    return fail("信号 reliability_weight 超出 (0,1]");
  }
  if (signal.half_life_ms <= 0) {
    return fail("信号 half_life_ms 必须大于 0");
  }
  return true;
}

double SignalAggregator::EffectiveWeight(const Signal& signal,
                                         std::int64_t now_ms,
                                         double expiry_half_lives) {
  const double age = AgeMs(signal, now_ms);
  const double half_life = static_cast<double>(signal.half_life_ms);
  if (half_life <= 0.0 || age >= expiry_half_lives * half_life) {
    return 0.0;
  }
  const double decay = std::exp(-std::log(2.0) * age / half_life);
  return signal.reliability_weight * signal.strength * decay;
}

bool SignalAggregator::IsExpired(const Signal& signal,
                                 std::int64_t now_ms) const {
  return AgeMs(signal, now_ms) >=
         config_.expiry_half_lives * static_cast<double>(signal.half_life_ms);
}

bool SignalAggregator::Ingest(const Signal& signal, std::string* out_error) {
  if (!ValidateSignal(signal, out_error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  SourceMap& sources = store_[signal.asset];
  auto it = sources.find(signal.source_id);
  if (it == sources.end()) {
    sources.emplace(signal.source_id, signal);
    return true;
  }
  // 乱序到达的旧信号不覆盖新信号。
  if (signal.timestamp_ms < it->second.timestamp_ms) {
    return true;
  }
  it->second = signal;
  return true;
}

AggregatedScore SignalAggregator::AggregateLocked(const std::string& asset,
                                                  const SourceMap& sources,
                                                  std::int64_t now_ms) const {
  AggregatedScore score;
  score.asset = asset;
  double weighted_direction = 0.0;
  double total_weight = 0.0;
  double dominant_contribution = -1.0;
  for (const auto& [source_id, signal] : sources) {
    const double weight =
        EffectiveWeight(signal, now_ms, config_.expiry_half_lives);
    if (IsExpired(signal, now_ms)) {
      continue;
    }
    ++score.contributing_signal_count;
    weighted_direction += signal.direction * weight;
    total_weight += weight;
    const double contribution = std::fabs(signal.direction * weight);
    // 并列时取 source_id 字典序较小者，保证输出与哈希顺序无关。
    if (contribution > dominant_contribution + kEpsilon ||
        (std::fabs(contribution - dominant_contribution) <= kEpsilon &&
         source_id < score.dominant_source_id)) {
      dominant_contribution = contribution;
      score.dominant_source_id = source_id;
    }
  }
  score.total_effective_weight = total_weight;
  if (total_weight > kEpsilon) {
    score.net_direction =
        std::clamp(weighted_direction / total_weight, -1.0, 1.0);
    score.confidence =
        std::clamp(total_weight / config_.confidence_saturation, 0.0, 1.0);
  }
  if (score.contributing_signal_count == 0) {
    score.dominant_source_id = "none";
  }
  return score;
}

AggregatedScore SignalAggregator::Aggregate(const std::string& asset,
                                            std::int64_t now_ms) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = store_.find(asset);
  if (it == store_.end()) {
    AggregatedScore empty;
    empty.asset = asset;
    return empty;
  }
  return AggregateLocked(asset, it->second, now_ms);
}

std::vector<AggregatedScore> SignalAggregator::Snapshot(
    std::int64_t now_ms) const {
  std::vector<AggregatedScore> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(store_.size());
    for (const auto& [asset, sources] : store_) {
      out.push_back(AggregateLocked(asset, sources, now_ms));
    }
  }
  std::sort(out.begin(), out.end(),
            [](const AggregatedScore& lhs, const AggregatedScore& rhs) {
              return lhs.asset < rhs.asset;
            });
  return out;
}

int SignalAggregator::PurgeExpired(std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  int removed = 0;
  for (auto asset_it = store_.begin(); asset_it != store_.end();) {
    SourceMap& sources = asset_it->second;
    for (auto it = sources.begin(); it != sources.end();) {
      if (IsExpired(it->second, now_ms)) {
        it = sources.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (sources.empty()) {
      asset_it = store_.erase(asset_it);
    } else {
      ++asset_it;
    }
  }
  return removed;
}

std::size_t SignalAggregator::StoredSignalCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& [asset, sources] : store_) {
    count += sources.size();
  }
  return count;
}

}  // namespace hydra
