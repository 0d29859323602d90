#include "strategy/strategy_weights.h"

#include <algorithm>
#include <cmath>

namespace hydra {

namespace {

double WinRate(const std::deque<bool>& wins) {
  if (wins.empty()) {
    return 0.0;
  }
  const auto count = std::count(wins.begin(), wins.end(), true);
  return static_cast<double>(count) / static_cast<double>(wins.size());
}

}  // namespace

void StrategyWeightBook::RecordOutcome(const RealizedOutcome& outcome) {
  if (outcome.strategy_id.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Book& book = books_[outcome.strategy_id];
  book.wins.push_back(outcome.win);
  while (static_cast<int>(book.wins.size()) > std::max(1, config_.window)) {
    book.wins.pop_front();
  }
}

std::vector<WeightUpdateAction> StrategyWeightBook::OnCycle() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++cycles_since_update_;
  if (cycles_since_update_ < std::max(1, config_.update_interval_cycles)) {
    return {};
  }
  cycles_since_update_ = 0;
  return RecomputeLocked();
}

std::vector<WeightUpdateAction> StrategyWeightBook::Recompute() {
  std::lock_guard<std::mutex> lock(mutex_);
  return RecomputeLocked();
}

std::vector<WeightUpdateAction> StrategyWeightBook::RecomputeLocked() {
  std::vector<WeightUpdateAction> actions;
  for (auto& [strategy_id, book] : books_) {
    const int samples = static_cast<int>(book.wins.size());
    const double win_rate = WinRate(book.wins);
    double next = 1.0;
    if (samples >= config_.min_outcomes) {
      next = std::clamp(config_.win_rate_multiplier * win_rate,
                        config_.min_weight, config_.max_weight);
    }
    if (std::fabs(next - book.weight) > 1e-12) {
      actions.push_back(WeightUpdateAction{
          .strategy_id = strategy_id,
          .weight_before = book.weight,
          .weight_after = next,
          .win_rate = win_rate,
          .sample_count = samples,
      });
      book.weight = next;
    }
  }
  return actions;
}

double StrategyWeightBook::WeightOf(const std::string& strategy_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = books_.find(strategy_id);
  if (it == books_.end()) {
    return 1.0;
  }
  return it->second.weight;
}

std::vector<StrategyWeight> StrategyWeightBook::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StrategyWeight> out;
  out.reserve(books_.size());
  for (const auto& [strategy_id, book] : books_) {
    out.push_back(StrategyWeight{
        .strategy_id = strategy_id,
        .weight = book.weight,
        .trailing_win_rate = WinRate(book.wins),
        .sample_count = static_cast<int>(book.wins.size()),
    });
  }
  return out;
}

}  // namespace hydra
