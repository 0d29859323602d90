#include "strategy/strategy_module.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <utility>

#include "core/log.h"

namespace hydra {

namespace {

constexpr double kEpsilon = 1e-12;

}  // namespace

const AggregatedScore* StrategyInput::Score(const std::string& asset) const {
  const auto it = scores.find(asset);
  if (it == scores.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<double> StrategyInput::Price(const std::string& asset) const {
  const auto it = prices.find(asset);
  if (it == prices.end() || !std::isfinite(it->second) || it->second <= 0.0) {
    return std::nullopt;
  }
  return it->second;
}

StrategyModule::StrategyModule(std::string id, StrategyParams params,
                               std::vector<Regime> eligible_regimes)
    : id_(std::move(id)),
      params_(std::move(params)),
      eligible_regimes_(std::move(eligible_regimes)) {}

bool StrategyModule::IsEligible(const RegimeState& regime) const {
  if (!params_.enabled) {
    return false;
  }
  if (regime.confidence < params_.min_regime_confidence) {
    return false;
  }
  return std::find(eligible_regimes_.begin(), eligible_regimes_.end(),
                   regime.regime) != eligible_regimes_.end();
}

std::vector<TradeProposal> StrategyModule::Propose(
    const StrategyInput& input) const {
  if (!IsEligible(input.regime)) {
    return {};
  }
  std::vector<TradeProposal> proposals = Generate(input);
  for (auto& proposal : proposals) {
    proposal.strategy_id = id_;
  }
  return proposals;
}

bool StrategyModule::PassesScoreGate(const AggregatedScore& score) const {
  return score.confidence >= params_.min_confidence &&
         std::fabs(score.net_direction) >= params_.min_abs_direction &&
         score.contributing_signal_count >= params_.min_signal_count;
}

std::optional<TradeProposal> StrategyModule::MakeProposal(
    const std::string& asset, int direction, double entry, double stop,
    double target, double confidence, std::string rationale) const {
  if (direction != 1 && direction != -1) {
    return std::nullopt;
  }
  const double risk = std::fabs(entry - stop);
  if (!(entry > 0.0) || risk <= kEpsilon || !std::isfinite(target)) {
    return std::nullopt;
  }
  TradeProposal proposal;
  proposal.strategy_id = id_;
  proposal.asset = asset;
  proposal.direction = direction;
  proposal.entry = entry;
  proposal.stop = stop;
  proposal.target = target;
  proposal.confidence = std::clamp(confidence, 0.0, 1.0);
  proposal.reward_to_risk = std::fabs(target - entry) / risk;
  proposal.requested_notional = params_.max_notional_usd;
  proposal.trailing_enabled = params_.trailing;
  proposal.rationale = std::move(rationale);
  return proposal;
}

void StrategySet::Add(std::unique_ptr<StrategyModule> module) {
  if (module != nullptr) {
    modules_.push_back(std::move(module));
  }
}

const StrategyModule* StrategySet::Find(const std::string& id) const {
  for (const auto& module : modules_) {
    if (module->id() == id) {
      return module.get();
    }
  }
  return nullptr;
}

std::vector<TradeProposal> StrategySet::RunAll(const StrategyInput& input) const {
  std::vector<std::future<std::vector<TradeProposal>>> tasks;
  tasks.reserve(modules_.size());
  for (const auto& module : modules_) {
    const StrategyModule* raw = module.get();
    tasks.push_back(std::async(std::launch::async, [raw, &input]() {
      return raw->Propose(input);
    }));
  }

  std::vector<TradeProposal> merged;
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    try {
      std::vector<TradeProposal> proposals = tasks[i].get();
      merged.insert(merged.end(), proposals.begin(), proposals.end());
    } catch (const std::exception& ex) {
      LogError("策略执行异常，已跳过: strategy=" + modules_[i]->id() +
               ", error=" + ex.what());
    }
  }
  return merged;
}

}  // namespace hydra
