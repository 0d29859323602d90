#include "strategy/builtin_strategies.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace hydra {

namespace {

constexpr double kRecoveryLeaderDirection = 0.1;
constexpr double kRecoveryLeaderConfidence = 0.4;
constexpr double kDipEntryFactor = 0.99;
constexpr double kDipStopFactor = 0.93;
constexpr double kDipTargetFactor = 1.12;
constexpr double kDipConfidenceHaircut = 0.8;
constexpr double kMarginFlowMaxConfidence = 0.8;

int DirectionOf(double net_direction) { return net_direction >= 0.0 ? 1 : -1; }

}  // namespace

LiquidationFlowStrategy::LiquidationFlowStrategy(StrategyParams params)
    : StrategyModule("liquidation_flow", std::move(params),
                     {Regime::kHighVolExpansion, Regime::kCrash,
                      Regime::kTrendingUp, Regime::kTrendingDown}) {}

std::vector<TradeProposal> LiquidationFlowStrategy::Generate(
    const StrategyInput& input) const {
  std::vector<TradeProposal> out;
  const double widen =
      std::max(1.0, input.regime.features.volatility_level / 25.0);
  for (const auto& asset : params().assets) {
    const AggregatedScore* score = input.Score(asset);
    const auto price = input.Price(asset);
    if (score == nullptr || !price.has_value() || !PassesScoreGate(*score)) {
      continue;
    }
    // 方向门槛为严格大于。
    if (std::fabs(score->net_direction) <= params().min_abs_direction) {
      continue;
    }
    const int dir = DirectionOf(score->net_direction);
    const double entry = *price;
    const double stop = entry * (1.0 - dir * params().stop_pct * widen);
    const double target = entry * (1.0 + dir * params().target_pct * widen);
    auto proposal = MakeProposal(
        asset, dir, entry, stop, target, score->confidence,
        "清算流一致: net=" + std::to_string(score->net_direction) +
            ", signals=" + std::to_string(score->contributing_signal_count) +
            ", dominant=" + score->dominant_source_id);
    if (proposal.has_value()) {
      out.push_back(std::move(*proposal));
    }
  }
  return out;
}

EventVolatilityStrategy::EventVolatilityStrategy(StrategyParams params)
    : StrategyModule("event_volatility", std::move(params),
                     {Regime::kTrendingUp, Regime::kTrendingDown,
                      Regime::kMeanReverting, Regime::kHighVolExpansion,
                      Regime::kCrash, Regime::kRecovery}) {}

std::vector<TradeProposal> EventVolatilityStrategy::Generate(
    const StrategyInput& input) const {
  std::vector<TradeProposal> out;
  const double vol = input.regime.features.volatility_level;
  const double reward_multiple = params().target_pct / params().stop_pct;
  for (const auto& asset : params().assets) {
    const AggregatedScore* score = input.Score(asset);
    const auto price = input.Price(asset);
    if (score == nullptr || !price.has_value() || !PassesScoreGate(*score)) {
      continue;
    }
    const int dir = DirectionOf(score->net_direction);
    const double entry = *price;
    const double stop_distance = entry * params().stop_pct * (1.0 + vol / 50.0);
    const double stop = entry - dir * stop_distance;
    const double target = entry + dir * stop_distance * reward_multiple;
    auto proposal = MakeProposal(
        asset, dir, entry, stop, target, score->confidence,
        "事件波动: net=" + std::to_string(score->net_direction) +
            ", vol=" + std::to_string(vol));
    if (proposal.has_value()) {
      out.push_back(std::move(*proposal));
    }
  }
  return out;
}

MarginFlowStrategy::MarginFlowStrategy(StrategyParams params)
    : StrategyModule("margin_flow", std::move(params),
                     {Regime::kHighVolExpansion, Regime::kCrash,
                      Regime::kRecovery, Regime::kMeanReverting}) {}

std::vector<TradeProposal> MarginFlowStrategy::Generate(
    const StrategyInput& input) const {
  std::vector<TradeProposal> out;
  const bool long_only = input.regime.regime == Regime::kRecovery ||
                         input.regime.regime == Regime::kMeanReverting;
  for (const auto& asset : params().assets) {
    const AggregatedScore* score = input.Score(asset);
    const auto price = input.Price(asset);
    if (score == nullptr || !price.has_value() || !PassesScoreGate(*score)) {
      continue;
    }
    const int dir = DirectionOf(score->net_direction);
    if (long_only && dir < 0) {
      continue;
    }
    const double entry = *price;
    const double stop = entry * (1.0 - dir * params().stop_pct);
    const double target = entry * (1.0 + dir * params().target_pct);
    auto proposal = MakeProposal(
        asset, dir, entry, stop, target,
        std::min(score->confidence, kMarginFlowMaxConfidence),
        std::string(long_only ? "保证金流逢低买入" : "保证金流去杠杆") +
            ": net=" + std::to_string(score->net_direction));
    if (proposal.has_value()) {
      out.push_back(std::move(*proposal));
    }
  }
  return out;
}

NarrativeShockStrategy::NarrativeShockStrategy(
    StrategyParams params, std::string leader_asset,
    std::vector<std::string> impaired_assets,
    std::vector<std::string> punished_assets)
    : StrategyModule("narrative_shock", std::move(params),
                     {Regime::kTrendingDown, Regime::kHighVolExpansion,
                      Regime::kRecovery}),
      leader_asset_(std::move(leader_asset)),
      impaired_assets_(std::move(impaired_assets)),
      punished_assets_(std::move(punished_assets)) {}

std::vector<TradeProposal> NarrativeShockStrategy::Generate(
    const StrategyInput& input) const {
  std::vector<TradeProposal> out;
  const AggregatedScore* leader = input.Score(leader_asset_);
  if (leader == nullptr) {
    return out;
  }

  if (leader->net_direction < -params().min_abs_direction &&
      leader->confidence > params().min_confidence) {
    for (const auto& asset : impaired_assets_) {
      const auto price = input.Price(asset);
      if (!price.has_value()) {
        continue;
      }
      const double entry = *price;
      auto proposal = MakeProposal(
          asset, -1, entry, entry * (1.0 + params().stop_pct),
          entry * (1.0 - params().target_pct), leader->confidence,
          "叙事冲击做空受损标的: leader=" + leader_asset_ +
              ", net=" + std::to_string(leader->net_direction));
      if (proposal.has_value()) {
        out.push_back(std::move(*proposal));
      }
    }
  }

  if (input.regime.regime == Regime::kRecovery &&
      leader->net_direction > kRecoveryLeaderDirection &&
      leader->confidence > kRecoveryLeaderConfidence) {
    for (const auto& asset : punished_assets_) {
      const auto price = input.Price(asset);
      if (!price.has_value()) {
        continue;
      }
      auto proposal = MakeProposal(
          asset, 1, *price * kDipEntryFactor, *price * kDipStopFactor,
          *price * kDipTargetFactor, leader->confidence * kDipConfidenceHaircut,
          "叙事修复做多错杀标的: leader=" + leader_asset_ +
              ", net=" + std::to_string(leader->net_direction));
      if (proposal.has_value()) {
        out.push_back(std::move(*proposal));
      }
    }
  }
  return out;
}

CrossAssetGraphStrategy::CrossAssetGraphStrategy(
    StrategyParams params, std::vector<CrossAssetEdge> edges,
    double max_follower_direction)
    : StrategyModule("cross_asset_graph", std::move(params),
                     {Regime::kTrendingDown, Regime::kCrash,
                      Regime::kHighVolExpansion}),
      edges_(std::move(edges)),
      max_follower_direction_(max_follower_direction) {}

std::vector<TradeProposal> CrossAssetGraphStrategy::Generate(
    const StrategyInput& input) const {
  std::vector<TradeProposal> out;
  for (const auto& edge : edges_) {
    const AggregatedScore* leader = input.Score(edge.leader);
    if (leader == nullptr || leader->confidence < params().min_confidence ||
        std::fabs(leader->net_direction) < params().min_abs_direction) {
      continue;
    }
    const AggregatedScore* follower = input.Score(edge.follower);
    const double follower_net =
        follower == nullptr ? 0.0 : follower->net_direction;
    if (std::fabs(follower_net) >= max_follower_direction_) {
      continue;
    }
    const auto price = input.Price(edge.follower);
    if (!price.has_value()) {
      continue;
    }
    const int dir = edge.sign * DirectionOf(leader->net_direction);
    const double entry = *price;
    auto proposal = MakeProposal(
        edge.follower, dir, entry, entry * (1.0 - dir * params().stop_pct),
        entry * (1.0 + dir * params().target_pct),
        leader->confidence * edge.weight,
        "跨资产传导: " + edge.leader + " -> " + edge.follower +
            ", leader_net=" + std::to_string(leader->net_direction));
    if (proposal.has_value()) {
      out.push_back(std::move(*proposal));
    }
  }
  return out;
}

StrategySet BuildDefaultStrategies(const StrategiesConfig& config) {
  StrategySet set;
  set.Add(std::make_unique<LiquidationFlowStrategy>(config.liquidation_flow));
  set.Add(std::make_unique<EventVolatilityStrategy>(config.event_volatility));
  set.Add(std::make_unique<MarginFlowStrategy>(config.margin_flow));
  set.Add(std::make_unique<NarrativeShockStrategy>(
      config.narrative_shock, config.narrative_leader_asset,
      config.narrative_impaired_assets, config.narrative_punished_assets));
  set.Add(std::make_unique<CrossAssetGraphStrategy>(
      config.cross_asset_graph, config.cross_asset_edges,
      config.cross_asset_max_follower_direction));
  return set;
}

}  // namespace hydra
