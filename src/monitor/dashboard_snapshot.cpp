#include "monitor/dashboard_snapshot.h"

#include <utility>

#include "core/json_utils.h"

namespace hydra {

namespace {

void WriteRegime(JsonWriter* w, const RegimeState& state) {
  w->BeginObject()
      .Key("regime").String(ToString(state.regime))
      .Key("confidence").Number(state.confidence)
      .Key("previous_regime").String(ToString(state.previous_regime))
      .Key("classified_at_ms").Int(state.classified_at_ms)
      .Key("features").BeginObject()
      .Key("volatility_level").Number(state.features.volatility_level)
      .Key("volatility_term_slope").Number(state.features.volatility_term_slope)
      .Key("trend_strength").Number(state.features.trend_strength)
      .Key("mean_reversion_score").Number(state.features.mean_reversion_score)
      .Key("sample_count").Int(state.features.sample_count)
      .EndObject()
      .EndObject();
}

void WriteRisk(JsonWriter* w, const RiskState& risk) {
  w->BeginObject()
      .Key("capital").Number(risk.capital)
      .Key("equity_high_water_mark").Number(risk.equity_high_water_mark)
      .Key("daily_realized_pnl").Number(risk.daily_realized_pnl)
      .Key("daily_start_capital").Number(risk.daily_start_capital)
      .Key("open_exposure_total").Number(risk.open_exposure_total)
      .Key("open_exposure_by_asset").BeginObject();
  for (const auto& [asset, notional] : risk.open_exposure_by_asset) {
    w->Key(asset).Number(notional);
  }
  w->EndObject()
      .Key("consecutive_losses").Int(risk.consecutive_losses)
      .Key("cooldown_until_ms").Int(risk.cooldown_until_ms)
      .Key("trades_today").Int(risk.trades_today)
      .Key("kill_switch_tripped").Bool(risk.kill_switch_tripped)
      .Key("halted").Bool(risk.halted)
      .Key("halt_reason").String(risk.halt_reason)
      .EndObject();
}

}  // namespace

std::string DashboardSnapshotToJson(const DashboardSnapshot& snapshot) {
  JsonWriter w;
  w.BeginObject()
      .Key("cycle").Int(snapshot.cycle)
      .Key("ts_ms").Int(snapshot.ts_ms)
      .Key("regime");
  WriteRegime(&w, snapshot.regime);

  w.Key("scores").BeginArray();
  for (const auto& score : snapshot.scores) {
    w.BeginObject()
        .Key("asset").String(score.asset)
        .Key("net_direction").Number(score.net_direction)
        .Key("confidence").Number(score.confidence)
        .Key("contributing_signal_count").Int(score.contributing_signal_count)
        .Key("dominant_source_id").String(score.dominant_source_id)
        .EndObject();
  }
  w.EndArray();

  w.Key("decisions").BeginArray();
  for (const auto& decision : snapshot.decisions) {
    w.BeginObject()
        .Key("strategy_id").String(decision.strategy_id)
        .Key("asset").String(decision.asset)
        .Key("direction").Int(decision.direction)
        .Key("score").Number(decision.score)
        .Key("approved").Bool(decision.approved)
        .Key("reason").String(ToString(decision.reason))
        .Key("detail").String(decision.detail)
        .Key("sized_notional").Number(decision.sized_notional)
        .EndObject();
  }
  w.EndArray();

  w.Key("open_positions").BeginArray();
  for (const auto& position : snapshot.open_positions) {
    w.BeginObject()
        .Key("position_id").String(position.position_id)
        .Key("asset").String(position.asset)
        .Key("direction").Int(position.direction)
        .Key("entry_price").Number(position.entry_price)
        .Key("stop").Number(position.stop)
        .Key("target").Number(position.target)
        .Key("trailing_activated").Bool(position.trailing.activated)
        .Key("notional").Number(position.notional)
        .Key("strategy_id").String(position.owning_strategy_id)
        .Key("opened_at_ms").Int(position.opened_at_ms)
        .Key("unpriced_cycles").Int(position.unpriced_cycles)
        .EndObject();
  }
  w.EndArray();

  w.Key("recent_outcomes").BeginArray();
  for (const auto& outcome : snapshot.recent_outcomes) {
    w.BeginObject()
        .Key("position_id").String(outcome.position_id)
        .Key("strategy_id").String(outcome.strategy_id)
        .Key("asset").String(outcome.asset)
        .Key("pnl").Number(outcome.pnl)
        .Key("r_multiple").Number(outcome.r_multiple)
        .Key("exit_reason").String(ToString(outcome.exit_reason))
        .Key("closed_at_ms").Int(outcome.closed_at_ms)
        .EndObject();
  }
  w.EndArray();

  w.Key("risk");
  WriteRisk(&w, snapshot.risk);

  w.Key("weights").BeginArray();
  for (const auto& weight : snapshot.weights) {
    w.BeginObject()
        .Key("strategy_id").String(weight.strategy_id)
        .Key("weight").Number(weight.weight)
        .Key("trailing_win_rate").Number(weight.trailing_win_rate)
        .Key("sample_count").Int(weight.sample_count)
        .EndObject();
  }
  w.EndArray();

  w.Key("notifications_dropped")
      .Int(static_cast<std::int64_t>(snapshot.notifications_dropped))
      .EndObject();
  return w.str();
}

void SnapshotStore::RecordOutcomes(const std::vector<RealizedOutcome>& outcomes) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& outcome : outcomes) {
    outcomes_.push_back(outcome);
    while (outcomes_.size() > max_outcomes_) {
      outcomes_.pop_front();
    }
  }
}

void SnapshotStore::Publish(DashboardSnapshot snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.recent_outcomes.assign(outcomes_.begin(), outcomes_.end());
  latest_ = std::move(snapshot);
  published_ = true;
}

DashboardSnapshot SnapshotStore::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

bool SnapshotStore::has_snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return published_;
}

}  // namespace hydra
