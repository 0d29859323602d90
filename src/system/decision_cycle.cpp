#include "system/decision_cycle.h"

#include <algorithm>
#include <chrono>
#include <utility>

#include "core/log.h"
#include "strategy/builtin_strategies.h"

namespace hydra {

DecisionCycle::DecisionCycle(const AppConfig& config, CycleDependencies deps)
    : config_(config),
      deps_(deps),
      extractor_(config.regime),
      detector_(config.regime),
      strategies_(BuildDefaultStrategies(config.strategies)),
      ranker_(config.ranking),
      positions_(config.lifecycle),
      weights_(config.weights) {}

void DecisionCycle::Notify(NotifyEvent event) {
  if (deps_.notifier != nullptr) {
    deps_.notifier->Publish(std::move(event));
  }
}

void DecisionCycle::RequestHaltResume(const std::string& operator_note) {
  std::lock_guard<std::mutex> lock(resume_mutex_);
  resume_note_ = operator_note;
}

void DecisionCycle::ApplyResumeRequest() {
  std::optional<std::string> note;
  {
    std::lock_guard<std::mutex> lock(resume_mutex_);
    note.swap(resume_note_);
  }
  if (!note.has_value()) {
    return;
  }
  if (deps_.ledger->ResumeAfterHalt(*note)) {
    halt_notified_ = false;
  } else if (!deps_.ledger->Snapshot().halted) {
    LogInfo("RISK_RESUME_IGNORED: 账本未处于 halt, note=" + *note);
  }
}

RegimeState DecisionCycle::ClassifyRegime(std::int64_t now_ms) {
  std::vector<OhlcBar> bars;
  std::string error;
  if (!deps_.price_feed->GetOhlcHistory(config_.regime.benchmark_asset,
                                        config_.regime.history_bars, &bars,
                                        &error)) {
    // 基准历史不可得：样本数为 0，分类器输出 UNKNOWN。
    LogError("BENCHMARK_HISTORY_UNAVAILABLE: asset=" +
             config_.regime.benchmark_asset + ", error=" + error);
    bars.clear();
  }
  std::optional<double> vol_index;
  std::optional<double> vol_term;
  double value = 0.0;
  if (!config_.regime.volatility_index_asset.empty() &&
      deps_.price_feed->GetPrice(config_.regime.volatility_index_asset, &value,
                                 &error)) {
    vol_index = value;
  }
  if (!config_.regime.volatility_term_asset.empty() &&
      deps_.price_feed->GetPrice(config_.regime.volatility_term_asset, &value,
                                 &error)) {
    vol_term = value;
  }
  const Regime before = detector_.last_state().regime;
  const RegimeState state =
      detector_.Update(extractor_.Extract(bars, vol_index, vol_term), now_ms);
  if (state.regime != before) {
    LogInfo(std::string("REGIME_CHANGED: ") + ToString(before) + " -> " +
            ToString(state.regime) +
            ", confidence=" + FormatFixed(state.confidence) +
            ", vol=" + FormatFixed(state.features.volatility_level) +
            ", trend=" + FormatFixed(state.features.trend_strength) +
            ", mr=" + FormatFixed(state.features.mean_reversion_score));
  }
  return state;
}

std::unordered_map<std::string, double> DecisionCycle::FetchPrices() const {
  std::unordered_map<std::string, double> prices;
  for (const auto& asset : config_.WatchedAssets()) {
    double price = 0.0;
    std::string error;
    if (deps_.price_feed->GetPrice(asset, &price, &error)) {
      prices[asset] = price;
    }
  }
  return prices;
}

std::optional<double> DecisionCycle::AssetVolatility(const std::string& asset) const {
  std::vector<OhlcBar> bars;
  std::string error;
  if (!deps_.price_feed->GetOhlcHistory(asset, config_.regime.history_bars,
                                        &bars, &error)) {
    return std::nullopt;
  }
  return RegimeFeatureExtractor::DailyVolatility(bars, config_.regime.bars_per_year);
}

void DecisionCycle::EvaluateRanked(const std::vector<RankedProposal>& ranked,
                                   std::int64_t now_ms, CycleSummary* summary) {
  for (const auto& item : ranked) {
    const TradeProposal& proposal = item.proposal;
    const RiskDecision decision = risk_manager_.Evaluate(
        proposal, deps_.ledger, now_ms, AssetVolatility(proposal.asset));

    summary->decisions.push_back(DecisionRecord{
        .strategy_id = proposal.strategy_id,
        .asset = proposal.asset,
        .direction = proposal.direction,
        .score = item.score,
        .approved = decision.approved,
        .reason = decision.reason,
        .detail = decision.detail,
        .sized_notional = decision.sized_notional,
    });

    if (!decision.approved) {
      ++summary->rejected;
      LogInfo(std::string("RISK_REJECTED: strategy=") + proposal.strategy_id +
              ", asset=" + proposal.asset +
              ", reason=" + ToString(decision.reason) +
              ", detail=" + decision.detail);
      if (decision.reason == RejectReason::kHalted) {
        if (!halt_notified_) {
          halt_notified_ = true;
          Notify(NotifyEvent{.type = NotifyEventType::kRiskHalted, .ts_ms = now_ms}
                     .With("reason", deps_.ledger->Snapshot().halt_reason));
        }
      } else if (decision.reason == RejectReason::kKillSwitch) {
        const std::int64_t day = deps_.ledger->TradingDayOf(now_ms);
        if (kill_switch_notified_day_ != day) {
          kill_switch_notified_day_ = day;
          Notify(NotifyEvent{.type = NotifyEventType::kKillSwitch, .ts_ms = now_ms}
                     .With("detail", decision.detail));
        }
      }
      if (config_.notify.notify_rejections) {
        Notify(NotifyEvent{.type = NotifyEventType::kRejected, .ts_ms = now_ms}
                   .With("strategy", proposal.strategy_id)
                   .With("asset", proposal.asset)
                   .With("reason", ToString(decision.reason)));
      }
      continue;
    }

    ++summary->approved;
    ApprovedOrder order{
        .order_id = "ord-" + std::to_string(cycle_count_) + "-" +
                    std::to_string(++order_seq_),
        .proposal = proposal,
        .sized_notional = decision.sized_notional,
        .approved_at_ms = now_ms,
    };
    LogInfo("RISK_APPROVED: order_id=" + order.order_id +
            ", strategy=" + proposal.strategy_id +
            ", asset=" + proposal.asset +
            ", direction=" + std::to_string(proposal.direction) +
            ", notional=" + FormatFixed(decision.sized_notional) +
            ", kelly=" + FormatFixed(decision.kelly_fraction, 4) +
            ", vol_scalar=" + FormatFixed(decision.vol_scalar, 3) +
            ", clamped=" + (decision.clamped ? "true" : "false"));
    Notify(NotifyEvent{.type = NotifyEventType::kApproved, .ts_ms = now_ms}
               .With("strategy", proposal.strategy_id)
               .With("asset", proposal.asset)
               .With("direction", proposal.direction > 0 ? "LONG" : "SHORT")
               .With("notional", FormatFixed(decision.sized_notional))
               .With("rationale", proposal.rationale));
    pending_orders_[order.order_id] = order;
    deps_.executor->Submit(order);
  }
}

void DecisionCycle::ApplyFillReports(const std::vector<FillReport>& reports,
                                     std::int64_t now_ms,
                                     CycleSummary* summary) {
  for (const auto& report : reports) {
    const auto it = pending_orders_.find(report.order_id);
    if (it == pending_orders_.end()) {
      // 已按超时释放敞口的订单，迟到回报不再开仓。
      LogError("LATE_FILL_IGNORED: order_id=" + report.order_id +
               ", filled=" + (report.filled ? "true" : "false"));
      continue;
    }
    const ApprovedOrder order = it->second;
    pending_orders_.erase(it);

    FillReport fill = report;
    if (fill.filled && fill.filled_notional > order.sized_notional) {
      fill.filled_notional = order.sized_notional;
    }
    std::optional<Position> position;
    if (fill.filled) {
      position = positions_.OpenFromFill(order, fill, now_ms);
    }
    if (!position.has_value()) {
      ++summary->failed_orders;
      deps_.ledger->ReleaseExposure(order.proposal.asset, order.sized_notional);
      const std::string error = fill.error.empty() ? "成交回报非法" : fill.error;
      LogError("ORDER_FAILED: order_id=" + order.order_id +
               ", asset=" + order.proposal.asset + ", error=" + error);
      Notify(NotifyEvent{.type = NotifyEventType::kOrderFailed, .ts_ms = now_ms}
                 .With("order_id", order.order_id)
                 .With("asset", order.proposal.asset)
                 .With("error", error));
      continue;
    }
    ++summary->fills;
    if (position->notional < order.sized_notional) {
      deps_.ledger->ReleaseExposure(order.proposal.asset,
                                    order.sized_notional - position->notional);
    }
    LogInfo("POSITION_OPENED: id=" + position->position_id +
            ", asset=" + position->asset +
            ", strategy=" + position->owning_strategy_id +
            ", entry=" + FormatFixed(position->entry_price, 4) +
            ", stop=" + FormatFixed(position->stop, 4) +
            ", target=" + FormatFixed(position->target, 4) +
            ", notional=" + FormatFixed(position->notional));
  }
}

void DecisionCycle::ExpireStaleOrders(std::int64_t now_ms, CycleSummary* summary) {
  for (auto it = pending_orders_.begin(); it != pending_orders_.end();) {
    const ApprovedOrder& order = it->second;
    if (now_ms - order.approved_at_ms <= config_.executor.order_stale_ms) {
      ++it;
      continue;
    }
    ++summary->failed_orders;
    deps_.ledger->ReleaseExposure(order.proposal.asset, order.sized_notional);
    LogError("ORDER_STALE: order_id=" + order.order_id +
             ", asset=" + order.proposal.asset +
             ", age_ms=" + std::to_string(now_ms - order.approved_at_ms));
    Notify(NotifyEvent{.type = NotifyEventType::kOrderFailed, .ts_ms = now_ms}
               .With("order_id", order.order_id)
               .With("asset", order.proposal.asset)
               .With("error", "回报超时"));
    it = pending_orders_.erase(it);
  }
}

void DecisionCycle::ProcessLifecycle(std::int64_t now_ms, CycleSummary* summary) {
  const LifecycleReport report =
      positions_.OnCycle(*deps_.price_feed, deps_.ledger, now_ms);
  for (const auto& closed : report.closed) {
    ++summary->closed_positions;
    summary->outcomes.push_back(closed.outcome);
    weights_.RecordOutcome(closed.outcome);
    Notify(NotifyEvent{.type = NotifyEventType::kPositionClosed, .ts_ms = now_ms}
               .With("position_id", closed.outcome.position_id)
               .With("asset", closed.outcome.asset)
               .With("strategy", closed.outcome.strategy_id)
               .With("reason", ToString(closed.outcome.exit_reason))
               .With("pnl", FormatFixed(closed.outcome.pnl))
               .With("r", FormatFixed(closed.outcome.r_multiple)));
    if (closed.ledger_effect.kill_switch_tripped_now) {
      kill_switch_notified_day_ = deps_.ledger->TradingDayOf(now_ms);
      LogError("KILL_SWITCH_TRIPPED: daily_realized_pnl=" +
               FormatFixed(deps_.ledger->Snapshot().daily_realized_pnl));
      Notify(NotifyEvent{.type = NotifyEventType::kKillSwitch, .ts_ms = now_ms}
                 .With("trigger", closed.outcome.position_id));
    }
    if (closed.ledger_effect.cooldown_armed_now) {
      LogInfo("COOLDOWN_ARMED: until_ms=" +
              std::to_string(deps_.ledger->Snapshot().cooldown_until_ms));
    }
  }
  for (const auto& position : report.unpriced) {
    ++summary->unpriced_positions;
    Notify(NotifyEvent{.type = NotifyEventType::kPositionUnpriced, .ts_ms = now_ms}
               .With("position_id", position.position_id)
               .With("asset", position.asset)
               .With("cycles", std::to_string(position.unpriced_cycles)));
  }
  if (deps_.snapshots != nullptr) {
    deps_.snapshots->RecordOutcomes(summary->outcomes);
  }
}

void DecisionCycle::PublishSnapshot(const std::vector<AggregatedScore>& scores,
                                    const CycleSummary& summary) {
  if (deps_.snapshots == nullptr) {
    return;
  }
  DashboardSnapshot snapshot;
  snapshot.cycle = summary.cycle;
  snapshot.ts_ms = summary.now_ms;
  snapshot.regime = summary.regime;
  snapshot.scores = scores;
  snapshot.decisions = summary.decisions;
  snapshot.open_positions = positions_.OpenPositions();
  snapshot.risk = deps_.ledger->Snapshot();
  snapshot.weights = weights_.Snapshot();
  if (deps_.notifier != nullptr) {
    snapshot.notifications_dropped = deps_.notifier->dropped_count();
  }
  deps_.snapshots->Publish(std::move(snapshot));
}

CycleSummary DecisionCycle::RunOnce(std::int64_t now_ms) {
  CycleSummary summary;
  summary.cycle = ++cycle_count_;
  summary.now_ms = now_ms;

  // 0. 运维解除 halt。
  ApplyResumeRequest();

  // 1. 上周期遗留回报与超时订单。
  std::vector<FillReport> reports;
  deps_.executor->PollResults(&reports);
  ApplyFillReports(reports, now_ms, &summary);
  ExpireStaleOrders(now_ms, &summary);

  // 2. 信号聚合。
  summary.purged_signals = deps_.aggregator->PurgeExpired(now_ms);
  const std::vector<AggregatedScore> scores = deps_.aggregator->Snapshot(now_ms);

  // 3. Regime。
  summary.regime = ClassifyRegime(now_ms);

  // 4-5. 取价并并发运行策略。
  StrategyInput input;
  for (const auto& score : scores) {
    if (score.contributing_signal_count > 0) {
      input.scores[score.asset] = score;
    }
  }
  summary.scored_assets = static_cast<int>(input.scores.size());
  input.regime = summary.regime;
  input.prices = FetchPrices();
  input.now_ms = now_ms;
  const std::vector<TradeProposal> proposals = strategies_.RunAll(input);
  summary.proposals = static_cast<int>(proposals.size());

  // 6. 排序。
  const std::vector<RankedProposal> ranked = ranker_.TopK(
      proposals,
      [this](const std::string& strategy_id) { return weights_.WeightOf(strategy_id); });
  summary.ranked = static_cast<int>(ranked.size());

  // 7. 逐个风控并提交。
  EvaluateRanked(ranked, now_ms, &summary);

  // 8. 有界等待本周期回报。
  if (summary.approved > 0) {
    deps_.executor->WaitForResults(
        static_cast<std::size_t>(summary.approved),
        std::chrono::milliseconds(config_.executor.submit_wait_ms));
    deps_.executor->PollResults(&reports);
    ApplyFillReports(reports, now_ms, &summary);
  }

  // 9. 持仓生命周期。
  ProcessLifecycle(now_ms, &summary);

  // 10. 权重。
  for (const auto& action : weights_.OnCycle()) {
    ++summary.weight_updates;
    LogInfo("STRATEGY_WEIGHT_UPDATED: strategy=" + action.strategy_id +
            ", weight=" + FormatFixed(action.weight_before, 3) + " -> " +
            FormatFixed(action.weight_after, 3) +
            ", win_rate=" + FormatFixed(action.win_rate, 3) +
            ", samples=" + std::to_string(action.sample_count));
  }

  if (!deps_.ledger->Snapshot().halted) {
    halt_notified_ = false;
  }

  // 11. 快照。
  PublishSnapshot(scores, summary);
  return summary;
}

}  // namespace hydra
