#include "oms/position_manager.h"

#include <algorithm>
#include <cmath>

#include "core/log.h"

namespace hydra {

namespace {

constexpr double kEpsilon = 1e-12;

}  // namespace

std::optional<Position> PositionManager::OpenFromFill(const ApprovedOrder& order,
                                                      const FillReport& fill,
                                                      std::int64_t now_ms) {
  const TradeProposal& proposal = order.proposal;
  if (!fill.filled || !std::isfinite(fill.fill_price) || fill.fill_price <= 0.0 ||
      !std::isfinite(fill.filled_notional) || fill.filled_notional <= 0.0) {
    return std::nullopt;
  }
  const int d = proposal.direction;
  const double stop_distance = std::fabs(proposal.entry - proposal.stop);
  const double target_distance = std::fabs(proposal.target - proposal.entry);

  Position position;
  position.position_id = "pos-" + std::to_string(++position_seq_) + "-" +
                         proposal.asset;
  position.asset = proposal.asset;
  position.direction = d;
  position.entry_price = fill.fill_price;
  // 以成交价重锚：保持提案的止损/止盈距离（即保持 R）。
  position.stop = fill.fill_price - d * stop_distance;
  position.initial_stop = position.stop;
  position.target = fill.fill_price + d * target_distance;
  position.trailing.enabled = proposal.trailing_enabled;
  position.trailing.best_price = fill.fill_price;
  position.notional = fill.filled_notional;
  position.quantity = fill.filled_notional / fill.fill_price;
  position.opened_at_ms = now_ms;
  position.owning_strategy_id = proposal.strategy_id;
  if (position.stop <= 0.0) {
    return std::nullopt;
  }
  positions_[position.position_id] = position;
  return position;
}

bool PositionManager::AdvanceTrailing(Position* position, double price,
                                      const LifecycleConfig& config) {
  if (position == nullptr || !position->trailing.enabled) {
    return false;
  }
  const int d = position->direction;
  if (d * (price - position->trailing.best_price) > 0.0) {
    position->trailing.best_price = price;
  }
  const double target_distance = std::fabs(position->target - position->entry_price);
  if (!position->trailing.activated && target_distance > kEpsilon) {
    const double progress =
        d * (position->trailing.best_price - position->entry_price) / target_distance;
    if (progress >= config.trailing_activation_fraction) {
      position->trailing.activated = true;
    }
  }
  if (!position->trailing.activated) {
    return false;
  }
  const double initial_risk =
      std::fabs(position->entry_price - position->initial_stop);
  double candidate =
      position->trailing.best_price - d * config.trailing_distance_r * initial_risk;
  // 至少保本。
  if (d > 0) {
    candidate = std::max(candidate, position->entry_price);
  } else {
    candidate = std::min(candidate, position->entry_price);
  }
  // 只收紧。
  if (d * (candidate - position->stop) > kEpsilon) {
    position->stop = candidate;
    return true;
  }
  return false;
}

std::optional<ExitReason> PositionManager::CheckExit(const Position& position,
                                                     double price) {
  const int d = position.direction;
  if (d * (price - position.stop) <= 0.0) {
    const bool ratcheted =
        std::fabs(position.stop - position.initial_stop) > kEpsilon;
    return ratcheted ? ExitReason::kTrailingStop : ExitReason::kStop;
  }
  if (d * (price - position.target) >= 0.0) {
    return ExitReason::kTarget;
  }
  return std::nullopt;
}

double PositionManager::RealizedPnl(const Position& position, double exit_price) {
  return position.direction * position.quantity *
         (exit_price - position.entry_price);
}

double PositionManager::RMultiple(const Position& position, double pnl) {
  const double risk_usd =
      position.quantity * std::fabs(position.entry_price - position.initial_stop);
  if (risk_usd <= kEpsilon) {
    return 0.0;
  }
  return pnl / risk_usd;
}

ClosedPosition PositionManager::Close(const Position& position,
                                      double exit_price, ExitReason reason,
                                      RiskLedger* ledger, std::int64_t now_ms) {
  ClosedPosition closed;
  closed.position = position;
  const double pnl = RealizedPnl(position, exit_price);
  closed.outcome = RealizedOutcome{
      .position_id = position.position_id,
      .strategy_id = position.owning_strategy_id,
      .asset = position.asset,
      .exit_price = exit_price,
      .pnl = pnl,
      .r_multiple = RMultiple(position, pnl),
      .win = pnl > 0.0,
      .exit_reason = reason,
      .closed_at_ms = now_ms,
  };
  if (ledger != nullptr) {
    closed.ledger_effect =
        ledger->ApplyClose(position.asset, position.notional, pnl, now_ms);
  }
  positions_.erase(position.position_id);
  LogInfo("POSITION_CLOSED: id=" + position.position_id +
          ", asset=" + position.asset +
          ", strategy=" + position.owning_strategy_id +
          ", reason=" + ToString(reason) +
          ", exit=" + FormatFixed(exit_price, 4) +
          ", pnl=" + FormatFixed(pnl) +
          ", r=" + FormatFixed(closed.outcome.r_multiple, 2));
  return closed;
}

std::optional<ClosedPosition> PositionManager::OnPrice(
    const std::string& position_id, double price, RiskLedger* ledger,
    std::int64_t now_ms) {
  auto it = positions_.find(position_id);
  if (it == positions_.end() || !std::isfinite(price) || price <= 0.0) {
    return std::nullopt;
  }
  Position& position = it->second;
  position.unpriced_cycles = 0;
  AdvanceTrailing(&position, price, config_);
  const auto reason = CheckExit(position, price);
  if (!reason.has_value()) {
    return std::nullopt;
  }
  const Position snapshot = position;
  return Close(snapshot, price, *reason, ledger, now_ms);
}

LifecycleReport PositionManager::OnCycle(const PriceFeed& feed,
                                         RiskLedger* ledger,
                                         std::int64_t now_ms) {
  LifecycleReport report;
  std::vector<std::string> ids;
  ids.reserve(positions_.size());
  for (const auto& [id, position] : positions_) {
    ids.push_back(id);
  }
  for (const auto& id : ids) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
      continue;
    }
    double price = 0.0;
    std::string error;
    if (!feed.GetPrice(it->second.asset, &price, &error) ||
        !std::isfinite(price) || price <= 0.0) {
      ++it->second.unpriced_cycles;
      report.unpriced.push_back(it->second);
      LogError("POSITION_UNPRICED: id=" + id + ", asset=" + it->second.asset +
               ", cycles=" + std::to_string(it->second.unpriced_cycles) +
               ", error=" + error);
      continue;
    }
    const double stop_before = it->second.stop;
    it->second.unpriced_cycles = 0;
    if (AdvanceTrailing(&it->second, price, config_)) {
      ++report.trailing_adjustments;
      LogInfo("TRAILING_STOP_MOVED: id=" + id + ", stop=" +
              FormatFixed(stop_before, 4) + " -> " +
              FormatFixed(it->second.stop, 4));
    }
    const auto reason = CheckExit(it->second, price);
    if (reason.has_value()) {
      const Position snapshot = it->second;
      report.closed.push_back(Close(snapshot, price, *reason, ledger, now_ms));
    }
  }
  return report;
}

std::optional<ClosedPosition> PositionManager::ManualExit(
    const std::string& position_id, double price, RiskLedger* ledger,
    std::int64_t now_ms) {
  const auto it = positions_.find(position_id);
  if (it == positions_.end() || !std::isfinite(price) || price <= 0.0) {
    return std::nullopt;
  }
  const Position snapshot = it->second;
  return Close(snapshot, price, ExitReason::kManual, ledger, now_ms);
}

std::vector<Position> PositionManager::OpenPositions() const {
  std::vector<Position> out;
  out.reserve(positions_.size());
  for (const auto& [id, position] : positions_) {
    out.push_back(position);
  }
  return out;
}

std::optional<Position> PositionManager::Find(const std::string& position_id) const {
  const auto it = positions_.find(position_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace hydra
