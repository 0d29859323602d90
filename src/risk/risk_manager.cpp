#include "risk/risk_manager.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "core/log.h"

namespace hydra {

namespace {

RiskDecision Reject(RejectReason reason, std::string detail) {
  RiskDecision decision;
  decision.approved = false;
  decision.reason = reason;
  decision.detail = std::move(detail);
  return decision;
}

}  // namespace

double RiskManager::WinProbability(const RiskLimits& limits, double confidence) {
  const double p = limits.win_prob_base +
                   limits.win_prob_confidence_slope * std::clamp(confidence, 0.0, 1.0);
  return std::clamp(p, 0.0, 1.0);
}

double RiskManager::KellyFraction(double reward_to_risk, double win_probability) {
  if (reward_to_risk <= 0.0) {
    return 0.0;
  }
  return (reward_to_risk * win_probability - (1.0 - win_probability)) /
         reward_to_risk;
}

double RiskManager::VolatilityScalar(const RiskLimits& limits,
                                     double daily_volatility) {
  return std::clamp(1.0 - limits.vol_scale_slope * std::max(0.0, daily_volatility),
                    limits.min_vol_scalar, 1.0);
}

bool RiskManager::ValidateProposal(const TradeProposal& proposal,
                                   std::string* out_error) {
  const auto fail = [&](const char* message) {
    if (out_error != nullptr) {
      *out_error = message;
    }
    return false;
  };
  if (proposal.asset.empty() || proposal.strategy_id.empty()) {
    return fail("asset/strategy_id 为空");
  }
  if (!std::isfinite(proposal.entry) || !std::isfinite(proposal.stop) ||
      !std::isfinite(proposal.target) || !std::isfinite(proposal.confidence) ||
      !std::isfinite(proposal.reward_to_risk) ||
      !std::isfinite(proposal.requested_notional)) {
    return fail("提案包含非有限数值");
  }
  if (proposal.direction != 1 && proposal.direction != -1) {
    return fail("direction 必须为 +1/-1");
  }
  if (proposal.entry <= 0.0) {
    return fail("entry 必须大于 0");
  }
  if (proposal.confidence < 0.0 || proposal.confidence > 1.0) {
    return fail("confidence 超出 [0,1]");
  }
  const int d = proposal.direction;
  if (d * (proposal.entry - proposal.stop) <= 0.0) {
    return fail("止损位于错误一侧");
  }
  if (d * (proposal.target - proposal.entry) <= 0.0) {
    return fail("止盈位于错误一侧");
  }
  if (proposal.reward_to_risk <= 0.0) {
    return fail("reward_to_risk 必须大于 0");
  }
  return true;
}

RiskDecision RiskManager::Evaluate(const TradeProposal& proposal,
                                   RiskLedger* ledger, std::int64_t now_ms,
                                   std::optional<double> asset_volatility) const {
  if (ledger == nullptr) {
    return Reject(RejectReason::kHalted, "ledger 为空");
  }
  const RiskLimits& limits = ledger->limits();

  return ledger->Exclusive([&](RiskState& state) -> RiskDecision {
    ledger->RollTradingDayLocked(&state, now_ms);
    if (state.halted) {
      return Reject(RejectReason::kHalted, "账本已锁死: " + state.halt_reason);
    }

    // 1. 日内熔断（锁存，当日不再放行）。
    const double loss_limit = RiskLedger::DailyLossLimit(state, limits);
    if (state.kill_switch_tripped || state.daily_realized_pnl <= -loss_limit) {
      state.kill_switch_tripped = true;
      return Reject(RejectReason::kKillSwitch,
                    "daily_pnl=" + FormatFixed(state.daily_realized_pnl) +
                        ", limit=-" + FormatFixed(loss_limit));
    }

    // 2. 连亏冷却。
    if (now_ms < state.cooldown_until_ms) {
      return Reject(RejectReason::kCooldown,
                    "cooldown_until_ms=" + std::to_string(state.cooldown_until_ms));
    }

    // 3. 日交易次数上限。
    if (state.trades_today >= limits.max_trades_per_day) {
      return Reject(RejectReason::kDailyTradeCap,
                    "trades_today=" + std::to_string(state.trades_today));
    }

    // 4. 提案合法性。
    std::string invalid_reason;
    if (!ValidateProposal(proposal, &invalid_reason)) {
      return Reject(RejectReason::kInvalidProposal, invalid_reason);
    }

    // 5. half-Kelly 定量 + 波动率缩放。
    const double p = WinProbability(limits, proposal.confidence);
    const double kelly = KellyFraction(proposal.reward_to_risk, p);
    const double scaled_kelly = std::max(0.0, kelly * limits.kelly_multiplier);
    double vol = limits.default_asset_volatility;
    if (asset_volatility.has_value() && std::isfinite(*asset_volatility) &&
        *asset_volatility >= 0.0) {
      vol = *asset_volatility;
    }
    const double vol_scalar = VolatilityScalar(limits, vol);
    double size = state.capital * scaled_kelly * vol_scalar;
    if (proposal.requested_notional > 0.0) {
      size = std::min(size, proposal.requested_notional);
    }
    if (size <= limits.min_notional_usd) {
      RiskDecision decision = Reject(
          RejectReason::kSizeTooSmall,
          "kelly=" + FormatFixed(kelly, 4) + ", size=" + FormatFixed(size));
      decision.kelly_fraction = scaled_kelly;
      decision.vol_scalar = vol_scalar;
      return decision;
    }

    // 6-8. 单仓 / 单资产 / 总敞口裁剪。
    bool clamped = false;
    const double position_cap = limits.max_per_position_fraction * state.capital;
    if (size > position_cap) {
      size = position_cap;
      clamped = true;
    }
    const auto asset_it = state.open_exposure_by_asset.find(proposal.asset);
    const double asset_exposure =
        asset_it == state.open_exposure_by_asset.end() ? 0.0 : asset_it->second;
    const double asset_room =
        limits.max_per_asset_fraction * state.capital - asset_exposure;
    if (size > asset_room) {
      size = asset_room;
      clamped = true;
    }
    if (size <= limits.min_notional_usd) {
      return Reject(RejectReason::kExposureLimit,
                    "资产敞口已满: " + proposal.asset + "=" +
                        FormatFixed(asset_exposure));
    }
    const double total_room =
        limits.max_total_exposure_fraction * state.capital -
        state.open_exposure_total;
    if (size > total_room) {
      size = total_room;
      clamped = true;
    }
    if (size <= limits.min_notional_usd) {
      return Reject(RejectReason::kExposureLimit,
                    "总敞口已满: " + FormatFixed(state.open_exposure_total));
    }

    // 9. 入账并复核不变量；失败回滚并锁死。
    const RiskState before = state;
    state.open_exposure_by_asset[proposal.asset] += size;
    state.open_exposure_total += size;
    ++state.trades_today;
    std::string violation;
    if (!RiskLedger::CheckInvariants(state, &violation) ||
        !RiskLedger::CheckCaps(state, limits, proposal.asset, &violation)) {
      state = before;
      state.halted = true;
      state.halt_reason = violation;
      LogError("RISK_INVARIANT_VIOLATION: strategy=" + proposal.strategy_id +
               ", asset=" + proposal.asset + ", detail=" + violation);
      return Reject(RejectReason::kHalted, violation);
    }

    RiskDecision decision;
    decision.approved = true;
    decision.sized_notional = size;
    decision.clamped = clamped;
    decision.kelly_fraction = scaled_kelly;
    decision.vol_scalar = vol_scalar;
    decision.detail = "p=" + FormatFixed(p, 3) + ", kelly=" +
                      FormatFixed(scaled_kelly, 4) + ", vol_scalar=" +
                      FormatFixed(vol_scalar, 3);
    return decision;
  });
}

}  // namespace hydra
