#include "risk/risk_ledger.h"

#include <algorithm>
#include <cmath>

#include "core/log.h"

namespace hydra {

namespace {

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;
// 浮点累加误差容忍（USD）。
constexpr double kExposureTolerance = 1e-6;

std::int64_t FloorDiv(std::int64_t value, std::int64_t divisor) {
  std::int64_t quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --quotient;
  }
  return quotient;
}

}  // namespace

RiskLedger::RiskLedger(RiskLimits limits) : limits_(limits) {
  state_.capital = limits_.starting_capital;
  state_.equity_high_water_mark = limits_.starting_capital;
  state_.daily_start_capital = limits_.starting_capital;
}

RiskState RiskLedger::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void RiskLedger::RestoreState(const RiskState& state) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = state;
}

std::int64_t RiskLedger::TradingDayOf(std::int64_t now_ms) const {
  const std::int64_t offset_ms =
      static_cast<std::int64_t>(limits_.trading_day_utc_offset_minutes) * 60000;
  return FloorDiv(now_ms + offset_ms, kMillisPerDay);
}

void RiskLedger::RollTradingDayLocked(RiskState* state,
                                      std::int64_t now_ms) const {
  const std::int64_t day = TradingDayOf(now_ms);
  if (state->trading_day == day) {
    return;
  }
  if (state->trading_day >= 0) {
    LogInfo("RISK_TRADING_DAY_ROLLOVER: day=" + std::to_string(day) +
            ", prev_daily_pnl=" + FormatFixed(state->daily_realized_pnl) +
            ", prev_trades=" + std::to_string(state->trades_today));
  }
  state->trading_day = day;
  state->daily_realized_pnl = 0.0;
  state->daily_start_capital = state->capital;
  state->trades_today = 0;
  state->kill_switch_tripped = false;
}

double RiskLedger::DailyLossLimit(const RiskState& state,
                                  const RiskLimits& limits) {
  const double base =
      state.daily_start_capital > 0.0 ? state.daily_start_capital : state.capital;
  return limits.max_daily_loss_fraction * base;
}

void RiskLedger::SubtractExposure(RiskState* state, const std::string& asset,
                                  double notional) {
  auto it = state->open_exposure_by_asset.find(asset);
  if (it == state->open_exposure_by_asset.end()) {
    return;
  }
  const double released = std::min(it->second, std::max(0.0, notional));
  it->second -= released;
  state->open_exposure_total = std::max(0.0, state->open_exposure_total - released);
  if (it->second <= kExposureTolerance) {
    state->open_exposure_total =
        std::max(0.0, state->open_exposure_total - it->second);
    state->open_exposure_by_asset.erase(it);
  }
}

void RiskLedger::ReleaseExposure(const std::string& asset, double notional) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubtractExposure(&state_, asset, notional);
}

CloseEffect RiskLedger::ApplyClose(const std::string& asset, double notional,
                                   double pnl, std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  CloseEffect effect;
  RollTradingDayLocked(&state_, now_ms);
  SubtractExposure(&state_, asset, notional);
  state_.capital += pnl;
  state_.daily_realized_pnl += pnl;
  state_.equity_high_water_mark =
      std::max(state_.equity_high_water_mark, state_.capital);

  if (pnl < 0.0) {
    ++state_.consecutive_losses;
    if (state_.consecutive_losses >= limits_.max_consecutive_losses) {
      state_.cooldown_until_ms = now_ms + limits_.cooldown_ms;
      effect.cooldown_armed_now = true;
    }
  } else if (pnl > 0.0) {
    state_.consecutive_losses = 0;
  }

  const double loss_limit = DailyLossLimit(state_, limits_);
  if (!state_.kill_switch_tripped && state_.daily_realized_pnl <= -loss_limit) {
    state_.kill_switch_tripped = true;
    effect.kill_switch_tripped_now = true;
  }
  return effect;
}

bool RiskLedger::ResumeAfterHalt(const std::string& operator_note) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.halted) {
    return false;
  }
  std::string error;
  if (!CheckInvariants(state_, &error)) {
    LogError("RISK_RESUME_REFUSED: 账本仍不满足不变量: " + error);
    return false;
  }
  LogInfo("RISK_HALT_CLEARED: reason=" + state_.halt_reason +
          ", note=" + operator_note);
  state_.halted = false;
  state_.halt_reason.clear();
  return true;
}

bool RiskLedger::CheckInvariants(const RiskState& state,
                                 std::string* out_error) {
  const auto fail = [&](const std::string& message) {
    if (out_error != nullptr) {
      *out_error = message;
    }
    return false;
  };
  if (!std::isfinite(state.capital) || !std::isfinite(state.open_exposure_total)) {
    return fail("资金或总敞口为非有限值");
  }
  double sum = 0.0;
  for (const auto& [asset, exposure] : state.open_exposure_by_asset) {
    if (!std::isfinite(exposure) || exposure < -kExposureTolerance) {
      return fail("资产敞口为负或非有限: " + asset);
    }
    sum += exposure;
  }
  if (std::fabs(sum - state.open_exposure_total) > kExposureTolerance) {
    return fail("分资产敞口之和与总敞口不一致: sum=" + FormatFixed(sum) +
                ", total=" + FormatFixed(state.open_exposure_total));
  }
  return true;
}

bool RiskLedger::CheckCaps(const RiskState& state, const RiskLimits& limits,
                           const std::string& asset, std::string* out_error) {
  const auto it = state.open_exposure_by_asset.find(asset);
  const double exposure = it == state.open_exposure_by_asset.end() ? 0.0 : it->second;
  const double asset_cap = limits.max_per_asset_fraction * state.capital;
  if (exposure > asset_cap + kExposureTolerance) {
    if (out_error != nullptr) {
      *out_error = "资产敞口超限: " + asset + "=" + FormatFixed(exposure) +
                   " > " + FormatFixed(asset_cap);
    }
    return false;
  }
  const double total_cap = limits.max_total_exposure_fraction * state.capital;
  if (state.open_exposure_total > total_cap + kExposureTolerance) {
    if (out_error != nullptr) {
      *out_error = "总敞口超限: " + FormatFixed(state.open_exposure_total) +
                   " > " + FormatFixed(total_cap);
    }
    return false;
  }
  return true;
}

}  // namespace hydra
