#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace hydra {

namespace {

// 轻量 YAML 解析：按缩进识别 section / subsection，仅覆盖本项目的键。
std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 仅剔除非引号上下文中的 `#` 注释。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      continue;
    }
    if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      continue;
    }
    if (ch == '#' && !in_single_quotes && !in_double_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

std::string ToLowerCopy(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ParseDouble(const std::string& text, double* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (!iss.fail() && iss.eof() && std::isfinite(value)) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& text, int* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseBool(const std::string& text, bool* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  const std::string lowered = ToLowerCopy(text);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

bool ParseStringList(const std::string& text,
                     std::vector<std::string>* out_items) {
  if (out_items == nullptr) {
    return false;
  }

  std::string trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return false;
  }
  trimmed = trimmed.substr(1, trimmed.size() - 2);
  out_items->clear();
  std::string token;
  std::istringstream iss(trimmed);
  while (std::getline(iss, token, ',')) {
    const std::string item = Trim(Unquote(Trim(token)));
    if (!item.empty()) {
      out_items->push_back(item);
    }
  }
  return true;
}

// 边格式：`LEADER>FOLLOWER:+1:0.8`。
bool ParseEdge(const std::string& text, CrossAssetEdge* out_edge) {
  const std::size_t arrow = text.find('>');
  if (arrow == std::string::npos) {
    return false;
  }
  const std::size_t first_colon = text.find(':', arrow);
  if (first_colon == std::string::npos) {
    return false;
  }
  const std::size_t second_colon = text.find(':', first_colon + 1);
  if (second_colon == std::string::npos) {
    return false;
  }
  CrossAssetEdge edge;
  edge.leader = Trim(text.substr(0, arrow));
  edge.follower = Trim(text.substr(arrow + 1, first_colon - arrow - 1));
  std::string sign_text =
      Trim(text.substr(first_colon + 1, second_colon - first_colon - 1));
  if (!sign_text.empty() && sign_text.front() == '+') {
    sign_text = sign_text.substr(1);
  }
  if (!ParseInt(sign_text, &edge.sign) || (edge.sign != 1 && edge.sign != -1)) {
    return false;
  }
  if (!ParseDouble(Trim(text.substr(second_colon + 1)), &edge.weight)) {
    return false;
  }
  if (edge.leader.empty() || edge.follower.empty()) {
    return false;
  }
  *out_edge = edge;
  return true;
}

/// 单键解析上下文：持有键路径与行号，统一错误文本。
class KeyWriter {
 public:
  KeyWriter(std::string path, std::string value, int line_no,
            std::string* out_error)
      : path_(std::move(path)),
        value_(std::move(value)),
        line_no_(line_no),
        out_error_(out_error) {}

  bool Double(double* target) const {
    return Fail(ParseDouble(value_, target));
  }
  bool Int(int* target) const { return Fail(ParseInt(value_, target)); }
  bool Bool(bool* target) const { return Fail(ParseBool(value_, target)); }
  bool List(std::vector<std::string>* target) const {
    return Fail(ParseStringList(value_, target));
  }
  bool String(std::string* target) const {
    *target = value_;
    return true;
  }
  /// 以分钟配置、以毫秒存储。
  bool Minutes(std::int64_t* target_ms) const {
    double minutes = 0.0;
    if (!Fail(ParseDouble(value_, &minutes))) {
      return false;
    }
    *target_ms = static_cast<std::int64_t>(std::llround(minutes * 60000.0));
    return true;
  }
  bool Edges(std::vector<CrossAssetEdge>* target) const {
    std::vector<std::string> items;
    if (!Fail(ParseStringList(value_, &items))) {
      return false;
    }
    std::vector<CrossAssetEdge> edges;
    for (const auto& item : items) {
      CrossAssetEdge edge;
      if (!Fail(ParseEdge(item, &edge))) {
        return false;
      }
      edges.push_back(edge);
    }
    *target = edges;
    return true;
  }

 private:
  bool Fail(bool ok) const {
    if (!ok && out_error_ != nullptr) {
      *out_error_ = path_ + " 解析失败，行号: " + std::to_string(line_no_);
    }
    return ok;
  }

  std::string path_;
  std::string value_;
  int line_no_{0};
  std::string* out_error_{nullptr};
};

enum class KeyResult { kApplied, kUnknown, kError };

KeyResult ToResult(bool ok) { return ok ? KeyResult::kApplied : KeyResult::kError; }

StrategyParams* FindStrategy(StrategiesConfig* strategies,
                             const std::string& name) {
  if (name == "liquidation_flow") return &strategies->liquidation_flow;
  if (name == "event_volatility") return &strategies->event_volatility;
  if (name == "margin_flow") return &strategies->margin_flow;
  if (name == "narrative_shock") return &strategies->narrative_shock;
  if (name == "cross_asset_graph") return &strategies->cross_asset_graph;
  return nullptr;
}

KeyResult ApplySystemKey(const std::string& key, const KeyWriter& w,
                         SystemConfig* system) {
  if (key == "mode") return ToResult(w.String(&system->mode));
  if (key == "cycle_interval_ms") return ToResult(w.Int(&system->cycle_interval_ms));
  if (key == "max_cycles") return ToResult(w.Int(&system->max_cycles));
  if (key == "status_log_interval_cycles") {
    return ToResult(w.Int(&system->status_log_interval_cycles));
  }
  return KeyResult::kUnknown;
}

KeyResult ApplyAggregatorKey(const std::string& key, const KeyWriter& w,
                             AggregatorConfig* aggregator) {
  if (key == "confidence_saturation") {
    return ToResult(w.Double(&aggregator->confidence_saturation));
  }
  if (key == "expiry_half_lives") {
    return ToResult(w.Double(&aggregator->expiry_half_lives));
  }
  return KeyResult::kUnknown;
}

KeyResult ApplyRegimeKey(const std::string& key, const KeyWriter& w,
                         RegimeConfig* regime) {
  if (key == "benchmark_asset") return ToResult(w.String(&regime->benchmark_asset));
  if (key == "volatility_index_asset") {
    return ToResult(w.String(&regime->volatility_index_asset));
  }
  if (key == "volatility_term_asset") {
    return ToResult(w.String(&regime->volatility_term_asset));
  }
  if (key == "history_bars") return ToResult(w.Int(&regime->history_bars));
  if (key == "min_samples") return ToResult(w.Int(&regime->min_samples));
  if (key == "short_vol_window") return ToResult(w.Int(&regime->short_vol_window));
  if (key == "long_vol_window") return ToResult(w.Int(&regime->long_vol_window));
  if (key == "bars_per_year") return ToResult(w.Double(&regime->bars_per_year));
  if (key == "crash_volatility") return ToResult(w.Double(&regime->crash_volatility));
  if (key == "crash_trend") return ToResult(w.Double(&regime->crash_trend));
  if (key == "high_volatility") return ToResult(w.Double(&regime->high_volatility));
  if (key == "recovery_volatility") {
    return ToResult(w.Double(&regime->recovery_volatility));
  }
  if (key == "recovery_trend") return ToResult(w.Double(&regime->recovery_trend));
  if (key == "trend_threshold") return ToResult(w.Double(&regime->trend_threshold));
  if (key == "trend_max_mean_reversion") {
    return ToResult(w.Double(&regime->trend_max_mean_reversion));
  }
  if (key == "mean_reversion_threshold") {
    return ToResult(w.Double(&regime->mean_reversion_threshold));
  }
  if (key == "min_confidence") return ToResult(w.Double(&regime->min_confidence));
  return KeyResult::kUnknown;
}

KeyResult ApplyRiskKey(const std::string& key, const KeyWriter& w,
                       RiskLimits* risk) {
  if (key == "starting_capital") return ToResult(w.Double(&risk->starting_capital));
  if (key == "max_per_position_fraction") {
    return ToResult(w.Double(&risk->max_per_position_fraction));
  }
  if (key == "max_per_asset_fraction") {
    return ToResult(w.Double(&risk->max_per_asset_fraction));
  }
  if (key == "max_total_exposure_fraction") {
    return ToResult(w.Double(&risk->max_total_exposure_fraction));
  }
  if (key == "max_daily_loss_fraction") {
    return ToResult(w.Double(&risk->max_daily_loss_fraction));
  }
  if (key == "max_trades_per_day") return ToResult(w.Int(&risk->max_trades_per_day));
  if (key == "max_consecutive_losses") {
    return ToResult(w.Int(&risk->max_consecutive_losses));
  }
  if (key == "cooldown_minutes") return ToResult(w.Minutes(&risk->cooldown_ms));
  if (key == "min_notional_usd") return ToResult(w.Double(&risk->min_notional_usd));
  if (key == "win_prob_base") return ToResult(w.Double(&risk->win_prob_base));
  if (key == "win_prob_confidence_slope") {
    return ToResult(w.Double(&risk->win_prob_confidence_slope));
  }
  if (key == "kelly_multiplier") return ToResult(w.Double(&risk->kelly_multiplier));
  if (key == "vol_scale_slope") return ToResult(w.Double(&risk->vol_scale_slope));
  if (key == "min_vol_scalar") return ToResult(w.Double(&risk->min_vol_scalar));
  if (key == "default_asset_volatility") {
    return ToResult(w.Double(&risk->default_asset_volatility));
  }
  if (key == "trading_day_utc_offset_minutes") {
    return ToResult(w.Int(&risk->trading_day_utc_offset_minutes));
  }
  return KeyResult::kUnknown;
}

KeyResult ApplyStrategyParamKey(const std::string& key, const KeyWriter& w,
                                StrategyParams* params) {
  if (key == "enabled") return ToResult(w.Bool(&params->enabled));
  if (key == "assets") return ToResult(w.List(&params->assets));
  if (key == "min_confidence") return ToResult(w.Double(&params->min_confidence));
  if (key == "min_abs_direction") {
    return ToResult(w.Double(&params->min_abs_direction));
  }
  if (key == "min_signal_count") return ToResult(w.Int(&params->min_signal_count));
  if (key == "min_regime_confidence") {
    return ToResult(w.Double(&params->min_regime_confidence));
  }
  if (key == "stop_pct") return ToResult(w.Double(&params->stop_pct));
  if (key == "target_pct") return ToResult(w.Double(&params->target_pct));
  if (key == "max_notional_usd") return ToResult(w.Double(&params->max_notional_usd));
  if (key == "trailing") return ToResult(w.Bool(&params->trailing));
  return KeyResult::kUnknown;
}

KeyResult ApplyStrategiesKey(const std::string& subsection,
                             const std::string& key, const KeyWriter& w,
                             StrategiesConfig* strategies) {
  if (subsection == "narrative_shock") {
    if (key == "leader_asset") {
      return ToResult(w.String(&strategies->narrative_leader_asset));
    }
    if (key == "impaired_assets") {
      return ToResult(w.List(&strategies->narrative_impaired_assets));
    }
    if (key == "punished_assets") {
      return ToResult(w.List(&strategies->narrative_punished_assets));
    }
  }
  if (subsection == "cross_asset_graph") {
    if (key == "edges") return ToResult(w.Edges(&strategies->cross_asset_edges));
    if (key == "max_follower_direction") {
      return ToResult(w.Double(&strategies->cross_asset_max_follower_direction));
    }
  }
  StrategyParams* params = FindStrategy(strategies, subsection);
  if (params == nullptr) {
    return KeyResult::kUnknown;
  }
  return ApplyStrategyParamKey(key, w, params);
}

KeyResult ApplyRankingKey(const std::string& key, const KeyWriter& w,
                          RankingConfig* ranking) {
  if (key == "top_k") return ToResult(w.Int(&ranking->top_k));
  if (key == "strategy_priority") return ToResult(w.List(&ranking->strategy_priority));
  return KeyResult::kUnknown;
}

KeyResult ApplyLifecycleKey(const std::string& key, const KeyWriter& w,
                            LifecycleConfig* lifecycle) {
  if (key == "trailing_activation_fraction") {
    return ToResult(w.Double(&lifecycle->trailing_activation_fraction));
  }
  if (key == "trailing_distance_r") {
    return ToResult(w.Double(&lifecycle->trailing_distance_r));
  }
  return KeyResult::kUnknown;
}

KeyResult ApplyWeightsKey(const std::string& key, const KeyWriter& w,
                          WeightConfig* weights) {
  if (key == "update_interval_cycles") {
    return ToResult(w.Int(&weights->update_interval_cycles));
  }
  if (key == "min_outcomes") return ToResult(w.Int(&weights->min_outcomes));
  if (key == "window") return ToResult(w.Int(&weights->window));
  if (key == "min_weight") return ToResult(w.Double(&weights->min_weight));
  if (key == "max_weight") return ToResult(w.Double(&weights->max_weight));
  if (key == "win_rate_multiplier") {
    return ToResult(w.Double(&weights->win_rate_multiplier));
  }
  return KeyResult::kUnknown;
}

KeyResult ApplyPriceFeedKey(const std::string& key, const KeyWriter& w,
                            PriceFeedConfig* feed) {
  if (key == "provider") return ToResult(w.String(&feed->provider));
  if (key == "base_url") return ToResult(w.String(&feed->base_url));
  if (key == "category") return ToResult(w.String(&feed->category));
  if (key == "kline_interval") return ToResult(w.String(&feed->kline_interval));
  if (key == "connect_timeout_ms") return ToResult(w.Int(&feed->connect_timeout_ms));
  if (key == "timeout_ms") return ToResult(w.Int(&feed->timeout_ms));
  if (key == "replay_path") return ToResult(w.String(&feed->replay_path));
  return KeyResult::kUnknown;
}

KeyResult ApplyExecutorKey(const std::string& key, const KeyWriter& w,
                           ExecutorConfig* executor) {
  if (key == "provider") return ToResult(w.String(&executor->provider));
  if (key == "submit_wait_ms") return ToResult(w.Int(&executor->submit_wait_ms));
  if (key == "order_stale_ms") return ToResult(w.Int(&executor->order_stale_ms));
  if (key == "paper_slippage_bps") {
    return ToResult(w.Double(&executor->paper_slippage_bps));
  }
  return KeyResult::kUnknown;
}

KeyResult ApplyNotifyKey(const std::string& key, const KeyWriter& w,
                         NotifyConfig* notify) {
  if (key == "enabled") return ToResult(w.Bool(&notify->enabled));
  if (key == "notify_rejections") return ToResult(w.Bool(&notify->notify_rejections));
  if (key == "queue_capacity") return ToResult(w.Int(&notify->queue_capacity));
  if (key == "telegram_api_base") return ToResult(w.String(&notify->telegram_api_base));
  if (key == "telegram_bot_token") {
    return ToResult(w.String(&notify->telegram_bot_token));
  }
  if (key == "telegram_chat_id") return ToResult(w.String(&notify->telegram_chat_id));
  if (key == "timeout_ms") return ToResult(w.Int(&notify->timeout_ms));
  return KeyResult::kUnknown;
}

KeyResult ApplyDashboardKey(const std::string& key, const KeyWriter& w,
                            DashboardConfig* dashboard) {
  if (key == "enabled") return ToResult(w.Bool(&dashboard->enabled));
  if (key == "bind_address") return ToResult(w.String(&dashboard->bind_address));
  if (key == "port") return ToResult(w.Int(&dashboard->port));
  if (key == "io_timeout_ms") return ToResult(w.Int(&dashboard->io_timeout_ms));
  return KeyResult::kUnknown;
}

KeyResult ApplyAdaptersKey(const std::string& subsection,
                           const std::string& key, const KeyWriter& w,
                           AdaptersConfig* adapters) {
  if (subsection == "funding") {
    if (key == "enabled") return ToResult(w.Bool(&adapters->funding_enabled));
    if (key == "base_url") return ToResult(w.String(&adapters->funding_base_url));
    if (key == "symbols") return ToResult(w.List(&adapters->funding_symbols));
    if (key == "poll_interval_ms") {
      return ToResult(w.Int(&adapters->funding_poll_interval_ms));
    }
    if (key == "extreme_rate") {
      return ToResult(w.Double(&adapters->funding_extreme_rate));
    }
    if (key == "open_interest_cascade_drop") {
      return ToResult(w.Double(&adapters->open_interest_cascade_drop));
    }
    if (key == "timeout_ms") return ToResult(w.Int(&adapters->funding_timeout_ms));
  }
  if (subsection == "spool") {
    if (key == "enabled") return ToResult(w.Bool(&adapters->spool_enabled));
    if (key == "path") return ToResult(w.String(&adapters->spool_path));
    if (key == "poll_interval_ms") {
      return ToResult(w.Int(&adapters->spool_poll_interval_ms));
    }
  }
  return KeyResult::kUnknown;
}

KeyResult ApplySignalSourceKey(const std::string& source_id,
                               const std::string& key, const KeyWriter& w,
                               std::vector<SignalSourceDefaults>* sources) {
  if (source_id.empty()) {
    return KeyResult::kUnknown;
  }
  auto it = std::find_if(sources->begin(), sources->end(),
                         [&](const SignalSourceDefaults& item) {
                           return item.source_id == source_id;
                         });
  if (it == sources->end()) {
    sources->push_back(SignalSourceDefaults{.source_id = source_id});
    it = sources->end() - 1;
  }
  if (key == "reliability_weight") return ToResult(w.Double(&it->reliability_weight));
  if (key == "half_life_minutes") return ToResult(w.Minutes(&it->half_life_ms));
  return KeyResult::kUnknown;
}

bool CheckFraction(double value, const char* path, std::string* out_error) {
  if (value > 0.0 && value <= 1.0) {
    return true;
  }
  if (out_error != nullptr) {
    *out_error = std::string(path) + " 必须在 (0,1] 范围内";
  }
  return false;
}

bool CheckPositive(double value, const char* path, std::string* out_error) {
  if (value > 0.0) {
    return true;
  }
  if (out_error != nullptr) {
    *out_error = std::string(path) + " 必须大于 0";
  }
  return false;
}

bool CheckStrategy(const StrategyParams& params, const std::string& name,
                   std::string* out_error) {
  if (params.stop_pct <= 0.0 || params.target_pct <= 0.0) {
    if (out_error != nullptr) {
      *out_error = "strategies." + name + " stop_pct/target_pct 必须大于 0";
    }
    return false;
  }
  if (params.min_confidence < 0.0 || params.min_confidence > 1.0 ||
      params.min_regime_confidence < 0.0 || params.min_regime_confidence > 1.0) {
    if (out_error != nullptr) {
      *out_error = "strategies." + name + " 置信度阈值必须在 [0,1] 范围内";
    }
    return false;
  }
  if (params.min_signal_count < 0 || params.max_notional_usd < 0.0) {
    if (out_error != nullptr) {
      *out_error = "strategies." + name + " 参数不能为负数";
    }
    return false;
  }
  return true;
}

}  // namespace

SignalSourceDefaults AppConfig::SourceDefaults(const std::string& source_id) const {
  for (const auto& item : signal_sources) {
    if (item.source_id == source_id) {
      return item;
    }
  }
  return SignalSourceDefaults{.source_id = source_id};
}

std::vector<std::string> AppConfig::WatchedAssets() const {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  const auto add = [&](const std::string& asset) {
    if (!asset.empty() && seen.insert(asset).second) {
      out.push_back(asset);
    }
  };
  add(regime.benchmark_asset);
  for (const StrategyParams* params :
       {&strategies.liquidation_flow, &strategies.event_volatility,
        &strategies.margin_flow, &strategies.narrative_shock,
        &strategies.cross_asset_graph}) {
    for (const auto& asset : params->assets) {
      add(asset);
    }
  }
  add(strategies.narrative_leader_asset);
  for (const auto& asset : strategies.narrative_impaired_assets) add(asset);
  for (const auto& asset : strategies.narrative_punished_assets) add(asset);
  for (const auto& edge : strategies.cross_asset_edges) {
    add(edge.leader);
    add(edge.follower);
  }
  return out;
}

bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error) {
  if (out_config == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_config 为空";
    }
    return false;
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开配置文件: " + file_path;
    }
    return false;
  }

  AppConfig config = *out_config;
  std::string current_section;
  std::string current_subsection;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string no_comment = Trim(StripInlineComment(line));
    if (no_comment.empty()) {
      continue;
    }

    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }

    if (indent == 0 && no_comment.back() == ':') {
      current_section = Trim(no_comment.substr(0, no_comment.size() - 1));
      current_subsection.clear();
      continue;
    }

    if (indent < 2) {
      continue;
    }

    if (indent == 2 && no_comment.back() == ':') {
      current_subsection = Trim(no_comment.substr(0, no_comment.size() - 1));
      continue;
    }

    const std::size_t colon_pos = no_comment.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(no_comment.substr(0, colon_pos));
    const std::string raw_value = Trim(no_comment.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    if (indent <= 2) {
      current_subsection.clear();
    }

    std::string path = current_section;
    if (!current_subsection.empty()) {
      path += "." + current_subsection;
    }
    path += "." + key;
    const KeyWriter writer(path, Unquote(raw_value), line_no, out_error);

    KeyResult result = KeyResult::kUnknown;
    if (current_section == "system") {
      result = ApplySystemKey(key, writer, &config.system);
    } else if (current_section == "aggregator") {
      result = ApplyAggregatorKey(key, writer, &config.aggregator);
    } else if (current_section == "regime") {
      result = ApplyRegimeKey(key, writer, &config.regime);
    } else if (current_section == "risk") {
      result = ApplyRiskKey(key, writer, &config.risk);
    } else if (current_section == "strategies") {
      result = ApplyStrategiesKey(current_subsection, key, writer,
                                  &config.strategies);
    } else if (current_section == "ranking") {
      result = ApplyRankingKey(key, writer, &config.ranking);
    } else if (current_section == "lifecycle") {
      result = ApplyLifecycleKey(key, writer, &config.lifecycle);
    } else if (current_section == "weights") {
      result = ApplyWeightsKey(key, writer, &config.weights);
    } else if (current_section == "price_feed") {
      result = ApplyPriceFeedKey(key, writer, &config.price_feed);
    } else if (current_section == "executor") {
      result = ApplyExecutorKey(key, writer, &config.executor);
    } else if (current_section == "notify") {
      result = ApplyNotifyKey(key, writer, &config.notify);
    } else if (current_section == "dashboard") {
      result = ApplyDashboardKey(key, writer, &config.dashboard);
    } else if (current_section == "adapters") {
      result = ApplyAdaptersKey(current_subsection, key, writer,
                                &config.adapters);
    } else if (current_section == "signal_sources") {
      result = ApplySignalSourceKey(current_subsection, key, writer,
                                    &config.signal_sources);
    }
    if (result == KeyResult::kError) {
      return false;
    }
    // 未识别的键忽略，便于配置文件向前兼容。
  }

  if (!ValidateAppConfig(config, out_error)) {
    return false;
  }
  *out_config = config;
  return true;
}

bool ValidateAppConfig(const AppConfig& config, std::string* out_error) {
  if (config.system.mode != "replay" && config.system.mode != "paper") {
    if (out_error != nullptr) {
      *out_error = "system.mode 仅支持 replay/paper: " + config.system.mode;
    }
    return false;
  }
  if (config.system.cycle_interval_ms <= 0) {
    if (out_error != nullptr) {
      *out_error = "system.cycle_interval_ms 必须大于 0";
    }
    return false;
  }
  if (config.system.max_cycles < 0 ||
      config.system.status_log_interval_cycles < 0) {
    if (out_error != nullptr) {
      *out_error = "system.max_cycles/status_log_interval_cycles 不能为负数";
    }
    return false;
  }
  if (!CheckPositive(config.aggregator.confidence_saturation,
                     "aggregator.confidence_saturation", out_error) ||
      !CheckPositive(config.aggregator.expiry_half_lives,
                     "aggregator.expiry_half_lives", out_error)) {
    return false;
  }

  const RegimeConfig& regime = config.regime;
  if (regime.benchmark_asset.empty()) {
    if (out_error != nullptr) {
      *out_error = "regime.benchmark_asset 不能为空";
    }
    return false;
  }
  if (regime.short_vol_window < 2 ||
      regime.long_vol_window <= regime.short_vol_window) {
    if (out_error != nullptr) {
      *out_error = "regime 波动率窗口需满足 2 <= short < long";
    }
    return false;
  }
  if (regime.min_samples < 2 || regime.history_bars < regime.min_samples) {
    if (out_error != nullptr) {
      *out_error = "regime.history_bars 不能小于 regime.min_samples";
    }
    return false;
  }
  if (!CheckPositive(regime.bars_per_year, "regime.bars_per_year", out_error)) {
    return false;
  }
  if (regime.high_volatility > regime.crash_volatility) {
    if (out_error != nullptr) {
      *out_error = "regime.high_volatility 不能大于 regime.crash_volatility";
    }
    return false;
  }
  if (regime.min_confidence < 0.0 || regime.min_confidence > 1.0) {
    if (out_error != nullptr) {
      *out_error = "regime.min_confidence 必须在 [0,1] 范围内";
    }
    return false;
  }

  const RiskLimits& risk = config.risk;
  if (!CheckPositive(risk.starting_capital, "risk.starting_capital", out_error) ||
      !CheckFraction(risk.max_per_position_fraction,
                     "risk.max_per_position_fraction", out_error) ||
      !CheckFraction(risk.max_per_asset_fraction,
                     "risk.max_per_asset_fraction", out_error) ||
      !CheckFraction(risk.max_total_exposure_fraction,
                     "risk.max_total_exposure_fraction", out_error) ||
      !CheckFraction(risk.max_daily_loss_fraction,
                     "risk.max_daily_loss_fraction", out_error) ||
      !CheckFraction(risk.kelly_multiplier, "risk.kelly_multiplier", out_error) ||
      !CheckFraction(risk.min_vol_scalar, "risk.min_vol_scalar", out_error)) {
    return false;
  }
  if (risk.max_per_position_fraction > risk.max_per_asset_fraction ||
      risk.max_per_asset_fraction > risk.max_total_exposure_fraction) {
    if (out_error != nullptr) {
      *out_error = "risk 限额需满足 per_position <= per_asset <= total";
    }
    return false;
  }
  if (risk.max_trades_per_day <= 0 || risk.max_consecutive_losses <= 0 ||
      risk.cooldown_ms < 0 || risk.min_notional_usd < 0.0) {
    if (out_error != nullptr) {
      *out_error = "risk 交易次数/连亏/冷却参数非法";
    }
    return false;
  }
  const double max_win_prob =
      risk.win_prob_base + risk.win_prob_confidence_slope;
  if (risk.win_prob_base <= 0.0 || risk.win_prob_confidence_slope < 0.0 ||
      max_win_prob >= 1.0) {
    if (out_error != nullptr) {
      *out_error = "risk.win_prob_base/win_prob_confidence_slope 需使胜率落在 (0,1)";
    }
    return false;
  }
  if (risk.vol_scale_slope < 0.0 || risk.default_asset_volatility < 0.0) {
    if (out_error != nullptr) {
      *out_error = "risk.vol_scale_slope/default_asset_volatility 不能为负数";
    }
    return false;
  }

  const StrategiesConfig& strategies = config.strategies;
  if (!CheckStrategy(strategies.liquidation_flow, "liquidation_flow", out_error) ||
      !CheckStrategy(strategies.event_volatility, "event_volatility", out_error) ||
      !CheckStrategy(strategies.margin_flow, "margin_flow", out_error) ||
      !CheckStrategy(strategies.narrative_shock, "narrative_shock", out_error) ||
      !CheckStrategy(strategies.cross_asset_graph, "cross_asset_graph",
                     out_error)) {
    return false;
  }
  for (const auto& edge : strategies.cross_asset_edges) {
    if (edge.leader == edge.follower || edge.weight <= 0.0) {
      if (out_error != nullptr) {
        *out_error = "strategies.cross_asset_graph.edges 非法边: " +
                     edge.leader + ">" + edge.follower;
      }
      return false;
    }
  }

  if (config.ranking.top_k <= 0) {
    if (out_error != nullptr) {
      *out_error = "ranking.top_k 必须大于 0";
    }
    return false;
  }
  if (!CheckFraction(config.lifecycle.trailing_activation_fraction,
                     "lifecycle.trailing_activation_fraction", out_error) ||
      !CheckPositive(config.lifecycle.trailing_distance_r,
                     "lifecycle.trailing_distance_r", out_error)) {
    return false;
  }

  const WeightConfig& weights = config.weights;
  if (weights.update_interval_cycles <= 0 || weights.window <= 0 ||
      weights.min_outcomes <= 0 || weights.min_outcomes > weights.window) {
    if (out_error != nullptr) {
      *out_error = "weights 窗口参数非法（需 0 < min_outcomes <= window）";
    }
    return false;
  }
  if (weights.min_weight <= 0.0 || weights.max_weight < weights.min_weight) {
    if (out_error != nullptr) {
      *out_error = "weights.min_weight/max_weight 非法";
    }
    return false;
  }

  if (config.price_feed.provider != "replay" &&
      config.price_feed.provider != "bybit") {
    if (out_error != nullptr) {
      *out_error = "price_feed.provider 仅支持 replay/bybit";
    }
    return false;
  }
  if (config.executor.provider != "paper") {
    if (out_error != nullptr) {
      *out_error = "executor.provider 仅支持 paper";
    }
    return false;
  }
  if (config.executor.submit_wait_ms < 0 || config.executor.order_stale_ms <= 0) {
    if (out_error != nullptr) {
      *out_error = "executor.submit_wait_ms/order_stale_ms 非法";
    }
    return false;
  }
  if (config.notify.queue_capacity <= 0) {
    if (out_error != nullptr) {
      *out_error = "notify.queue_capacity 必须大于 0";
    }
    return false;
  }
  if (config.dashboard.port <= 0 || config.dashboard.port > 65535) {
    if (out_error != nullptr) {
      *out_error = "dashboard.port 超出范围";
    }
    return false;
  }
  if (config.dashboard.io_timeout_ms <= 0) {
    if (out_error != nullptr) {
      *out_error = "dashboard.io_timeout_ms 必须大于 0";
    }
    return false;
  }
  for (const auto& source : config.signal_sources) {
    if (source.reliability_weight <= 0.0 || source.reliability_weight > 1.0 ||
        source.half_life_ms <= 0) {
      if (out_error != nullptr) {
        *out_error = "signal_sources." + source.source_id +
                     " reliability_weight 需在 (0,1]，half_life 需大于 0";
      }
      return false;
    }
  }
  return true;
}

void ApplyEnvironmentOverrides(AppConfig* config) {
  if (config == nullptr) {
    return;
  }
  if (const char* token = std::getenv("HYDRA_TELEGRAM_BOT_TOKEN");
      token != nullptr && token[0] != '\0') {
    config->notify.telegram_bot_token = token;
  }
  if (const char* chat = std::getenv("HYDRA_TELEGRAM_CHAT_ID");
      chat != nullptr && chat[0] != '\0') {
    config->notify.telegram_chat_id = chat;
  }
}

}  // namespace hydra
