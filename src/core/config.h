#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.h"

namespace hydra {

/// 周期驱动参数。
struct SystemConfig {
  std::string mode{"replay"};          ///< replay / paper
  int cycle_interval_ms{60000};        ///< 固定周期（默认 60s）。
  int max_cycles{0};                   ///< 0 表示不限（需配合 run_forever）。
  int status_log_interval_cycles{10};  ///< 周期摘要日志间隔。
};

/// Signal 聚合参数。
struct AggregatorConfig {
  double confidence_saturation{1.5};   ///< 有效权重和达到该值时 confidence=1。
  double expiry_half_lives{5.0};       ///< 超过 N 个半衰期的信号视为过期。
};

/// Regime 识别配置：特征窗口与分类阈值。
struct RegimeConfig {
  std::string benchmark_asset{"SPY"};
  std::string volatility_index_asset;  ///< 非空时用其最新价覆盖 volatility_level。
  std::string volatility_term_asset;   ///< 远月波动率指数；与上者配合计算期限斜率。
  int history_bars{120};
  int min_samples{20};                 ///< 样本不足时输出 UNKNOWN。
  int short_vol_window{10};
  int long_vol_window{60};
  double bars_per_year{98280.0};       ///< 默认 1 分钟 bar（252 * 390）。
  double crash_volatility{30.0};
  double crash_trend{0.5};
  double high_volatility{22.0};
  double recovery_volatility{18.0};
  double recovery_trend{0.1};
  double trend_threshold{0.3};
  double trend_max_mean_reversion{0.4};
  double mean_reversion_threshold{0.55};
  double min_confidence{0.3};          ///< 低于该置信度的分类按 UNKNOWN 处理。
};

/// 风控硬限额与定量参数（不可被任何策略覆盖）。
struct RiskLimits {
  double starting_capital{100000.0};
  double max_per_position_fraction{0.03};
  double max_per_asset_fraction{0.05};
  double max_total_exposure_fraction{0.25};
  double max_daily_loss_fraction{0.05};
  int max_trades_per_day{30};
  int max_consecutive_losses{3};
  std::int64_t cooldown_ms{4LL * 60 * 60 * 1000};
  double min_notional_usd{1.0};
  // win_prob = base + slope * confidence（线性映射，落在 [0.50, 0.62]）。
  double win_prob_base{0.50};
  double win_prob_confidence_slope{0.12};
  double kelly_multiplier{0.5};        ///< half-Kelly。
  // vol_scalar = clamp(1 - slope * daily_vol, min_vol_scalar, 1)。
  double vol_scale_slope{2.0};
  double min_vol_scalar{0.3};
  double default_asset_volatility{0.02};
  int trading_day_utc_offset_minutes{0};
};

/// 单个策略模块的通用参数。
struct StrategyParams {
  bool enabled{true};
  std::vector<std::string> assets;
  double min_confidence{0.5};
  double min_abs_direction{0.2};
  int min_signal_count{1};
  double min_regime_confidence{0.4};
  double stop_pct{0.02};
  double target_pct{0.04};
  double max_notional_usd{0.0};        ///< 0 表示不限，由风控定量。
  bool trailing{true};
};

/// 跨资产信号图的一条边：leader 领先 follower。
struct CrossAssetEdge {
  std::string leader;
  std::string follower;
  int sign{1};
  double weight{0.8};
};

/// 五个策略模块配置。
struct StrategiesConfig {
  StrategyParams liquidation_flow{
      .assets = {"BTCUSDT", "ETHUSDT"},
      .min_confidence = 0.5,
      .min_abs_direction = 0.2,
      .min_signal_count = 2,
      .stop_pct = 0.015,
      .target_pct = 0.04,
  };
  StrategyParams event_volatility{
      .assets = {"SPY", "TLT", "GLD"},
      .min_confidence = 0.45,
      .min_abs_direction = 0.25,
      .stop_pct = 0.008,
      .target_pct = 0.016,
  };
  StrategyParams margin_flow{
      .assets = {"GLD", "SLV", "GDX"},
      .min_confidence = 0.5,
      .min_abs_direction = 0.3,
      .stop_pct = 0.03,
      .target_pct = 0.06,
  };
  StrategyParams narrative_shock{
      .assets = {},
      .min_confidence = 0.5,
      .min_abs_direction = 0.3,
      .stop_pct = 0.05,
      .target_pct = 0.15,
      .trailing = false,
  };
  StrategyParams cross_asset_graph{
      .assets = {},
      .min_confidence = 0.5,
      .min_abs_direction = 0.3,
      .stop_pct = 0.03,
      .target_pct = 0.05,
  };
  std::string narrative_leader_asset{"IGV"};
  std::vector<std::string> narrative_impaired_assets{"LZ"};
  std::vector<std::string> narrative_punished_assets{"CRM", "SHOP", "ADBE",
                                                     "MSFT", "WDAY"};
  std::vector<CrossAssetEdge> cross_asset_edges{
      {"HYG", "SPY", 1, 0.8},
      {"TLT", "SPY", -1, 0.6},
      {"SPY", "TLT", -1, 0.6},
  };
  double cross_asset_max_follower_direction{0.15};
};

/// 提案排序参数。
struct RankingConfig {
  int top_k{3};
  std::vector<std::string> strategy_priority{
      "liquidation_flow", "event_volatility", "margin_flow",
      "narrative_shock", "cross_asset_graph"};
};

/// 持仓生命周期参数。
struct LifecycleConfig {
  double trailing_activation_fraction{0.5};  ///< 走完 entry->target 的比例后启动。
  double trailing_distance_r{1.0};           ///< 追踪距离 = N * 初始风险。
};

/// 策略权重更新参数。
struct WeightConfig {
  int update_interval_cycles{50};
  int min_outcomes{5};
  int window{20};
  double min_weight{0.3};
  double max_weight{2.0};
  double win_rate_multiplier{2.0};
};

/// 价格源参数。
struct PriceFeedConfig {
  std::string provider{"replay"};      ///< replay / bybit
  std::string base_url{"https://api.bybit.com"};
  std::string category{"linear"};
  std::string kline_interval{"1"};
  int connect_timeout_ms{3000};
  int timeout_ms{5000};
  std::string replay_path;             ///< CSV: asset,ts_ms,close；为空则使用合成序列。
};

/// 执行层参数。
struct ExecutorConfig {
  std::string provider{"paper"};
  int submit_wait_ms{2000};            ///< 本周期等待回报上限。
  int order_stale_ms{30000};           ///< 超时未回报的订单视为失败。
  double paper_slippage_bps{1.0};
};

/// 通知通道参数。
struct NotifyConfig {
  bool enabled{true};
  bool notify_rejections{false};
  int queue_capacity{256};
  std::string telegram_api_base{"https://api.telegram.org"};
  std::string telegram_bot_token;      ///< 亦可由 HYDRA_TELEGRAM_BOT_TOKEN 提供。
  std::string telegram_chat_id;        ///< 亦可由 HYDRA_TELEGRAM_CHAT_ID 提供。
  int timeout_ms{5000};
};

/// 只读快照服务参数。
struct DashboardConfig {
  bool enabled{false};
  std::string bind_address{"127.0.0.1"};
  int port{8088};
  int io_timeout_ms{2000};  ///< 单连接读写上限；空闲客户端超时即断开。
};

/// 信号来源默认可靠度与半衰期（适配器打标签用）。
struct SignalSourceDefaults {
  std::string source_id;
  double reliability_weight{0.5};
  std::int64_t half_life_ms{3600000};
};

/// 信号源适配器参数。
struct AdaptersConfig {
  bool funding_enabled{false};
  std::string funding_base_url{"https://fapi.binance.com"};
  std::vector<std::string> funding_symbols{"BTCUSDT", "ETHUSDT"};
  int funding_poll_interval_ms{60000};
  double funding_extreme_rate{0.0005};
  double open_interest_cascade_drop{0.05};
  int funding_timeout_ms{5000};
  bool spool_enabled{false};
  std::string spool_path{"data/signals.jsonl"};
  int spool_poll_interval_ms{1000};
};

/// 应用主配置：聚合核心与外围适配器参数。
struct AppConfig {
  SystemConfig system{};
  AggregatorConfig aggregator{};
  RegimeConfig regime{};
  RiskLimits risk{};
  StrategiesConfig strategies{};
  RankingConfig ranking{};
  LifecycleConfig lifecycle{};
  WeightConfig weights{};
  PriceFeedConfig price_feed{};
  ExecutorConfig executor{};
  NotifyConfig notify{};
  DashboardConfig dashboard{};
  AdaptersConfig adapters{};
  std::vector<SignalSourceDefaults> signal_sources{
      {"gex_levels", 0.85, 60LL * 60 * 1000},
      {"funding_rate", 0.75, 8LL * 60 * 60 * 1000},
      {"liquidation_map", 0.80, 60LL * 60 * 1000},
      {"margin_hike", 0.90, 24LL * 60 * 60 * 1000},
      {"vix_term", 0.70, 2LL * 60 * 60 * 1000},
      {"credit_spread", 0.65, 12LL * 60 * 60 * 1000},
      {"narrative_velocity", 0.60, 4LL * 60 * 60 * 1000},
      {"physical_premium", 0.75, 24LL * 60 * 60 * 1000},
      {"etf_flow", 0.70, 24LL * 60 * 60 * 1000},
      {"labor_data", 0.80, 4LL * 60 * 60 * 1000},
      {"order_flow", 0.75, 30LL * 60 * 1000},
      {"candle_structure", 0.50, 30LL * 60 * 1000},
  };

  /// 查找来源默认参数；未配置来源返回 reliability 0.5 / 半衰期 1h。
  SignalSourceDefaults SourceDefaults(const std::string& source_id) const;
  /// 所有策略涉及的资产（去重，保持出现顺序）。
  std::vector<std::string> WatchedAssets() const;
};

/**
 * @brief 轻量 YAML 配置加载器
 *
 * 仅解析两级缩进（section / subsection）下的标量与 `[a, b]` 列表；
 * 解析失败返回 `false` 并写入 `out_error`（含键路径与行号）。
 * `out_config` 的现有值作为默认值，文件中未出现的键保持不变。
 */
bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error);

/// 配置一致性校验（限额区间、窗口大小、阈值顺序）。
bool ValidateAppConfig(const AppConfig& config, std::string* out_error);

/// 环境变量覆盖（Telegram 凭据等敏感字段不落配置文件）。
void ApplyEnvironmentOverrides(AppConfig* config);

}  // namespace hydra
