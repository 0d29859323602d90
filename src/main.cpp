#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/clock.h"
#include "core/config.h"
#include "core/log.h"
#include "exchange/http_transport.h"
#include "exchange/price_feed.h"
#include "execution/async_executor.h"
#include "execution/executor.h"
#include "monitor/dashboard_server.h"
#include "monitor/dashboard_snapshot.h"
#include "monitor/notifier.h"
#include "risk/risk_ledger.h"
#include "signal/signal_aggregator.h"
#include "signal/source_adapter.h"
#include "system/cycle_driver.h"
#include "system/decision_cycle.h"

namespace {

constexpr std::int64_t kSyntheticStartMs = 1704067200000;  // 2024-01-01T00:00:00Z
constexpr std::uint32_t kSyntheticSeed = 20240101;
constexpr int kSyntheticDefaultCycles = 240;

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int) {
  g_stop_requested = true;
}

// SIGUSR1：运维确认账本修复后请求解除风控 halt。
std::atomic<bool> g_resume_requested{false};

void HandleResumeSignal(int) {
  g_resume_requested = true;
}

struct RuntimeOptions {
  std::string config_path{"config/hydra.yaml"};
  std::optional<int> max_cycles;
  std::optional<int> cycle_interval_ms;
  bool run_forever{false};
};

bool ParseNonNegativeInt(const std::string& raw, int* out_value) {
  if (out_value == nullptr || raw.empty()) {
    return false;
  }
  int value = 0;
  for (const char ch : raw) {
    if (ch < '0' || ch > '9') {
      return false;
    }
    if (value > (2147483647 - (ch - '0')) / 10) {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  *out_value = value;
  return true;
}

RuntimeOptions ParseOptions(int argc, char** argv) {
  RuntimeOptions options;
  auto parse_int_arg = [](const std::string& raw_value,
                          const std::string& option_name,
                          std::optional<int>* out_value) {
    int parsed = 0;
    if (!ParseNonNegativeInt(raw_value, &parsed)) {
      hydra::LogInfo(option_name + " 参数非法，已忽略: " + raw_value);
      return;
    }
    *out_value = parsed;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      options.config_path = arg.substr(std::string("--config=").size());
      continue;
    }
    if (arg.rfind("--max_cycles=", 0) == 0) {
      parse_int_arg(arg.substr(std::string("--max_cycles=").size()),
                    "--max_cycles", &options.max_cycles);
      continue;
    }
    if (arg.rfind("--cycle_interval_ms=", 0) == 0) {
      parse_int_arg(arg.substr(std::string("--cycle_interval_ms=").size()),
                    "--cycle_interval_ms", &options.cycle_interval_ms);
      continue;
    }
    if (arg == "--run_forever" || arg == "--run-forever") {
      options.run_forever = true;
      continue;
    }
    hydra::LogInfo("未知参数，已忽略: " + arg);
  }
  return options;
}

/// 回放价格源：CSV 优先，否则生成确定性合成序列。
std::unique_ptr<hydra::ReplayPriceFeed> BuildReplayFeed(
    const hydra::AppConfig& config, std::string* out_error) {
  auto feed = std::make_unique<hydra::ReplayPriceFeed>();
  if (!config.price_feed.replay_path.empty()) {
    if (!feed->LoadCsv(config.price_feed.replay_path, out_error)) {
      return nullptr;
    }
    return feed;
  }
  std::vector<std::string> assets = config.WatchedAssets();
  const int cycles = config.system.max_cycles > 0 ? config.system.max_cycles
                                                  : kSyntheticDefaultCycles;
  feed->GenerateSynthetic(assets, kSyntheticStartMs,
                          config.system.cycle_interval_ms,
                          config.regime.history_bars + cycles + 1,
                          kSyntheticSeed);
  return feed;
}

void BuildSourceAdapters(const hydra::AppConfig& config,
                         const hydra::ClockFn& clock,
                         hydra::SourceAdapterRunner* runner) {
  if (config.adapters.funding_enabled) {
    runner->Add(std::make_unique<hydra::BinanceFundingAdapter>(
                    config.adapters, config.SourceDefaults("funding_rate"),
                    config.SourceDefaults("liquidation_map"),
                    std::make_unique<hydra::CurlHttpTransport>(
                        config.adapters.funding_timeout_ms,
                        config.adapters.funding_timeout_ms),
                    clock),
                config.adapters.funding_poll_interval_ms);
  }
  if (config.adapters.spool_enabled) {
    runner->Add(std::make_unique<hydra::SpoolFileAdapter>(
                    config.adapters.spool_path,
                    [&config](const std::string& source_id) {
                      return config.SourceDefaults(source_id);
                    },
                    clock),
                config.adapters.spool_poll_interval_ms);
  }
}

void LogCycleStatus(const hydra::CycleSummary& summary,
                    const hydra::RiskLedger& ledger,
                    const hydra::DecisionCycle& cycle) {
  const hydra::RiskState risk = ledger.Snapshot();
  hydra::LogInfo(
      "RUNTIME_STATUS: cycle=" + std::to_string(summary.cycle) +
      ", regime=" + hydra::ToString(summary.regime.regime) +
      ", regime_confidence=" + hydra::FormatFixed(summary.regime.confidence) +
      ", scored_assets=" + std::to_string(summary.scored_assets) +
      ", proposals=" + std::to_string(summary.proposals) +
      ", approved=" + std::to_string(summary.approved) +
      ", rejected=" + std::to_string(summary.rejected) +
      ", open_positions=" + std::to_string(cycle.positions().open_count()) +
      ", pending_orders=" + std::to_string(cycle.pending_order_count()) +
      ", risk={capital=" + hydra::FormatFixed(risk.capital) +
      ", exposure=" + hydra::FormatFixed(risk.open_exposure_total) +
      ", daily_pnl=" + hydra::FormatFixed(risk.daily_realized_pnl) +
      ", losses=" + std::to_string(risk.consecutive_losses) +
      ", kill_switch=" + (risk.kill_switch_tripped ? "true" : "false") +
      ", halted=" + (risk.halted ? "true" : "false") + "}");
}

}  // namespace

int main(int argc, char** argv) {
  hydra::LogInfo("启动 HYDRA 决策核心...");
  const RuntimeOptions options = ParseOptions(argc, argv);

  hydra::AppConfig config;
  std::string config_error;
  if (!hydra::LoadAppConfigFromYaml(options.config_path, &config, &config_error)) {
    hydra::LogError("配置加载失败: " + config_error);
    return 1;
  }
  hydra::ApplyEnvironmentOverrides(&config);
  if (options.max_cycles.has_value()) {
    config.system.max_cycles = *options.max_cycles;
  }
  if (options.cycle_interval_ms.has_value()) {
    config.system.cycle_interval_ms = *options.cycle_interval_ms;
  }
  if (options.run_forever) {
    config.system.max_cycles = 0;
  }
  if (!hydra::ValidateAppConfig(config, &config_error)) {
    hydra::LogError("配置校验失败: " + config_error);
    return 1;
  }
  hydra::LogInfo("配置加载成功: mode=" + config.system.mode +
                 ", cycle_interval_ms=" + std::to_string(config.system.cycle_interval_ms) +
                 ", max_cycles=" + std::to_string(config.system.max_cycles) +
                 ", risk.starting_capital=" + hydra::FormatFixed(config.risk.starting_capital) +
                 ", risk.max_total_exposure_fraction=" +
                 hydra::FormatFixed(config.risk.max_total_exposure_fraction, 3) +
                 ", ranking.top_k=" + std::to_string(config.ranking.top_k) +
                 ", price_feed=" + config.price_feed.provider);

  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);
#if defined(SIGUSR1)
  std::signal(SIGUSR1, HandleResumeSignal);
#endif

  const bool replay = config.system.mode == "replay";

  // 价格源与时钟：回放为虚拟时钟，模拟盘为墙钟 + Bybit 公共行情。
  std::unique_ptr<hydra::PriceFeed> price_feed;
  hydra::ReplayPriceFeed* replay_feed = nullptr;
  auto virtual_now = std::make_shared<std::atomic<std::int64_t>>(0);
  hydra::ClockFn clock = hydra::SystemClockMs;
  std::int64_t replay_last_ms = 0;
  if (replay) {
    std::string feed_error;
    auto feed = BuildReplayFeed(config, &feed_error);
    if (feed == nullptr) {
      hydra::LogError("回放数据加载失败: " + feed_error);
      return 1;
    }
    std::int64_t first_ms = 0;
    if (!feed->TimeRange(&first_ms, &replay_last_ms)) {
      hydra::LogError("回放数据为空");
      return 1;
    }
    const std::int64_t warmup_ms =
        static_cast<std::int64_t>(config.regime.history_bars) *
        config.system.cycle_interval_ms;
    virtual_now->store(std::min(first_ms + warmup_ms, replay_last_ms));
    feed->AdvanceTo(virtual_now->load());
    replay_feed = feed.get();
    price_feed = std::move(feed);
    clock = [virtual_now]() { return virtual_now->load(); };
  } else {
    if (config.price_feed.provider != "bybit") {
      hydra::LogError("paper 模式需要 price_feed.provider=bybit");
      return 1;
    }
    price_feed = std::make_unique<hydra::BybitPriceFeed>(
        config.price_feed.base_url, config.price_feed.category,
        config.price_feed.kline_interval,
        std::make_unique<hydra::CurlHttpTransport>(
            config.price_feed.connect_timeout_ms, config.price_feed.timeout_ms));
  }

  hydra::SignalAggregator aggregator(config.aggregator);
  hydra::RiskLedger ledger(config.risk);
  hydra::PaperExecutor paper_executor(price_feed.get(),
                                      config.executor.paper_slippage_bps);
  hydra::AsyncExecutor executor(&paper_executor);
  executor.Start();

  std::unique_ptr<hydra::Notifier> notifier;
  if (config.notify.enabled) {
    notifier = hydra::BuildNotifier(config.notify);
    notifier->Start();
  }

  hydra::SnapshotStore snapshots;
  hydra::DashboardServer dashboard(config.dashboard, &snapshots);
  if (config.dashboard.enabled) {
    std::string dashboard_error;
    if (!dashboard.Start(&dashboard_error)) {
      hydra::LogError("DASHBOARD_START_FAILED: " + dashboard_error);
    }
  }

  hydra::SourceAdapterRunner adapters(&aggregator);
  BuildSourceAdapters(config, clock, &adapters);
  if (!replay) {
    adapters.Start();
  }
  hydra::LogInfo("信号适配器: count=" + std::to_string(adapters.adapter_count()) +
                 ", mode=" + (replay ? "sync" : "threaded"));

  hydra::DecisionCycle cycle(config, hydra::CycleDependencies{
                                         .aggregator = &aggregator,
                                         .price_feed = price_feed.get(),
                                         .ledger = &ledger,
                                         .executor = &executor,
                                         .notifier = notifier.get(),
                                         .snapshots = &snapshots,
                                     });

  hydra::CycleDriver::SleepUntilFn sleeper;
  if (replay) {
    sleeper = [virtual_now, replay_feed, replay_last_ms](std::int64_t until_ms) {
      if (g_stop_requested.load()) {
        return false;
      }
      if (until_ms > replay_last_ms) {
        hydra::LogInfo("REPLAY_STREAM_EXHAUSTED: 回放数据已耗尽，结束运行。");
        return false;
      }
      if (until_ms > virtual_now->load()) {
        virtual_now->store(until_ms);
      }
      replay_feed->AdvanceTo(virtual_now->load());
      return true;
    };
  } else {
    sleeper = hydra::WallClockSleeper(&g_stop_requested);
  }

  if (config.system.max_cycles > 0) {
    hydra::LogInfo("运行模式: max_cycles=" + std::to_string(config.system.max_cycles));
  } else {
    hydra::LogInfo("运行模式: run_forever=true (system.max_cycles=0)");
  }

  hydra::CycleDriver driver(config.system.cycle_interval_ms, clock, sleeper);
  const std::int64_t cycles = driver.Run(
      [&](std::int64_t now_ms) {
        if (replay) {
          adapters.PollAllOnce();
        }
        if (g_resume_requested.exchange(false)) {
          cycle.RequestHaltResume("SIGUSR1");
        }
        const hydra::CycleSummary summary = cycle.RunOnce(now_ms);
        if (config.system.status_log_interval_cycles > 0 &&
            summary.cycle % config.system.status_log_interval_cycles == 0) {
          LogCycleStatus(summary, ledger, cycle);
        }
      },
      config.system.max_cycles, &g_stop_requested);

  adapters.Stop();
  executor.Stop();
  dashboard.Stop();
  if (notifier != nullptr) {
    notifier->Flush(std::chrono::milliseconds(2000));
    notifier->Stop();
  }

  const hydra::RiskState risk = ledger.Snapshot();
  hydra::LogInfo("HYDRA 运行结束: cycles=" + std::to_string(cycles) +
                 ", skipped_ticks=" + std::to_string(driver.skipped_ticks()) +
                 ", open_positions=" + std::to_string(cycle.positions().open_count()) +
                 ", capital=" + hydra::FormatFixed(risk.capital) +
                 ", halted=" + (risk.halted ? "true" : "false"));
  return 0;
}
