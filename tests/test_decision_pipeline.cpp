#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "core/config.h"
#include "core/json_utils.h"
#include "core/types.h"
#include "exchange/http_transport.h"
#include "exchange/price_feed.h"
#include "execution/async_executor.h"
#include "execution/executor.h"
#include "monitor/dashboard_server.h"
#include "monitor/dashboard_snapshot.h"
#include "monitor/notifier.h"
#include "oms/position_manager.h"
#include "regime/regime_detector.h"
#include "regime/regime_features.h"
#include "risk/risk_ledger.h"
#include "risk/risk_manager.h"
#include "signal/signal_aggregator.h"
#include "signal/source_adapter.h"
#include "strategy/builtin_strategies.h"
#include "strategy/proposal_ranker.h"
#include "strategy/strategy_weights.h"
#include "system/cycle_driver.h"
#include "system/decision_cycle.h"

namespace {

// 该测试文件覆盖决策闭环关键链路：
// - 信号聚合、Regime 分类、策略门槛与排序；
// - 风控限额、熔断、冷却与 halt；
// - 持仓生命周期、权重更新、周期驱动；
// - 配置解析、来源适配器、通知与快照接口；
// - 回放价格源驱动的端到端决策周期。
constexpr std::int64_t kDayStartMs = 1704067200000;  // 2024-01-01 00:00:00 UTC
constexpr std::int64_t kHourMs = 60LL * 60 * 1000;

bool NearlyEqual(double lhs, double rhs, double eps = 1e-6) {
  return std::fabs(lhs - rhs) < eps;
}

hydra::Signal MakeSignal(const std::string& source_id, const std::string& asset,
                         double direction, double strength, double reliability,
                         std::int64_t ts_ms) {
  hydra::Signal signal;
  signal.source_id = source_id;
  signal.asset = asset;
  signal.name = source_id;
  signal.direction = direction;
  signal.strength = strength;
  signal.reliability_weight = reliability;
  signal.timestamp_ms = ts_ms;
  signal.half_life_ms = kHourMs;
  return signal;
}

hydra::TradeProposal MakeProposal(const std::string& strategy_id,
                                  const std::string& asset, double confidence,
                                  double reward_to_risk) {
  hydra::TradeProposal proposal;
  proposal.strategy_id = strategy_id;
  proposal.asset = asset;
  proposal.direction = 1;
  proposal.entry = 100.0;
  proposal.stop = 98.0;
  proposal.target = 100.0 + 2.0 * reward_to_risk;
  proposal.confidence = confidence;
  proposal.reward_to_risk = reward_to_risk;
  proposal.trailing_enabled = true;
  return proposal;
}

hydra::RegimeFeatures MakeFeatures(double vol, double slope, double trend,
                                   double mr, int samples) {
  hydra::RegimeFeatures features;
  features.volatility_level = vol;
  features.volatility_term_slope = slope;
  features.trend_strength = trend;
  features.mean_reversion_score = mr;
  features.sample_count = samples;
  return features;
}

hydra::RegimeState MakeRegime(hydra::Regime regime, double confidence) {
  hydra::RegimeState state;
  state.regime = regime;
  state.confidence = confidence;
  return state;
}

bool WriteTextFile(const std::filesystem::path& path, const std::string& text,
                   bool append = false) {
  std::ofstream out(path, append ? std::ios::app : std::ios::trunc);
  if (!out.is_open()) {
    return false;
  }
  out << text;
  return static_cast<bool>(out);
}

/// 按 URL 子串路由的 mock transport；路由表可在移交所有权后继续修改。
class FakeTransport final : public hydra::HttpTransport {
 public:
  using Routes = std::map<std::string, std::string>;

  explicit FakeTransport(std::shared_ptr<Routes> routes)
      : routes_(std::move(routes)) {}

  hydra::HttpResponse Send(const std::string& method, const std::string& url,
                           const hydra::HttpHeaders& headers,
                           const std::string& body) const override {
    (void)method;
    (void)headers;
    (void)body;
    hydra::HttpResponse response;
    for (const auto& [fragment, payload] : *routes_) {
      if (url.find(fragment) != std::string::npos) {
        response.status_code = 200;
        response.body = payload;
        return response;
      }
    }
    response.status_code = 404;
    response.body = "{}";
    return response;
  }

 private:
  std::shared_ptr<Routes> routes_;
};

/// 记录收到的事件类型（工作线程写入，Flush 后读取）。
class RecordingSink final : public hydra::NotifySink {
 public:
  explicit RecordingSink(std::shared_ptr<std::vector<hydra::NotifyEventType>> seen)
      : seen_(std::move(seen)) {}

  std::string Name() const override { return "recording"; }
  bool Deliver(const hydra::NotifyEvent& event, std::string* out_error) override {
    (void)out_error;
    seen_->push_back(event.type);
    return true;
  }

 private:
  std::shared_ptr<std::vector<hydra::NotifyEventType>> seen_;
};

}  // namespace

int main() {
  {
    // 两个方向相反的来源：净方向按有效权重加权，置信度按饱和值归一。
    hydra::SignalAggregator aggregator;
    std::string error;
    if (!aggregator.Ingest(MakeSignal("gex_levels", "SPY", 1.0, 1.0, 0.9, kDayStartMs),
                           &error) ||
        !aggregator.Ingest(MakeSignal("vix_term", "SPY", -0.5, 0.6, 0.5, kDayStartMs),
                           &error)) {
      std::cerr << "预期合法信号写入成功: " << error << "\n";
      return 1;
    }
    const hydra::AggregatedScore score = aggregator.Aggregate("SPY", kDayStartMs);
    if (!NearlyEqual(score.net_direction, 0.625) ||
        !NearlyEqual(score.confidence, 0.8) ||
        score.contributing_signal_count != 2 ||
        score.dominant_source_id != "gex_levels") {
      std::cerr << "聚合结果不符: net=" << score.net_direction
                << ", confidence=" << score.confidence
                << ", dominant=" << score.dominant_source_id << "\n";
      return 1;
    }

    // 一个半衰期后有效权重减半，方向不变。
    const hydra::AggregatedScore decayed =
        aggregator.Aggregate("SPY", kDayStartMs + kHourMs);
    if (!NearlyEqual(decayed.total_effective_weight, 0.6) ||
        !NearlyEqual(decayed.net_direction, 0.625)) {
      std::cerr << "半衰期衰减不符: weight=" << decayed.total_effective_weight << "\n";
      return 1;
    }

    // 乱序到达的旧信号不覆盖新信号。
    if (!aggregator.Ingest(
            MakeSignal("gex_levels", "SPY", -1.0, 1.0, 0.9, kDayStartMs - 1000),
            &error)) {
      std::cerr << "旧信号应被静默忽略而非报错\n";
      return 1;
    }
    if (!NearlyEqual(aggregator.Aggregate("SPY", kDayStartMs).net_direction, 0.625)) {
      std::cerr << "旧信号不应覆盖已有信号\n";
      return 1;
    }

    // 越界信号拒绝。
    if (aggregator.Ingest(MakeSignal("gex_levels", "SPY", 1.5, 1.0, 0.9, kDayStartMs),
                          &error) ||
        aggregator.Ingest(MakeSignal("gex_levels", "SPY", 1.0, 1.0, 0.0, kDayStartMs),
                          &error)) {
      std::cerr << "越界 direction/reliability 应被拒绝\n";
      return 1;
    }

    // 超过 5 个半衰期视为过期；清理幂等。
    const std::int64_t expired_at = kDayStartMs + 5 * kHourMs;
    const hydra::AggregatedScore stale = aggregator.Aggregate("SPY", expired_at);
    if (stale.contributing_signal_count != 0 || stale.confidence != 0.0 ||
        stale.net_direction != 0.0 || stale.dominant_source_id != "none") {
      std::cerr << "过期信号不应参与聚合\n";
      return 1;
    }
    if (aggregator.PurgeExpired(expired_at) != 2 ||
        aggregator.PurgeExpired(expired_at) != 0 ||
        aggregator.StoredSignalCount() != 0) {
      std::cerr << "过期清理应删除 2 条且重复调用为 0\n";
      return 1;
    }
  }

  {
    // 极端信号组合下输出仍在值域内。
    hydra::SignalAggregator aggregator;
    std::string error;
    for (int i = 0; i < 8; ++i) {
      const double direction = (i % 2 == 0) ? 1.0 : -1.0;
      if (!aggregator.Ingest(MakeSignal("src_" + std::to_string(i), "BTCUSDT",
                                        direction, 1.0, 1.0, kDayStartMs),
                             &error)) {
        std::cerr << "信号写入失败: " << error << "\n";
        return 1;
      }
    }
    const auto snapshot = aggregator.Snapshot(kDayStartMs);
    if (snapshot.size() != 1 || snapshot[0].confidence > 1.0 ||
        snapshot[0].confidence < 0.0 || std::fabs(snapshot[0].net_direction) > 1.0) {
      std::cerr << "聚合输出越界\n";
      return 1;
    }
    if (!NearlyEqual(snapshot[0].confidence, 1.0) ||
        !NearlyEqual(snapshot[0].net_direction, 0.0)) {
      std::cerr << "对冲信号应得到 net=0、confidence 饱和\n";
      return 1;
    }
  }

  {
    // Regime 分类是纯函数，规则按优先级首个命中。
    hydra::RegimeDetector detector;
    const auto crash_features = MakeFeatures(35.0, 0.0, -0.6, 0.5, 60);
    const hydra::RegimeState first =
        detector.Classify(crash_features, hydra::Regime::kUnknown);
    const hydra::RegimeState second =
        detector.Classify(crash_features, hydra::Regime::kUnknown);
    if (first.regime != hydra::Regime::kCrash || !NearlyEqual(first.confidence, 1.0) ||
        second.regime != first.regime || second.confidence != first.confidence) {
      std::cerr << "预期 vol=35/trend=-0.6 判定为 CRASH 且可重复\n";
      return 1;
    }

    const auto rebound = MakeFeatures(20.0, 0.0, 0.2, 0.5, 60);
    if (detector.Classify(rebound, hydra::Regime::kCrash).regime !=
        hydra::Regime::kRecovery) {
      std::cerr << "CRASH 之后的反弹应判定为 RECOVERY\n";
      return 1;
    }
    const hydra::RegimeState no_crash =
        detector.Classify(rebound, hydra::Regime::kUnknown);
    if (no_crash.regime != hydra::Regime::kUnknown ||
        !NearlyEqual(no_crash.confidence, 0.3)) {
      std::cerr << "非 CRASH 之后不应进入 RECOVERY\n";
      return 1;
    }

    const hydra::RegimeState thin =
        detector.Classify(MakeFeatures(35.0, 0.0, -0.6, 0.5, 10),
                          hydra::Regime::kUnknown);
    if (thin.regime != hydra::Regime::kUnknown || thin.confidence != 0.0) {
      std::cerr << "样本不足应输出 UNKNOWN/0\n";
      return 1;
    }

    const hydra::RegimeState high_vol =
        detector.Classify(MakeFeatures(28.0, -3.0, 0.0, 0.5, 60),
                          hydra::Regime::kUnknown);
    if (high_vol.regime != hydra::Regime::kHighVolExpansion ||
        !NearlyEqual(high_vol.confidence, 0.84)) {
      std::cerr << "倒挂高波动应判定为 HIGH_VOL_EXPANSION, confidence="
                << high_vol.confidence << "\n";
      return 1;
    }

    const hydra::RegimeState trending =
        detector.Classify(MakeFeatures(15.0, 1.0, 0.45, 0.3, 60),
                          hydra::Regime::kUnknown);
    if (trending.regime != hydra::Regime::kTrendingUp ||
        !NearlyEqual(trending.confidence, 0.45)) {
      std::cerr << "趋势判定不符\n";
      return 1;
    }

    // 有状态入口：上一态在两次 Update 之间传递。
    detector.Update(crash_features, kDayStartMs);
    const hydra::RegimeState recovered = detector.Update(rebound, kDayStartMs + 60000);
    if (recovered.regime != hydra::Regime::kRecovery ||
        recovered.previous_regime != hydra::Regime::kCrash ||
        recovered.classified_at_ms != kDayStartMs + 60000) {
      std::cerr << "Update 应以上一次分类结果作为 previous\n";
      return 1;
    }
  }

  {
    // 特征提取：单边上涨趋势饱和为 1，外部波动率指数覆盖水平与斜率。
    std::vector<hydra::OhlcBar> bars;
    double close = 100.0;
    for (int i = 0; i < 60; ++i) {
      hydra::OhlcBar bar;
      bar.ts_ms = kDayStartMs + i * 60000LL;
      close *= 1.01;
      bar.open = bar.high = bar.low = bar.close = close;
      bars.push_back(bar);
    }
    hydra::RegimeFeatureExtractor extractor;
    const hydra::RegimeFeatures features = extractor.Extract(bars, 40.0, 45.0);
    if (features.sample_count != 60 || !NearlyEqual(features.trend_strength, 1.0) ||
        !NearlyEqual(features.volatility_level, 40.0) ||
        !NearlyEqual(features.volatility_term_slope, 5.0)) {
      std::cerr << "特征提取不符: trend=" << features.trend_strength
                << ", vol=" << features.volatility_level << "\n";
      return 1;
    }
    const std::vector<double> short_closes(30, 100.0);
    if (hydra::RegimeFeatureExtractor::TrendStrength(short_closes) != 0.0) {
      std::cerr << "不足 50 根收盘价时趋势强度应为 0\n";
      return 1;
    }
    const std::vector<hydra::OhlcBar> two_bars(bars.begin(), bars.begin() + 2);
    if (hydra::RegimeFeatureExtractor::DailyVolatility(two_bars, 98280.0).has_value()) {
      std::cerr << "样本不足时日度波动率应缺失\n";
      return 1;
    }
  }

  {
    // 策略适用性：Regime 集合、最小 Regime 置信度、启用开关。
    hydra::StrategiesConfig config;
    hydra::LiquidationFlowStrategy liquidation(config.liquidation_flow);
    if (!liquidation.IsEligible(MakeRegime(hydra::Regime::kCrash, 0.8)) ||
        liquidation.IsEligible(MakeRegime(hydra::Regime::kMeanReverting, 0.8)) ||
        liquidation.IsEligible(MakeRegime(hydra::Regime::kCrash, 0.3))) {
      std::cerr << "清算流策略适用性判定不符\n";
      return 1;
    }
    hydra::StrategyParams disabled = config.liquidation_flow;
    disabled.enabled = false;
    hydra::LiquidationFlowStrategy off(disabled);
    if (off.IsEligible(MakeRegime(hydra::Regime::kCrash, 0.8))) {
      std::cerr << "禁用策略不应适用\n";
      return 1;
    }
    hydra::EventVolatilityStrategy event(config.event_volatility);
    if (event.IsEligible(MakeRegime(hydra::Regime::kUnknown, 1.0))) {
      std::cerr << "UNKNOWN 下所有策略观望\n";
      return 1;
    }

    // 清算流方向门槛为严格大于。
    hydra::StrategyInput input;
    input.regime = MakeRegime(hydra::Regime::kHighVolExpansion, 0.8);
    input.prices["BTCUSDT"] = 50000.0;
    hydra::AggregatedScore btc;
    btc.asset = "BTCUSDT";
    btc.net_direction = 0.2;
    btc.confidence = 0.9;
    btc.contributing_signal_count = 2;
    input.scores["BTCUSDT"] = btc;
    if (!liquidation.Propose(input).empty()) {
      std::cerr << "|net| 恰好等于门槛时不应出提案\n";
      return 1;
    }
    input.scores["BTCUSDT"].net_direction = 0.5;
    const auto proposals = liquidation.Propose(input);
    if (proposals.size() != 1 || proposals[0].strategy_id != "liquidation_flow" ||
        proposals[0].direction != 1 || !NearlyEqual(proposals[0].stop, 49250.0) ||
        !NearlyEqual(proposals[0].target, 52000.0) ||
        !NearlyEqual(proposals[0].reward_to_risk, 2000.0 / 750.0)) {
      std::cerr << "清算流提案价格不符\n";
      return 1;
    }

    // 保证金流：RECOVERY 下只做多。
    hydra::MarginFlowStrategy margin(config.margin_flow);
    hydra::StrategyInput gold;
    gold.regime = MakeRegime(hydra::Regime::kRecovery, 0.6);
    gold.prices["GLD"] = 200.0;
    hydra::AggregatedScore gld;
    gld.asset = "GLD";
    gld.net_direction = -0.6;
    gld.confidence = 0.9;
    gld.contributing_signal_count = 2;
    gold.scores["GLD"] = gld;
    if (!margin.Propose(gold).empty()) {
      std::cerr << "RECOVERY 下保证金流不应做空\n";
      return 1;
    }
    gold.scores["GLD"].net_direction = 0.6;
    const auto longs = margin.Propose(gold);
    if (longs.size() != 1 || longs[0].direction != 1 ||
        !NearlyEqual(longs[0].stop, 194.0) || !NearlyEqual(longs[0].target, 212.0) ||
        !NearlyEqual(longs[0].confidence, 0.8) ||
        !NearlyEqual(longs[0].reward_to_risk, 2.0)) {
      std::cerr << "保证金流做多提案不符\n";
      return 1;
    }

    // 注册表按固定顺序包含五个策略。
    const hydra::StrategySet set = hydra::BuildDefaultStrategies(config);
    if (set.size() != 5 || set.Find("narrative_shock") == nullptr ||
        set.Find("cross_asset_graph") == nullptr || set.Find("unknown") != nullptr) {
      std::cerr << "默认策略注册表不完整\n";
      return 1;
    }
  }

  {
    // 跨资产传导：领先资产表态、跟随资产未反应时交易跟随者。
    hydra::StrategiesConfig config;
    hydra::CrossAssetGraphStrategy graph(
        config.cross_asset_graph,
        {hydra::CrossAssetEdge{"HYG", "SPY", 1, 0.8}}, 0.15);
    hydra::StrategyInput input;
    input.regime = MakeRegime(hydra::Regime::kTrendingDown, 0.6);
    input.prices["SPY"] = 400.0;
    hydra::AggregatedScore hyg;
    hyg.asset = "HYG";
    hyg.net_direction = -0.7;
    hyg.confidence = 0.9;
    hyg.contributing_signal_count = 1;
    input.scores["HYG"] = hyg;
    const auto out = graph.Propose(input);
    if (out.size() != 1 || out[0].asset != "SPY" || out[0].direction != -1 ||
        !NearlyEqual(out[0].confidence, 0.72)) {
      std::cerr << "跨资产传导提案不符\n";
      return 1;
    }
    hydra::AggregatedScore spy;
    spy.asset = "SPY";
    spy.net_direction = -0.4;
    spy.confidence = 0.6;
    spy.contributing_signal_count = 1;
    input.scores["SPY"] = spy;
    if (!graph.Propose(input).empty()) {
      std::cerr << "跟随资产已反应时不应出提案\n";
      return 1;
    }
  }

  {
    // 排序：得分降序，同分按优先级，权重参与打分；多次排序一致。
    hydra::RankingConfig config;
    config.top_k = 2;
    hydra::ProposalRanker ranker(config);
    const std::vector<hydra::TradeProposal> proposals{
        MakeProposal("event_volatility", "SPY", 0.5, 2.0),
        MakeProposal("liquidation_flow", "BTCUSDT", 0.5, 2.0),
        MakeProposal("margin_flow", "GLD", 0.9, 2.0),
    };
    const auto ranked = ranker.Rank(proposals, nullptr);
    if (ranked.size() != 3 || ranked[0].proposal.strategy_id != "margin_flow" ||
        ranked[1].proposal.strategy_id != "liquidation_flow" ||
        ranked[2].proposal.strategy_id != "event_volatility" ||
        !NearlyEqual(ranked[0].score, 1.8)) {
      std::cerr << "排序结果不符\n";
      return 1;
    }
    const auto again = ranker.Rank(proposals, nullptr);
    for (std::size_t i = 0; i < ranked.size(); ++i) {
      if (again[i].proposal.strategy_id != ranked[i].proposal.strategy_id) {
        std::cerr << "相同输入排序结果应一致\n";
        return 1;
      }
    }
    const auto weighted = ranker.TopK(proposals, [](const std::string& id) {
      return id == "margin_flow" ? 0.3 : 1.0;
    });
    if (weighted.size() != 2 ||
        weighted[0].proposal.strategy_id != "liquidation_flow" ||
        weighted[1].proposal.strategy_id != "event_volatility") {
      std::cerr << "低权重策略应被挤出 TopK\n";
      return 1;
    }
  }

  {
    // 多个信号源线程并发写入同一资产，不丢更新。
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    hydra::SignalAggregator aggregator;
    std::atomic<int> rejected{0};
    std::vector<std::thread> producers;
    for (int t = 0; t < kThreads; ++t) {
      producers.emplace_back([&aggregator, &rejected, t] {
        for (int i = 0; i < kPerThread; ++i) {
          std::string error;
          const std::string source =
              "adapter_" + std::to_string(t) + "_" + std::to_string(i);
          if (!aggregator.Ingest(MakeSignal(source, "ETHUSDT", 1.0, 1.0, 1.0, kDayStartMs),
                                 &error)) {
            ++rejected;
          }
        }
      });
    }
    for (auto& producer : producers) {
      producer.join();
    }
    const hydra::AggregatedScore score = aggregator.Aggregate("ETHUSDT", kDayStartMs);
    if (rejected.load() != 0 || score.contributing_signal_count != kThreads * kPerThread ||
        !NearlyEqual(score.total_effective_weight, kThreads * kPerThread) ||
        !NearlyEqual(score.net_direction, 1.0) || !NearlyEqual(score.confidence, 1.0)) {
      std::cerr << "并发写入丢失信号: count=" << score.contributing_signal_count << "\n";
      return 1;
    }
  }

  {
    // 并发评估同一资产：敞口不重复计算，单资产上限不被突破。
    constexpr int kThreads = 8;
    constexpr int kPerThread = 4;
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::RiskManager risk;
    const auto proposal = MakeProposal("event_volatility", "SPY", 1.0, 3.0);
    std::atomic<int> approvals{0};
    std::atomic<int> exposure_rejections{0};
    std::vector<std::thread> evaluators;
    for (int t = 0; t < kThreads; ++t) {
      evaluators.emplace_back([&] {
        for (int i = 0; i < kPerThread; ++i) {
          const hydra::RiskDecision decision = risk.Evaluate(proposal, &ledger, kDayStartMs);
          if (decision.approved) {
            ++approvals;
          } else if (decision.reason == hydra::RejectReason::kExposureLimit) {
            ++exposure_rejections;
          }
        }
      });
    }
    for (auto& evaluator : evaluators) {
      evaluator.join();
    }
    const hydra::RiskState state = ledger.Snapshot();
    const double spy_exposure = state.open_exposure_by_asset.count("SPY") > 0
                                    ? state.open_exposure_by_asset.at("SPY")
                                    : 0.0;
    if (spy_exposure > 5000.0 + 1e-6 || !NearlyEqual(spy_exposure, 5000.0) ||
        !NearlyEqual(state.open_exposure_total, spy_exposure) ||
        state.trades_today != approvals.load() || approvals.load() != 2 ||
        exposure_rejections.load() != kThreads * kPerThread - 2 || state.halted) {
      std::cerr << "并发评估账本不符: exposure=" << spy_exposure
                << ", approvals=" << approvals.load()
                << ", trades_today=" << state.trades_today << "\n";
      return 1;
    }
  }

  {
    // 同一资产连续批准：3% 单仓上限，5% 单资产上限。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::RiskManager risk;
    const auto proposal = MakeProposal("event_volatility", "SPY", 1.0, 3.0);
    const hydra::RiskDecision first = risk.Evaluate(proposal, &ledger, kDayStartMs);
    const hydra::RiskDecision second = risk.Evaluate(proposal, &ledger, kDayStartMs);
    const hydra::RiskDecision third = risk.Evaluate(proposal, &ledger, kDayStartMs);
    if (!first.approved || !NearlyEqual(first.sized_notional, 3000.0) ||
        !first.clamped || !NearlyEqual(first.vol_scalar, 0.96)) {
      std::cerr << "首笔应被裁剪到 3000，实际 " << first.sized_notional << "\n";
      return 1;
    }
    if (!second.approved || !NearlyEqual(second.sized_notional, 2000.0)) {
      std::cerr << "第二笔应被资产余量裁剪到 2000，实际 " << second.sized_notional
                << "\n";
      return 1;
    }
    if (third.approved || third.reason != hydra::RejectReason::kExposureLimit) {
      std::cerr << "第三笔应因 EXPOSURE_LIMIT 拒绝\n";
      return 1;
    }
    const hydra::RiskState state = ledger.Snapshot();
    if (!NearlyEqual(state.open_exposure_total, 5000.0) || state.trades_today != 2 ||
        !NearlyEqual(state.open_exposure_by_asset.at("SPY"), 5000.0)) {
      std::cerr << "账本敞口不符\n";
      return 1;
    }

    // 释放部分敞口后重新获得余量。
    ledger.ReleaseExposure("SPY", 2000.0);
    if (!NearlyEqual(ledger.Snapshot().open_exposure_total, 3000.0)) {
      std::cerr << "释放敞口后总量应为 3000\n";
      return 1;
    }

    hydra::TradeProposal wrong_side = proposal;
    wrong_side.asset = "TLT";
    wrong_side.stop = 101.0;
    const hydra::RiskDecision invalid = risk.Evaluate(wrong_side, &ledger, kDayStartMs);
    if (invalid.approved || invalid.reason != hydra::RejectReason::kInvalidProposal) {
      std::cerr << "止损在错误一侧应判为 INVALID_PROPOSAL\n";
      return 1;
    }
    const hydra::RiskDecision tiny = risk.Evaluate(
        MakeProposal("event_volatility", "TLT", 0.0, 1.0), &ledger, kDayStartMs);
    if (tiny.approved || tiny.reason != hydra::RejectReason::kSizeTooSmall) {
      std::cerr << "零优势提案应判为 SIZE_TOO_SMALL\n";
      return 1;
    }
  }

  {
    // Kelly 与波动率缩放口径。
    const hydra::RiskLimits limits;
    const double p = hydra::RiskManager::WinProbability(limits, 1.0);
    if (!NearlyEqual(p, 0.62) ||
        !NearlyEqual(hydra::RiskManager::KellyFraction(3.0, p), 1.48 / 3.0) ||
        !NearlyEqual(hydra::RiskManager::VolatilityScalar(limits, 0.5), 0.3) ||
        !NearlyEqual(hydra::RiskManager::VolatilityScalar(limits, 0.0), 1.0)) {
      std::cerr << "定量公式不符\n";
      return 1;
    }
  }

  {
    // 日交易次数上限。
    hydra::RiskLimits limits;
    limits.max_trades_per_day = 1;
    hydra::RiskLedger ledger(limits);
    hydra::RiskManager risk;
    if (!risk.Evaluate(MakeProposal("event_volatility", "SPY", 1.0, 3.0), &ledger,
                       kDayStartMs).approved) {
      std::cerr << "首笔应批准\n";
      return 1;
    }
    const hydra::RiskDecision capped = risk.Evaluate(
        MakeProposal("event_volatility", "TLT", 1.0, 3.0), &ledger, kDayStartMs);
    if (capped.reason != hydra::RejectReason::kDailyTradeCap) {
      std::cerr << "超过日交易次数应判为 DAILY_TRADE_CAP\n";
      return 1;
    }
    const hydra::RiskDecision next_day =
        risk.Evaluate(MakeProposal("event_volatility", "TLT", 1.0, 3.0), &ledger,
                      kDayStartMs + 24 * kHourMs);
    if (!next_day.approved) {
      std::cerr << "跨日后交易次数应复位\n";
      return 1;
    }
  }

  {
    // 日内熔断：锁存当日，跨日复位。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::RiskManager risk;
    const hydra::CloseEffect effect =
        ledger.ApplyClose("SPY", 0.0, -6000.0, kDayStartMs + 1000);
    if (!effect.kill_switch_tripped_now || !ledger.Snapshot().kill_switch_tripped) {
      std::cerr << "亏损 6000 应触发日内熔断\n";
      return 1;
    }
    const auto proposal = MakeProposal("event_volatility", "SPY", 1.0, 3.0);
    const hydra::RiskDecision blocked =
        risk.Evaluate(proposal, &ledger, kDayStartMs + 2000);
    if (blocked.approved || blocked.reason != hydra::RejectReason::kKillSwitch) {
      std::cerr << "熔断当日应拒绝所有提案\n";
      return 1;
    }
    const hydra::RiskDecision reopened =
        risk.Evaluate(proposal, &ledger, kDayStartMs + 24 * kHourMs + 1000);
    if (!reopened.approved || ledger.Snapshot().kill_switch_tripped) {
      std::cerr << "跨日后熔断应复位\n";
      return 1;
    }
    if (!NearlyEqual(ledger.Snapshot().capital, 94000.0)) {
      std::cerr << "已实现亏损应计入资金\n";
      return 1;
    }
  }

  {
    // 日内熔断以日初资金为基数：亏损 4.8% 仍可交易，累计 5% 触发。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::RiskManager risk;
    const hydra::CloseEffect first =
        ledger.ApplyClose("SPY", 0.0, -4800.0, kDayStartMs + 1000);
    if (first.kill_switch_tripped_now ||
        !NearlyEqual(ledger.Snapshot().daily_start_capital, 100000.0)) {
      std::cerr << "亏损 4.8% 不应触发日内熔断\n";
      return 1;
    }
    const auto proposal = MakeProposal("event_volatility", "SPY", 1.0, 3.0);
    const hydra::RiskDecision still_open =
        risk.Evaluate(proposal, &ledger, kDayStartMs + 2000);
    if (!still_open.approved) {
      std::cerr << "亏损 4.8% 时提案应被批准, reason="
                << hydra::ToString(still_open.reason) << "\n";
      return 1;
    }
    const hydra::CloseEffect second =
        ledger.ApplyClose("QQQ", 0.0, -200.0, kDayStartMs + 3000);
    if (!second.kill_switch_tripped_now) {
      std::cerr << "累计亏损 5% 应触发日内熔断\n";
      return 1;
    }
    const hydra::RiskDecision blocked =
        risk.Evaluate(proposal, &ledger, kDayStartMs + 4000);
    if (blocked.approved || blocked.reason != hydra::RejectReason::kKillSwitch) {
      std::cerr << "熔断后应拒绝提案\n";
      return 1;
    }
  }

  {
    // 连亏冷却：第三笔亏损触发 4 小时冷却，盈利重置连亏计数。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::RiskManager risk;
    const std::int64_t t0 = kDayStartMs + kHourMs;
    ledger.ApplyClose("SPY", 0.0, -100.0, t0);
    ledger.ApplyClose("SPY", 0.0, 50.0, t0);
    ledger.ApplyClose("SPY", 0.0, -100.0, t0);
    ledger.ApplyClose("SPY", 0.0, -100.0, t0);
    if (ledger.Snapshot().consecutive_losses != 2) {
      std::cerr << "盈利后连亏计数应重置\n";
      return 1;
    }
    const hydra::CloseEffect third = ledger.ApplyClose("SPY", 0.0, -100.0, t0);
    if (!third.cooldown_armed_now) {
      std::cerr << "第三笔连亏应触发冷却\n";
      return 1;
    }
    const auto proposal = MakeProposal("event_volatility", "SPY", 1.0, 3.0);
    if (risk.Evaluate(proposal, &ledger, t0 + 1000).reason !=
        hydra::RejectReason::kCooldown) {
      std::cerr << "冷却期内应判为 COOLDOWN\n";
      return 1;
    }
    if (!risk.Evaluate(proposal, &ledger, t0 + 4 * kHourMs + 1).approved) {
      std::cerr << "冷却结束后应恢复放行\n";
      return 1;
    }
  }

  {
    // 账本不一致时锁死，且不一致未修复前拒绝人工恢复。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::RiskManager risk;
    hydra::RiskState broken = ledger.Snapshot();
    broken.open_exposure_by_asset["SPY"] = 100.0;
    broken.open_exposure_total = 500.0;
    ledger.RestoreState(broken);
    const auto proposal = MakeProposal("event_volatility", "TLT", 1.0, 3.0);
    const hydra::RiskDecision decision = risk.Evaluate(proposal, &ledger, kDayStartMs);
    if (decision.approved || decision.reason != hydra::RejectReason::kHalted ||
        !ledger.Snapshot().halted) {
      std::cerr << "不变量破坏应锁死账本\n";
      return 1;
    }
    if (!NearlyEqual(ledger.Snapshot().open_exposure_total, 500.0) ||
        ledger.Snapshot().open_exposure_by_asset.count("TLT") != 0) {
      std::cerr << "锁死时应回滚本次入账\n";
      return 1;
    }
    if (ledger.ResumeAfterHalt("manual check")) {
      std::cerr << "不一致未修复时不应解除锁死\n";
      return 1;
    }
    if (risk.Evaluate(proposal, &ledger, kDayStartMs).reason !=
        hydra::RejectReason::kHalted) {
      std::cerr << "锁死后应持续拒绝\n";
      return 1;
    }
    hydra::RiskState repaired = ledger.Snapshot();
    repaired.open_exposure_total = 100.0;
    ledger.RestoreState(repaired);
    if (!ledger.ResumeAfterHalt("exposure reconciled") ||
        !risk.Evaluate(proposal, &ledger, kDayStartMs).approved) {
      std::cerr << "修复后应可解除锁死并恢复放行\n";
      return 1;
    }
  }

  {
    // 持仓：以成交价重锚止损/止盈。
    hydra::PositionManager positions;
    hydra::ApprovedOrder order;
    order.order_id = "ord-1-1";
    order.proposal = MakeProposal("event_volatility", "SPY", 0.8, 2.0);
    order.sized_notional = 1010.0;
    hydra::FillReport fill;
    fill.order_id = order.order_id;
    fill.filled = true;
    fill.fill_price = 101.0;
    fill.filled_notional = 1010.0;
    const auto opened = positions.OpenFromFill(order, fill, kDayStartMs);
    if (!opened.has_value() || !NearlyEqual(opened->stop, 99.0) ||
        !NearlyEqual(opened->target, 105.0) || !NearlyEqual(opened->quantity, 10.0) ||
        opened->owning_strategy_id != "event_volatility") {
      std::cerr << "成交重锚不符\n";
      return 1;
    }
    hydra::FillReport rejected = fill;
    rejected.filled = false;
    if (positions.OpenFromFill(order, rejected, kDayStartMs).has_value() ||
        positions.open_count() != 1) {
      std::cerr << "未成交回报不应开仓\n";
      return 1;
    }
  }

  {
    // 移动止损：走完一半目标距离后激活，止损至少保本且只收紧。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::PositionManager positions;
    hydra::ApprovedOrder order;
    order.order_id = "ord-1-2";
    order.proposal = MakeProposal("event_volatility", "SPY", 0.8, 2.0);
    order.sized_notional = 1000.0;
    hydra::FillReport fill;
    fill.order_id = order.order_id;
    fill.filled = true;
    fill.fill_price = 100.0;
    fill.filled_notional = 1000.0;
    const auto opened = positions.OpenFromFill(order, fill, kDayStartMs);
    if (!opened.has_value()) {
      std::cerr << "预期开仓成功\n";
      return 1;
    }
    const std::string id = opened->position_id;

    if (positions.OnPrice(id, 101.0, &ledger, kDayStartMs + 1).has_value() ||
        positions.Find(id)->trailing.activated ||
        !NearlyEqual(positions.Find(id)->stop, 98.0)) {
      std::cerr << "未达激活比例时止损不应移动\n";
      return 1;
    }
    if (positions.OnPrice(id, 102.5, &ledger, kDayStartMs + 2).has_value() ||
        !positions.Find(id)->trailing.activated ||
        !NearlyEqual(positions.Find(id)->stop, 100.5)) {
      std::cerr << "激活后止损应移到 100.5，实际 " << positions.Find(id)->stop << "\n";
      return 1;
    }
    if (positions.OnPrice(id, 101.5, &ledger, kDayStartMs + 3).has_value() ||
        !NearlyEqual(positions.Find(id)->stop, 100.5)) {
      std::cerr << "回撤时止损不得放宽\n";
      return 1;
    }
    const auto closed = positions.OnPrice(id, 100.4, &ledger, kDayStartMs + 4);
    if (!closed.has_value() ||
        closed->outcome.exit_reason != hydra::ExitReason::kTrailingStop ||
        !NearlyEqual(closed->outcome.pnl, 4.0) || !closed->outcome.win ||
        !NearlyEqual(closed->outcome.r_multiple, 0.2) || positions.open_count() != 0) {
      std::cerr << "移动止损平仓结果不符\n";
      return 1;
    }
    if (!NearlyEqual(ledger.Snapshot().capital, 100004.0)) {
      std::cerr << "已实现盈亏应写回账本\n";
      return 1;
    }
  }

  {
    // 空头初始止损：未移动过的止损按 STOP 平仓。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::PositionManager positions;
    hydra::ApprovedOrder order;
    order.order_id = "ord-1-3";
    order.proposal = MakeProposal("cross_asset_graph", "TLT", 0.6, 2.0);
    order.proposal.direction = -1;
    order.proposal.stop = 102.0;
    order.proposal.target = 96.0;
    order.proposal.trailing_enabled = false;
    order.sized_notional = 1000.0;
    hydra::FillReport fill;
    fill.order_id = order.order_id;
    fill.filled = true;
    fill.fill_price = 100.0;
    fill.filled_notional = 1000.0;
    const auto opened = positions.OpenFromFill(order, fill, kDayStartMs);
    if (!opened.has_value()) {
      std::cerr << "预期空头开仓成功\n";
      return 1;
    }
    const auto closed =
        positions.OnPrice(opened->position_id, 102.1, &ledger, kDayStartMs + 1);
    if (!closed.has_value() || closed->outcome.exit_reason != hydra::ExitReason::kStop ||
        !NearlyEqual(closed->outcome.pnl, -21.0) ||
        !NearlyEqual(closed->outcome.r_multiple, -1.05) || closed->outcome.win) {
      std::cerr << "空头止损结果不符\n";
      return 1;
    }
    if (ledger.Snapshot().consecutive_losses != 1) {
      std::cerr << "亏损平仓应累计连亏\n";
      return 1;
    }
  }

  {
    // 人工平仓：按给定价格结算，重复平仓无效。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::PositionManager positions;
    hydra::ApprovedOrder order;
    order.order_id = "ord-1-5";
    order.proposal = MakeProposal("margin_flow", "GLD", 0.6, 2.0);
    order.sized_notional = 1000.0;
    hydra::FillReport fill;
    fill.order_id = order.order_id;
    fill.filled = true;
    fill.fill_price = 100.0;
    fill.filled_notional = 1000.0;
    const auto opened = positions.OpenFromFill(order, fill, kDayStartMs);
    if (!opened.has_value()) {
      std::cerr << "预期开仓成功\n";
      return 1;
    }
    if (positions.ManualExit(opened->position_id, 0.0, &ledger, kDayStartMs + 1)
            .has_value()) {
      std::cerr << "非法价格不应平仓\n";
      return 1;
    }
    const auto closed =
        positions.ManualExit(opened->position_id, 103.0, &ledger, kDayStartMs + 1);
    if (!closed.has_value() || closed->outcome.exit_reason != hydra::ExitReason::kManual ||
        !NearlyEqual(closed->outcome.pnl, 30.0) ||
        !NearlyEqual(closed->outcome.r_multiple, 1.5) || positions.open_count() != 0) {
      std::cerr << "人工平仓结果不符\n";
      return 1;
    }
    if (positions.ManualExit(opened->position_id, 103.0, &ledger, kDayStartMs + 2)
            .has_value() ||
        !NearlyEqual(ledger.Snapshot().capital, 100030.0)) {
      std::cerr << "重复人工平仓应无效\n";
      return 1;
    }
  }

  {
    // 取价失败不平仓，只累计 unpriced_cycles。
    hydra::RiskLedger ledger(hydra::RiskLimits{});
    hydra::ReplayPriceFeed feed;
    hydra::PositionManager positions;
    hydra::ApprovedOrder order;
    order.order_id = "ord-1-4";
    order.proposal = MakeProposal("margin_flow", "GLD", 0.6, 2.0);
    order.sized_notional = 1000.0;
    hydra::FillReport fill;
    fill.order_id = order.order_id;
    fill.filled = true;
    fill.fill_price = 100.0;
    fill.filled_notional = 1000.0;
    positions.OpenFromFill(order, fill, kDayStartMs);
    const hydra::LifecycleReport first = positions.OnCycle(feed, &ledger, kDayStartMs);
    const hydra::LifecycleReport second = positions.OnCycle(feed, &ledger, kDayStartMs);
    if (!first.closed.empty() || second.unpriced.size() != 1 ||
        second.unpriced[0].unpriced_cycles != 2 || positions.open_count() != 1) {
      std::cerr << "取价失败应保持持仓并累计告警计数\n";
      return 1;
    }
    feed.AppendClose("GLD", kDayStartMs, 105.0);
    feed.AdvanceTo(kDayStartMs);
    const hydra::LifecycleReport third = positions.OnCycle(feed, &ledger, kDayStartMs);
    if (third.closed.size() != 1 ||
        third.closed[0].outcome.exit_reason != hydra::ExitReason::kTarget) {
      std::cerr << "恢复取价后应按止盈平仓\n";
      return 1;
    }
  }

  {
    // 权重：样本不足保持 1.0，按间隔重算并裁剪到 [0.3, 2.0]。
    hydra::WeightConfig config;
    config.update_interval_cycles = 2;
    hydra::StrategyWeightBook book(config);
    for (int i = 0; i < 5; ++i) {
      hydra::RealizedOutcome outcome;
      outcome.strategy_id = "event_volatility";
      outcome.win = i != 0;
      book.RecordOutcome(outcome);
      hydra::RealizedOutcome loss;
      loss.strategy_id = "margin_flow";
      loss.win = false;
      book.RecordOutcome(loss);
    }
    hydra::RealizedOutcome single;
    single.strategy_id = "narrative_shock";
    single.win = true;
    book.RecordOutcome(single);

    if (!book.OnCycle().empty()) {
      std::cerr << "未到更新间隔不应重算\n";
      return 1;
    }
    const auto actions = book.OnCycle();
    if (actions.size() != 2 || !NearlyEqual(book.WeightOf("event_volatility"), 1.6) ||
        !NearlyEqual(book.WeightOf("margin_flow"), 0.3) ||
        !NearlyEqual(book.WeightOf("narrative_shock"), 1.0) ||
        !NearlyEqual(book.WeightOf("unknown"), 1.0)) {
      std::cerr << "权重更新结果不符\n";
      return 1;
    }
  }

  {
    // YAML 配置：分节、列表、边语法与来源覆盖。
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "hydra_config_test.yaml";
    if (!WriteTextFile(path,
                       "system:\n"
                       "  mode: replay\n"
                       "  cycle_interval_ms: 1000  # 测试用短周期\n"
                       "risk:\n"
                       "  starting_capital: 50000\n"
                       "  cooldown_minutes: 30\n"
                       "strategies:\n"
                       "  narrative_shock:\n"
                       "    enabled: false\n"
                       "  cross_asset_graph:\n"
                       "    edges: [\"HYG>SPY:+1:0.8\", \"TLT>SPY:-1:0.6\"]\n"
                       "ranking:\n"
                       "  top_k: 2\n"
                       "signal_sources:\n"
                       "  funding_rate:\n"
                       "    reliability_weight: 0.6\n")) {
      std::cerr << "无法写入临时配置\n";
      return 1;
    }
    hydra::AppConfig config;
    std::string error;
    if (!hydra::LoadAppConfigFromYaml(path.string(), &config, &error)) {
      std::cerr << "配置解析失败: " << error << "\n";
      return 1;
    }
    const hydra::SignalSourceDefaults funding = config.SourceDefaults("funding_rate");
    if (config.system.cycle_interval_ms != 1000 ||
        !NearlyEqual(config.risk.starting_capital, 50000.0) ||
        config.risk.cooldown_ms != 30LL * 60 * 1000 ||
        config.strategies.narrative_shock.enabled ||
        config.strategies.cross_asset_edges.size() != 2 ||
        config.strategies.cross_asset_edges[1].leader != "TLT" ||
        config.strategies.cross_asset_edges[1].sign != -1 ||
        !NearlyEqual(config.strategies.cross_asset_edges[1].weight, 0.6) ||
        config.ranking.top_k != 2 || !NearlyEqual(funding.reliability_weight, 0.6) ||
        funding.half_life_ms != 8LL * 60 * 60 * 1000) {
      std::cerr << "配置字段不符\n";
      return 1;
    }

    if (!WriteTextFile(path, "risk:\n  max_trades_per_day: lots\n")) {
      std::cerr << "无法写入临时配置\n";
      return 1;
    }
    hydra::AppConfig broken;
    error.clear();
    if (hydra::LoadAppConfigFromYaml(path.string(), &broken, &error) ||
        error.find("risk.max_trades_per_day") == std::string::npos ||
        error.find("行号: 2") == std::string::npos) {
      std::cerr << "非法值应报告键路径与行号，实际: " << error << "\n";
      return 1;
    }

    hydra::AppConfig invalid;
    invalid.system.mode = "live";
    if (hydra::ValidateAppConfig(invalid, &error)) {
      std::cerr << "未知运行模式应校验失败\n";
      return 1;
    }
    if (!hydra::ValidateAppConfig(hydra::AppConfig{}, &error)) {
      std::cerr << "默认配置应通过校验: " << error << "\n";
      return 1;
    }
    std::filesystem::remove(path);
  }

  {
    // JSON 解析与写入。
    hydra::JsonValue root;
    std::string error;
    if (!hydra::ParseJson(
            "{\"a\":[1,\"x\",true,null],\"b\":{\"c\":\"0.5\",\"d\":1.5}}", &root,
            &error)) {
      std::cerr << "JSON 解析失败: " << error << "\n";
      return 1;
    }
    const auto c = hydra::JsonAsNumber(hydra::JsonFindPath(&root, {"b", "c"}));
    const auto d = hydra::JsonAsInt64(hydra::JsonFindPath(&root, {"b", "d"}));
    const hydra::JsonValue* array = hydra::JsonObjectField(&root, "a");
    if (!c.has_value() || !NearlyEqual(*c, 0.5) || d.has_value() ||
        hydra::JsonArrayAt(array, 3) == nullptr ||
        hydra::JsonArrayAt(array, 4) != nullptr ||
        hydra::JsonAsString(hydra::JsonArrayAt(array, 1)).value_or("") != "x") {
      std::cerr << "JSON 字段访问不符\n";
      return 1;
    }
    hydra::JsonValue bad;
    if (hydra::ParseJson("{\"a\":", &bad, &error) || error.empty()) {
      std::cerr << "截断 JSON 应解析失败\n";
      return 1;
    }
    hydra::JsonValue escaped;
    if (!hydra::ParseJson("{\"t\":\"\\u00e9x\\n\"}", &escaped, &error) ||
        hydra::JsonAsString(hydra::JsonObjectField(&escaped, "t")).value_or("") !=
            "\xC3\xA9x\n") {
      std::cerr << "unicode 转义解码不符\n";
      return 1;
    }
    if (hydra::ParseJson(std::string(40, '[') + std::string(40, ']'), &bad, &error) ||
        hydra::ParseJson("[1e999]", &bad, &error) ||
        hydra::ParseJson("{\"a\":-}", &bad, &error) ||
        hydra::ParseJson("{a:1}", &bad, &error)) {
      std::cerr << "过深嵌套、溢出数字与非法键应解析失败\n";
      return 1;
    }

    hydra::JsonWriter writer;
    writer.BeginObject()
        .Key("k").String("a\"b")
        .Key("n").Int(3)
        .Key("l").BeginArray().Number(1.5).Bool(false).Null().EndArray()
        .EndObject();
    if (writer.str() != "{\"k\":\"a\\\"b\",\"n\":3,\"l\":[1.5,false,null]}") {
      std::cerr << "JsonWriter 输出不符: " << writer.str() << "\n";
      return 1;
    }
  }

  {
    // 周期节拍计算。
    using hydra::CycleDriver;
    if (CycleDriver::NextTickAfter(1000, 100, 999) != 1000 ||
        CycleDriver::NextTickAfter(1000, 100, 1000) != 1100 ||
        CycleDriver::NextTickAfter(1000, 100, 1250) != 1300 ||
        CycleDriver::NextTickAfter(1000, 0, 1250) != 1251) {
      std::cerr << "NextTickAfter 计算不符\n";
      return 1;
    }

    // 超时周期：错过的节拍跳过而非补跑。
    std::int64_t now = 0;
    std::vector<std::int64_t> ticks;
    CycleDriver driver(
        100, [&now] { return now; },
        [&now](std::int64_t until) {
          now = std::max(now, until);
          return true;
        });
    const std::int64_t cycles = driver.Run(
        [&](std::int64_t tick_ms) {
          ticks.push_back(tick_ms);
          if (ticks.size() == 2) {
            now += 250;
          }
        },
        3, nullptr);
    if (cycles != 3 || driver.skipped_ticks() != 2 || ticks.size() != 3 ||
        ticks[0] != 0 || ticks[1] != 100 || ticks[2] != 400) {
      std::cerr << "周期驱动跳拍不符: skipped=" << driver.skipped_ticks() << "\n";
      return 1;
    }

    // 等待被中断时立即退出。
    CycleDriver interrupted(
        100, [] { return std::int64_t{0}; }, [](std::int64_t) { return false; });
    if (interrupted.Run([](std::int64_t) {}, 0, nullptr) != 0) {
      std::cerr << "等待中断时不应执行周期\n";
      return 1;
    }
    std::atomic<bool> stop{true};
    if (driver.Run([](std::int64_t) {}, 0, &stop) != 0) {
      std::cerr << "stop 已置位时不应执行周期\n";
      return 1;
    }
  }

  {
    // NDJSON spool：只消费完整行，坏行计数，截断后从头读取。
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "hydra_spool_test.jsonl";
    std::filesystem::remove(path);
    hydra::AppConfig config;
    hydra::SpoolFileAdapter adapter(
        path.string(),
        [&config](const std::string& source_id) {
          return config.SourceDefaults(source_id);
        },
        [] { return std::int64_t{123}; });

    std::vector<hydra::Signal> signals;
    std::string error;
    if (!adapter.Poll(&signals, &error) || !signals.empty()) {
      std::cerr << "文件不存在时应视为无数据\n";
      return 1;
    }

    if (!WriteTextFile(path,
                       "{\"source_id\":\"funding_rate\",\"asset\":\"BTCUSDT\","
                       "\"direction\":-1,\"strength\":0.8}\n"
                       "{\"source_id\":\"etf_flow\",\"asset\":\"GLD\"}\n"
                       "{\"source_id\":\"etf_flow\",\"asset\":\"GLD\",")) {
      std::cerr << "无法写入 spool 文件\n";
      return 1;
    }
    if (adapter.Poll(&signals, &error) || signals.size() != 1 ||
        signals[0].source_id != "funding_rate" ||
        !NearlyEqual(signals[0].reliability_weight, 0.75) ||
        signals[0].half_life_ms != 8LL * 60 * 60 * 1000 ||
        signals[0].timestamp_ms != 123) {
      std::cerr << "spool 首轮解析不符: " << error << "\n";
      return 1;
    }
    const std::uint64_t after_first = adapter.offset();

    if (!WriteTextFile(path,
                       "\"direction\":1,\"strength\":0.5,\"timestamp_ms\":777,"
                       "\"reliability_weight\":0.9}\n",
                       true)) {
      std::cerr << "无法追加 spool 文件\n";
      return 1;
    }
    signals.clear();
    if (!adapter.Poll(&signals, &error) || signals.size() != 1 ||
        signals[0].asset != "GLD" || signals[0].timestamp_ms != 777 ||
        !NearlyEqual(signals[0].reliability_weight, 0.9) ||
        adapter.offset() <= after_first) {
      std::cerr << "不完整行补齐后应被消费\n";
      return 1;
    }

    if (!WriteTextFile(path,
                       "{\"source_id\":\"order_flow\",\"asset\":\"ETHUSDT\","
                       "\"direction\":1,\"strength\":1}\n")) {
      std::cerr << "无法重写 spool 文件\n";
      return 1;
    }
    signals.clear();
    if (!adapter.Poll(&signals, &error) || signals.size() != 1 ||
        signals[0].asset != "ETHUSDT") {
      std::cerr << "文件截断后应从头读取\n";
      return 1;
    }

    // 运行器同步轮询并写入聚合器。
    if (!WriteTextFile(path,
                       "{\"source_id\":\"order_flow\",\"asset\":\"ETHUSDT\","
                       "\"direction\":1,\"strength\":1}\n"
                       "{\"source_id\":\"order_flow\",\"asset\":\"ETHUSDT\","
                       "\"direction\":3,\"strength\":1}\n")) {
      std::cerr << "无法重写 spool 文件\n";
      return 1;
    }
    hydra::SignalAggregator aggregator;
    hydra::SourceAdapterRunner runner(&aggregator);
    runner.Add(std::make_unique<hydra::SpoolFileAdapter>(
                   path.string(),
                   [&config](const std::string& source_id) {
                     return config.SourceDefaults(source_id);
                   },
                   [] { return kDayStartMs; }),
               1000);
    if (runner.PollAllOnce() != 1 || runner.ingested_count() != 1 ||
        aggregator.StoredSignalCount() != 1) {
      std::cerr << "越界信号应被聚合器拒绝，合法信号写入\n";
      return 1;
    }
    std::filesystem::remove(path);
  }

  {
    // 资金费率极端值反向拥挤方；持仓量骤降视为强平级联。
    auto routes = std::make_shared<FakeTransport::Routes>();
    (*routes)["fundingRate"] =
        "[{\"symbol\":\"BTCUSDT\",\"fundingRate\":\"0.00080000\","
        "\"fundingTime\":1704067200000}]";
    (*routes)["openInterest"] =
        "{\"symbol\":\"BTCUSDT\",\"openInterest\":\"1000.0\",\"time\":1704067200000}";
    hydra::AdaptersConfig config;
    config.funding_symbols = {"BTCUSDT"};
    hydra::AppConfig app;
    hydra::BinanceFundingAdapter adapter(
        config, app.SourceDefaults("funding_rate"),
        app.SourceDefaults("liquidation_map"),
        std::make_unique<FakeTransport>(routes), [] { return kDayStartMs; });

    std::vector<hydra::Signal> signals;
    std::string error;
    if (!adapter.Poll(&signals, &error) || signals.size() != 1 ||
        signals[0].source_id != "funding_rate" || signals[0].direction != -1.0 ||
        !NearlyEqual(signals[0].strength, 0.8) ||
        !NearlyEqual(signals[0].reliability_weight, 0.75)) {
      std::cerr << "资金费率信号不符: " << error << "\n";
      return 1;
    }

    (*routes)["fundingRate"] = "[{\"symbol\":\"BTCUSDT\",\"fundingRate\":\"0.0001\"}]";
    (*routes)["openInterest"] = "{\"symbol\":\"BTCUSDT\",\"openInterest\":\"900.0\"}";
    signals.clear();
    if (!adapter.Poll(&signals, &error) || signals.size() != 1 ||
        signals[0].source_id != "liquidation_map" || signals[0].direction != -1.0 ||
        !NearlyEqual(signals[0].strength, 1.0)) {
      std::cerr << "持仓量级联信号不符\n";
      return 1;
    }

    routes->clear();
    signals.clear();
    if (adapter.Poll(&signals, &error) || error.empty() || !signals.empty()) {
      std::cerr << "上游不可用时应返回失败且不产出信号\n";
      return 1;
    }

    double rate = 0.0;
    if (hydra::BinanceFundingAdapter::ParseFundingRate("[]", &rate, &error)) {
      std::cerr << "空 fundingRate 响应应解析失败\n";
      return 1;
    }
  }

  {
    // 通知：队列满时丢弃最旧事件，投递顺序保持。
    auto seen = std::make_shared<std::vector<hydra::NotifyEventType>>();
    hydra::Notifier notifier(2);
    notifier.AddSink(std::make_unique<RecordingSink>(seen));
    notifier.Publish(hydra::NotifyEvent{.type = hydra::NotifyEventType::kApproved});
    notifier.Publish(hydra::NotifyEvent{.type = hydra::NotifyEventType::kRejected});
    notifier.Publish(hydra::NotifyEvent{.type = hydra::NotifyEventType::kKillSwitch});
    if (notifier.dropped_count() != 1 || notifier.pending_count() != 2) {
      std::cerr << "队列满时应丢弃最旧事件\n";
      return 1;
    }
    notifier.Start();
    if (!notifier.Flush(std::chrono::milliseconds(2000)) ||
        notifier.delivered_count() != 2 || seen->size() != 2 ||
        (*seen)[0] != hydra::NotifyEventType::kRejected ||
        (*seen)[1] != hydra::NotifyEventType::kKillSwitch) {
      std::cerr << "通知投递顺序不符\n";
      return 1;
    }
    notifier.Stop();

    hydra::NotifyEvent event{.type = hydra::NotifyEventType::kApproved};
    event.With("asset", "SPY").With("notional", "3000.00");
    if (event.ToText() != "APPROVED asset=SPY, notional=3000.00") {
      std::cerr << "通知文本不符: " << event.ToText() << "\n";
      return 1;
    }
    hydra::JsonValue payload;
    std::string error;
    if (!hydra::ParseJson(hydra::TelegramNotifySink::BuildPayload("42", event),
                          &payload, &error) ||
        hydra::JsonAsString(hydra::JsonObjectField(&payload, "chat_id")).value_or("") !=
            "42" ||
        hydra::JsonAsString(hydra::JsonObjectField(&payload, "text")).value_or("") !=
            "[HYDRA] APPROVED\nasset: SPY\nnotional: 3000.00") {
      std::cerr << "Telegram 请求体不符\n";
      return 1;
    }
  }

  {
    // 快照接口路由。
    hydra::SnapshotStore store;
    const auto health = hydra::DashboardServer::HandleRequest("GET", "/api/health", store);
    if (health.status != 200 ||
        health.body != "{\"status\":\"ok\",\"has_snapshot\":false}") {
      std::cerr << "health 响应不符: " << health.body << "\n";
      return 1;
    }
    if (hydra::DashboardServer::HandleRequest("GET", "/api/snapshot", store).status != 503 ||
        hydra::DashboardServer::HandleRequest("POST", "/api/snapshot", store).status != 405 ||
        hydra::DashboardServer::HandleRequest("GET", "/nope", store).status != 404) {
      std::cerr << "快照接口状态码不符\n";
      return 1;
    }
    hydra::RealizedOutcome outcome;
    outcome.position_id = "pos-1-SPY";
    store.RecordOutcomes({outcome});
    hydra::DashboardSnapshot snapshot;
    snapshot.cycle = 7;
    store.Publish(snapshot);
    const auto served =
        hydra::DashboardServer::HandleRequest("GET", "/api/snapshot?pretty=0", store);
    if (served.status != 200 || served.body.find("\"cycle\":7") == std::string::npos ||
        served.body.find("pos-1-SPY") == std::string::npos) {
      std::cerr << "快照负载不符\n";
      return 1;
    }
    hydra::JsonValue parsed;
    std::string error;
    if (!hydra::ParseJson(served.body, &parsed, &error)) {
      std::cerr << "快照负载应为合法 JSON: " << error << "\n";
      return 1;
    }
  }

  {
    // 空闲连接：超时断开后继续服务其他读者，且不阻塞 Stop。
    namespace asio = boost::asio;
    namespace http = boost::beast::http;
    using tcp = asio::ip::tcp;

    hydra::SnapshotStore store;
    hydra::DashboardConfig config;
    config.enabled = true;
    config.port = 0;
    config.io_timeout_ms = 300;
    hydra::DashboardServer server(config, &store);
    std::string error;
    if (!server.Start(&error) || server.bound_port() <= 0) {
      std::cerr << "dashboard 启动失败: " << error << "\n";
      return 1;
    }
    const tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"),
                                 static_cast<unsigned short>(server.bound_port()));
    asio::io_context ioc;
    tcp::socket idle(ioc);
    idle.connect(endpoint);

    tcp::socket reader(ioc);
    reader.connect(endpoint);
    http::request<http::empty_body> request{http::verb::get, "/api/health", 11};
    request.set(http::field::host, "127.0.0.1");
    http::write(reader, request);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(reader, buffer, response);
    if (response.result_int() != 200 ||
        response.body().find("\"status\":\"ok\"") == std::string::npos) {
      std::cerr << "空闲连接超时后应继续服务: " << response.body() << "\n";
      return 1;
    }

    tcp::socket second_idle(ioc);
    second_idle.connect(endpoint);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    const auto stop_begin = std::chrono::steady_clock::now();
    server.Stop();
    const auto stop_elapsed = std::chrono::steady_clock::now() - stop_begin;
    if (stop_elapsed > std::chrono::milliseconds(1000)) {
      std::cerr << "存在空闲连接时 Stop 不应阻塞\n";
      return 1;
    }
  }

  {
    // 运维解除 halt：跨线程请求，下一周期生效；账本仍不一致时拒绝。
    hydra::AppConfig config;
    hydra::ReplayPriceFeed feed;
    hydra::SignalAggregator aggregator(config.aggregator);
    hydra::RiskLedger ledger(config.risk);
    hydra::PaperExecutor paper(&feed, config.executor.paper_slippage_bps);
    hydra::AsyncExecutor executor(&paper);
    executor.Start();
    hydra::DecisionCycle cycle(config, hydra::CycleDependencies{
                                           .aggregator = &aggregator,
                                           .price_feed = &feed,
                                           .ledger = &ledger,
                                           .executor = &executor,
                                           .notifier = nullptr,
                                           .snapshots = nullptr,
                                       });
    hydra::RiskState broken = ledger.Snapshot();
    broken.open_exposure_by_asset["SPY"] = 100.0;
    broken.open_exposure_total = 400.0;
    broken.halted = true;
    broken.halt_reason = "exposure mismatch";
    ledger.RestoreState(broken);

    cycle.RunOnce(kDayStartMs);
    std::thread early([&cycle] { cycle.RequestHaltResume("ops: 未修复"); });
    early.join();
    cycle.RunOnce(kDayStartMs + 1000);
    if (!ledger.Snapshot().halted) {
      executor.Stop();
      std::cerr << "账本不一致时不应解除 halt\n";
      return 1;
    }

    hydra::RiskState repaired = ledger.Snapshot();
    repaired.open_exposure_total = 100.0;
    ledger.RestoreState(repaired);
    cycle.RunOnce(kDayStartMs + 2000);
    if (!ledger.Snapshot().halted) {
      executor.Stop();
      std::cerr << "无运维请求时 halt 应保持\n";
      return 1;
    }
    std::thread operator_thread([&cycle] { cycle.RequestHaltResume("ops: 已修复"); });
    operator_thread.join();
    cycle.RunOnce(kDayStartMs + 3000);
    executor.Stop();
    if (ledger.Snapshot().halted) {
      std::cerr << "修复后的运维请求应解除 halt\n";
      return 1;
    }
  }

  {
    // 端到端：回放价格源 + 纸面执行，CRASH 下事件波动策略开仓，次周期止损。
    constexpr std::int64_t kBarMs = 60000;
    constexpr int kBars = 60;
    hydra::ReplayPriceFeed feed;
    double spy = 400.0;
    for (int i = 0; i < kBars; ++i) {
      const std::int64_t ts = kDayStartMs + i * kBarMs;
      spy *= 0.995;
      feed.AppendClose("SPY", ts, spy);
      feed.AppendClose("VIX", ts, 35.0);
      feed.AppendClose("GLD", ts, 200.0);
    }
    const std::int64_t now = kDayStartMs + (kBars - 1) * kBarMs;
    feed.AdvanceTo(now);

    hydra::AppConfig config;
    config.regime.volatility_index_asset = "VIX";
    config.strategies.liquidation_flow.enabled = false;
    config.strategies.margin_flow.enabled = false;
    config.strategies.narrative_shock.enabled = false;
    config.strategies.cross_asset_graph.enabled = false;

    hydra::SignalAggregator aggregator(config.aggregator);
    hydra::RiskLedger ledger(config.risk);
    hydra::PaperExecutor paper(&feed, config.executor.paper_slippage_bps);
    hydra::AsyncExecutor executor(&paper);
    executor.Start();
    hydra::SnapshotStore snapshots;
    hydra::DecisionCycle cycle(config, hydra::CycleDependencies{
                                           .aggregator = &aggregator,
                                           .price_feed = &feed,
                                           .ledger = &ledger,
                                           .executor = &executor,
                                           .notifier = nullptr,
                                           .snapshots = &snapshots,
                                       });

    std::string error;
    if (!aggregator.Ingest(MakeSignal("etf_flow", "GLD", 1.0, 1.0, 0.9, now), &error) ||
        !aggregator.Ingest(MakeSignal("physical_premium", "GLD", 1.0, 1.0, 0.9, now),
                           &error)) {
      std::cerr << "端到端信号写入失败: " << error << "\n";
      return 1;
    }

    const hydra::CycleSummary first = cycle.RunOnce(now);
    if (first.regime.regime != hydra::Regime::kCrash || first.proposals != 1 ||
        first.approved != 1 || first.fills != 1 || first.failed_orders != 0) {
      std::cerr << "首周期结果不符: regime=" << hydra::ToString(first.regime.regime)
                << ", proposals=" << first.proposals
                << ", approved=" << first.approved << ", fills=" << first.fills
                << "\n";
      executor.Stop();
      return 1;
    }
    if (first.decisions.size() != 1 ||
        first.decisions[0].strategy_id != "event_volatility" ||
        !NearlyEqual(first.decisions[0].sized_notional, 3000.0) ||
        cycle.positions().open_count() != 1 || cycle.pending_order_count() != 0) {
      std::cerr << "首周期开仓不符\n";
      executor.Stop();
      return 1;
    }
    const hydra::DashboardSnapshot published = snapshots.Latest();
    if (!snapshots.has_snapshot() || published.cycle != 1 ||
        published.open_positions.size() != 1 ||
        !NearlyEqual(published.risk.open_exposure_total, 3000.0)) {
      std::cerr << "首周期快照不符\n";
      executor.Stop();
      return 1;
    }

    // 次周期价格跌破止损：旧仓止损平仓，同一资产在剩余额度内再开新仓。
    const std::int64_t later = now + kBarMs;
    feed.AppendClose("SPY", later, spy * 0.995);
    feed.AppendClose("VIX", later, 35.0);
    feed.AppendClose("GLD", later, 196.0);
    feed.AdvanceTo(later);
    const hydra::CycleSummary second = cycle.RunOnce(later);
    executor.Stop();
    if (second.closed_positions != 1 || second.outcomes.size() != 1 ||
        second.outcomes[0].exit_reason != hydra::ExitReason::kStop ||
        second.outcomes[0].pnl >= 0.0 || second.approved != 1 ||
        !NearlyEqual(second.decisions[0].sized_notional, 2000.0)) {
      std::cerr << "次周期止损结果不符: closed=" << second.closed_positions
                << ", approved=" << second.approved << "\n";
      return 1;
    }
    const hydra::RiskState state = ledger.Snapshot();
    if (!NearlyEqual(state.open_exposure_total, 2000.0) ||
        state.consecutive_losses != 1 || state.trades_today != 2 ||
        cycle.positions().open_count() != 1 ||
        snapshots.Latest().recent_outcomes.size() != 1) {
      std::cerr << "次周期账本状态不符: exposure=" << state.open_exposure_total << "\n";
      return 1;
    }
  }

  return 0;
}
