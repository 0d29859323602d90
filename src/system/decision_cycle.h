#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "exchange/price_feed.h"
#include "execution/async_executor.h"
#include "monitor/dashboard_snapshot.h"
#include "monitor/notifier.h"
#include "oms/position_manager.h"
#include "regime/regime_detector.h"
#include "regime/regime_features.h"
#include "risk/risk_ledger.h"
#include "risk/risk_manager.h"
#include "signal/signal_aggregator.h"
#include "strategy/proposal_ranker.h"
#include "strategy/strategy_module.h"
#include "strategy/strategy_weights.h"

namespace hydra {

/// 外部注入的协作者（均不拥有所有权）；notifier / snapshots 可为空。
struct CycleDependencies {
  SignalAggregator* aggregator{nullptr};
  const PriceFeed* price_feed{nullptr};
  RiskLedger* ledger{nullptr};
  AsyncExecutor* executor{nullptr};
  Notifier* notifier{nullptr};
  SnapshotStore* snapshots{nullptr};
};

/// 单周期统计（周期摘要日志与测试断言用）。
struct CycleSummary {
  std::int64_t cycle{0};
  std::int64_t now_ms{0};
  RegimeState regime{};
  int purged_signals{0};
  int scored_assets{0};
  int proposals{0};
  int ranked{0};
  int approved{0};
  int rejected{0};
  int fills{0};
  int failed_orders{0};
  int closed_positions{0};
  int unpriced_positions{0};
  int weight_updates{0};
  std::vector<DecisionRecord> decisions;
  std::vector<RealizedOutcome> outcomes;
};

/**
 * @brief 决策周期编排
 *
 * 一次 `RunOnce` 依次完成：回报处理 -> 信号聚合 -> Regime 识别 -> 取价
 * -> 策略并发生成 -> 排序取 TopK -> 逐个风控 -> 提交执行并有界等待
 * -> 持仓生命周期 -> 权重更新 -> 发布快照。
 *
 * 线程模型：`RunOnce` 只能由单个周期线程调用。
 */
class DecisionCycle {
 public:
  DecisionCycle(const AppConfig& config, CycleDependencies deps);

  CycleSummary RunOnce(std::int64_t now_ms);

  /// 运维请求解除风控 halt（任意线程可调用），下一周期开始时生效。
  void RequestHaltResume(const std::string& operator_note);

  const PositionManager& positions() const { return positions_; }
  PositionManager* mutable_positions() { return &positions_; }
  const StrategyWeightBook& weights() const { return weights_; }
  StrategyWeightBook* mutable_weights() { return &weights_; }
  const RegimeDetector& regime_detector() const { return detector_; }
  std::size_t pending_order_count() const { return pending_orders_.size(); }
  std::int64_t cycle_count() const { return cycle_count_; }

 private:
  void ApplyResumeRequest();
  RegimeState ClassifyRegime(std::int64_t now_ms);
  std::unordered_map<std::string, double> FetchPrices() const;
  std::optional<double> AssetVolatility(const std::string& asset) const;
  void EvaluateRanked(const std::vector<RankedProposal>& ranked,
                      std::int64_t now_ms, CycleSummary* summary);
  void ApplyFillReports(const std::vector<FillReport>& reports,
                        std::int64_t now_ms, CycleSummary* summary);
  void ExpireStaleOrders(std::int64_t now_ms, CycleSummary* summary);
  void ProcessLifecycle(std::int64_t now_ms, CycleSummary* summary);
  void PublishSnapshot(const std::vector<AggregatedScore>& scores,
                       const CycleSummary& summary);
  void Notify(NotifyEvent event);

  AppConfig config_;
  CycleDependencies deps_;
  RegimeFeatureExtractor extractor_;
  RegimeDetector detector_;
  StrategySet strategies_;
  ProposalRanker ranker_;
  RiskManager risk_manager_;
  PositionManager positions_;
  StrategyWeightBook weights_;
  std::map<std::string, ApprovedOrder> pending_orders_;  ///< order_id -> 待回报订单。
  std::int64_t cycle_count_{0};
  std::uint64_t order_seq_{0};
  bool halt_notified_{false};
  std::mutex resume_mutex_;
  std::optional<std::string> resume_note_;  ///< 待处理的解除 halt 请求。
  std::int64_t kill_switch_notified_day_{-1};
};

}  // namespace hydra
