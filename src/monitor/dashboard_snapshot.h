#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.h"
#include "risk/risk_ledger.h"

namespace hydra {

/// 单个提案的排序与风控结论。
struct DecisionRecord {
  std::string strategy_id;
  std::string asset;
  int direction{0};
  double score{0.0};
  bool approved{false};
  RejectReason reason{RejectReason::kNone};
  std::string detail;
  double sized_notional{0.0};
};

/// 一个决策周期结束时的只读视图。
struct DashboardSnapshot {
  std::int64_t cycle{0};
  std::int64_t ts_ms{0};
  RegimeState regime{};
  std::vector<AggregatedScore> scores;
  std::vector<DecisionRecord> decisions;
  std::vector<Position> open_positions;
  std::vector<RealizedOutcome> recent_outcomes;  ///< 新的在后。
  RiskState risk{};
  std::vector<StrategyWeight> weights;
  std::uint64_t notifications_dropped{0};
};

/// 快照 JSON 序列化（`/api/snapshot` 负载）。
std::string DashboardSnapshotToJson(const DashboardSnapshot& snapshot);

/**
 * @brief 最近快照存储
 *
 * 决策线程发布，HTTP 线程读取；读取返回副本。
 * 已实现结果额外保留最近 `max_outcomes` 条，跨周期累积。
 */
class SnapshotStore {
 public:
  explicit SnapshotStore(std::size_t max_outcomes = 50)
      : max_outcomes_(max_outcomes) {}

  void RecordOutcomes(const std::vector<RealizedOutcome>& outcomes);
  /// 发布快照；recent_outcomes 由存储填充。
  void Publish(DashboardSnapshot snapshot);
  DashboardSnapshot Latest() const;
  bool has_snapshot() const;

 private:
  std::size_t max_outcomes_;
  mutable std::mutex mutex_;
  DashboardSnapshot latest_{};
  bool published_{false};
  std::deque<RealizedOutcome> outcomes_;
};

}  // namespace hydra
