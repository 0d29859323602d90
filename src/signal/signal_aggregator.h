#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace hydra {

/**
 * @brief 多来源信号聚合器
 *
 * 每个 (asset, source_id) 仅保留最新一条 Signal；聚合时按
 * reliability * strength * 指数衰减 计算有效权重，输出净方向与置信度。
 *
 * 并发约束：
 * 1. 任意线程可并发 `Ingest`，单互斥量保证不丢更新；
 * 2. `Aggregate/Snapshot` 在同一把锁内读取，结果对应一致的信号集合。
 */
class SignalAggregator {
 public:
  explicit SignalAggregator(AggregatorConfig config = {}) : config_(config) {}

  /**
   * @brief 写入一条信号
   *
   * 字段越界、资产/来源为空、半衰期非正、非有限值均拒绝并返回 false；
   * 时间戳早于已存信号的旧数据被忽略（返回 true，不覆盖）。
   */
  bool Ingest(const Signal& signal, std::string* out_error);

  /// 单资产聚合；无有效信号时方向与置信度均为 0。
  AggregatedScore Aggregate(const std::string& asset, std::int64_t now_ms) const;

  /// 全部资产聚合（同一把锁内计算），按资产名排序。
  std::vector<AggregatedScore> Snapshot(std::int64_t now_ms) const;

  /// 删除已过期信号，返回删除数量；重复调用幂等。
  int PurgeExpired(std::int64_t now_ms);

  /// 当前存储的信号条数（含尚未清理的过期信号）。
  std::size_t StoredSignalCount() const;

  /// 单条信号在 now 时刻的有效权重；过期返回 0。
  static double EffectiveWeight(const Signal& signal, std::int64_t now_ms,
                                double expiry_half_lives);

  /// 字段合法性校验（不含去重）。
  static bool ValidateSignal(const Signal& signal, std::string* out_error);

 private:
  using SourceMap = std::unordered_map<std::string, Signal>;

  AggregatedScore AggregateLocked(const std::string& asset,
                                  const SourceMap& sources,
                                  std::int64_t now_ms) const;
  bool IsExpired(const Signal& signal, std::int64_t now_ms) const;

  AggregatorConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SourceMap> store_;  ///< asset -> source_id -> 最新信号。
};

}  // namespace hydra
