#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace hydra {

/// 单周期只读输入快照：策略之间共享，任何策略都不得修改。
struct StrategyInput {
  std::unordered_map<std::string, AggregatedScore> scores;
  RegimeState regime{};
  std::unordered_map<std::string, double> prices;  ///< 取价失败的资产不出现。
  std::int64_t now_ms{0};

  const AggregatedScore* Score(const std::string& asset) const;
  std::optional<double> Price(const std::string& asset) const;
};

/**
 * @brief 策略模块基类
 *
 * 基类负责公共门槛：启用开关、Regime 适用集合、最小 Regime 置信度；
 * 子类只实现 `Generate` 中的具体规则。产出零个提案是正常情况。
 */
class StrategyModule {
 public:
  StrategyModule(std::string id, StrategyParams params,
                 std::vector<Regime> eligible_regimes);
  virtual ~StrategyModule() = default;

  StrategyModule(const StrategyModule&) = delete;
  StrategyModule& operator=(const StrategyModule&) = delete;

  const std::string& id() const { return id_; }
  const StrategyParams& params() const { return params_; }
  bool IsEligible(const RegimeState& regime) const;

  /// 门槛检查通过后调用 `Generate`；输出保证 strategy_id 与 reward_to_risk 已填充。
  std::vector<TradeProposal> Propose(const StrategyInput& input) const;

 protected:
  virtual std::vector<TradeProposal> Generate(const StrategyInput& input) const = 0;

  /// 构造提案并计算盈亏比；价格非法时返回 nullopt。
  std::optional<TradeProposal> MakeProposal(const std::string& asset,
                                            int direction,
                                            double entry,
                                            double stop,
                                            double target,
                                            double confidence,
                                            std::string rationale) const;

  /// 分数是否达到本策略的置信度与方向门槛。
  bool PassesScoreGate(const AggregatedScore& score) const;

 private:
  std::string id_;
  StrategyParams params_;
  std::vector<Regime> eligible_regimes_;
};

/**
 * @brief 策略注册表
 *
 * 按注册顺序保存策略；`RunAll` 为每个策略启动独立任务并发执行，
 * 全部完成后按注册顺序合并。单个策略抛出的异常只影响其自身输出。
 */
class StrategySet {
 public:
  void Add(std::unique_ptr<StrategyModule> module);
  std::vector<TradeProposal> RunAll(const StrategyInput& input) const;

  std::size_t size() const { return modules_.size(); }
  const StrategyModule* Find(const std::string& id) const;

 private:
  std::vector<std::unique_ptr<StrategyModule>> modules_;
};

}  // namespace hydra
