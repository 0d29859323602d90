#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/config.h"
#include "strategy/strategy_module.h"

namespace hydra {

/**
 * @brief 清算流策略（BTC/ETH 永续）
 *
 * 资金费率/持仓量/清算地图形成一致方向时顺势入场；
 * 止损止盈按波动率水平放宽（max(1, vol/25)）。
 */
class LiquidationFlowStrategy : public StrategyModule {
 public:
  explicit LiquidationFlowStrategy(StrategyParams params);

 protected:
  std::vector<TradeProposal> Generate(const StrategyInput& input) const override;
};

/// 宏观事件波动策略：止损距离随波动率放大，目标保持固定盈亏比。
class EventVolatilityStrategy : public StrategyModule {
 public:
  explicit EventVolatilityStrategy(StrategyParams params);

 protected:
  std::vector<TradeProposal> Generate(const StrategyInput& input) const override;
};

/// 贵金属保证金流策略：RECOVERY / MEAN_REVERTING 下仅做多（逢低买入）。
class MarginFlowStrategy : public StrategyModule {
 public:
  explicit MarginFlowStrategy(StrategyParams params);

 protected:
  std::vector<TradeProposal> Generate(const StrategyInput& input) const override;
};

/**
 * @brief 叙事冲击策略
 *
 * 以板块 ETF 作为叙事领头：领头显著走弱时做空受损标的；
 * RECOVERY 阶段领头回暖时做多被错杀标的。
 */
class NarrativeShockStrategy : public StrategyModule {
 public:
  NarrativeShockStrategy(StrategyParams params,
                         std::string leader_asset,
                         std::vector<std::string> impaired_assets,
                         std::vector<std::string> punished_assets);

 protected:
  std::vector<TradeProposal> Generate(const StrategyInput& input) const override;

 private:
  std::string leader_asset_;
  std::vector<std::string> impaired_assets_;
  std::vector<std::string> punished_assets_;
};

/// 跨资产传导策略：领先资产已表态而跟随资产尚未反应时，按边方向交易跟随者。
class CrossAssetGraphStrategy : public StrategyModule {
 public:
  CrossAssetGraphStrategy(StrategyParams params,
                          std::vector<CrossAssetEdge> edges,
                          double max_follower_direction);

 protected:
  std::vector<TradeProposal> Generate(const StrategyInput& input) const override;

 private:
  std::vector<CrossAssetEdge> edges_;
  double max_follower_direction_{0.15};
};

/// 按固定注册顺序构建五个内置策略。
StrategySet BuildDefaultStrategies(const StrategiesConfig& config);

}  // namespace hydra
