#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace hydra {

/// 排序后的提案及其得分。
struct RankedProposal {
  TradeProposal proposal;
  double score{0.0};
  double strategy_weight{1.0};
};

/**
 * @brief 提案排序器
 *
 * score = confidence * reward_to_risk * weight(strategy)；
 * 稳定降序排序，得分相同时按配置的策略优先级，未列出的策略排最后。
 * 同一输入多次排序结果完全一致。
 */
class ProposalRanker {
 public:
  using WeightLookup = std::function<double(const std::string&)>;

  explicit ProposalRanker(RankingConfig config = {}) : config_(config) {}

  std::vector<RankedProposal> Rank(const std::vector<TradeProposal>& proposals,
                                   const WeightLookup& weight_of) const;

  /// 排序后截取前 K 个。
  std::vector<RankedProposal> TopK(const std::vector<TradeProposal>& proposals,
                                   const WeightLookup& weight_of) const;

 private:
  int PriorityOf(const std::string& strategy_id) const;

  RankingConfig config_;
};

}  // namespace hydra
