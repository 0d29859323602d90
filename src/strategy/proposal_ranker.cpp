#include "strategy/proposal_ranker.h"

#include <algorithm>
#include <cmath>

namespace hydra {

int ProposalRanker::PriorityOf(const std::string& strategy_id) const {
  const auto& order = config_.strategy_priority;
  const auto it = std::find(order.begin(), order.end(), strategy_id);
  if (it == order.end()) {
    return static_cast<int>(order.size());
  }
  return static_cast<int>(it - order.begin());
}

std::vector<RankedProposal> ProposalRanker::Rank(
    const std::vector<TradeProposal>& proposals,
    const WeightLookup& weight_of) const {
  std::vector<RankedProposal> ranked;
  ranked.reserve(proposals.size());
  for (const auto& proposal : proposals) {
    RankedProposal item;
    item.proposal = proposal;
    item.strategy_weight = weight_of ? weight_of(proposal.strategy_id) : 1.0;
    item.score =
        proposal.confidence * proposal.reward_to_risk * item.strategy_weight;
    // 非有限得分排到最后，由风控按 INVALID_PROPOSAL 拒绝。
    if (!std::isfinite(item.score)) {
      item.score = -1.0;
    }
    ranked.push_back(std::move(item));
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [this](const RankedProposal& lhs, const RankedProposal& rhs) {
                     if (lhs.score != rhs.score) {
                       return lhs.score > rhs.score;
                     }
                     return PriorityOf(lhs.proposal.strategy_id) <
                            PriorityOf(rhs.proposal.strategy_id);
                   });
  return ranked;
}

std::vector<RankedProposal> ProposalRanker::TopK(
    const std::vector<TradeProposal>& proposals,
    const WeightLookup& weight_of) const {
  std::vector<RankedProposal> ranked = Rank(proposals, weight_of);
  const std::size_t k = static_cast<std::size_t>(std::max(0, config_.top_k));
  if (ranked.size() > k) {
    ranked.resize(k);
  }
  return ranked;
}

}  // namespace hydra
