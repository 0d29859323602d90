#include "execution/executor.h"

namespace hydra {

FillReport PaperExecutor::SubmitOrder(const ApprovedOrder& order) {
  FillReport report;
  report.order_id = order.order_id;
  if (feed_ == nullptr) {
    report.error = "paper executor 未配置价格源";
    return report;
  }
  double price = 0.0;
  std::string error;
  if (!feed_->GetPrice(order.proposal.asset, &price, &error)) {
    report.error = "取价失败: " + error;
    return report;
  }
  const double slip = slippage_bps_ / 10000.0;
  report.filled = true;
  report.fill_price = price * (1.0 + order.proposal.direction * slip);
  report.filled_notional = order.sized_notional;
  return report;
}

}  // namespace hydra
