#pragma once

#include <string>

#include "core/types.h"
#include "exchange/price_feed.h"

namespace hydra {

/**
 * @brief 执行层抽象
 *
 * 同步接口：返回 filled=true 表示成交；filled=false 且 error 非空表示失败。
 * 调用发生在 AsyncExecutor 工作线程上，不得阻塞过久。
 */
class Executor {
 public:
  virtual ~Executor() = default;
  virtual std::string Name() const = 0;
  virtual FillReport SubmitOrder(const ApprovedOrder& order) = 0;
};

/**
 * @brief 纸面执行器
 *
 * 以价格源当前价成交，按方向施加固定滑点（bps）。
 * 取价失败时返回失败回报，由上层释放预占敞口。
 */
class PaperExecutor : public Executor {
 public:
  /**
   * @param feed 价格源，生命周期由外部管理（不持有所有权）
   */
  PaperExecutor(const PriceFeed* feed, double slippage_bps)
      : feed_(feed), slippage_bps_(slippage_bps) {}

  std::string Name() const override { return "paper"; }
  FillReport SubmitOrder(const ApprovedOrder& order) override;

 private:
  const PriceFeed* feed_{nullptr};
  double slippage_bps_{0.0};
};

}  // namespace hydra
