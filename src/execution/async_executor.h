#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "core/types.h"
#include "execution/executor.h"

namespace hydra {

/**
 * @brief 异步执行器（单工作线程串行执行）
 *
 * 设计目的：
 * 1. 周期线程只负责"投递订单"，不阻塞在执行层调用；
 * 2. 执行层统一在单线程串行执行，避免并发下单竞态；
 * 3. 回报由周期线程轮询消费，可选有界等待。
 */
class AsyncExecutor {
 public:
  /**
   * @param executor 执行层实现，生命周期由外部管理（不持有所有权）
   */
  explicit AsyncExecutor(Executor* executor);
  ~AsyncExecutor();

  AsyncExecutor(const AsyncExecutor&) = delete;
  AsyncExecutor& operator=(const AsyncExecutor&) = delete;

  /// 启动后台工作线程；重复调用无副作用。
  void Start();
  /// 投递 stop 任务并等待线程退出（幂等）。
  void Stop();

  /// 异步提交已批准订单。
  void Submit(const ApprovedOrder& order);

  /// 非阻塞轮询执行回报；返回后 `out_results` 持有本轮所有回报。
  void PollResults(std::vector<FillReport>* out_results);

  /**
   * @brief 有界等待：直到累计回报数达到 expected 或超时
   *
   * @return 超时前是否已满足 expected
   */
  bool WaitForResults(std::size_t expected, std::chrono::milliseconds timeout);

 private:
  void WorkerLoop();

  struct Task {
    enum Type { kSubmit, kStop } type;
    ApprovedOrder order;  ///< submit 任务有效载荷。
  };

  Executor* executor_{nullptr};  ///< 外部注入执行层（不拥有所有权）。
  std::thread worker_;  ///< 后台执行线程。
  std::mutex queue_mutex_;  ///< 任务队列互斥锁。
  std::condition_variable queue_cv_;  ///< 任务到达通知。
  std::queue<Task> task_queue_;  ///< 待执行任务队列。

  std::mutex result_mutex_;  ///< 回报缓冲区互斥锁。
  std::condition_variable result_cv_;  ///< 回报到达通知。
  std::vector<FillReport> results_;  ///< 待周期线程消费的回报。
};

}  // namespace hydra
