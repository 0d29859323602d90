#include "execution/async_executor.h"

#include <exception>
#include <utility>

#include "core/log.h"

namespace hydra {

AsyncExecutor::AsyncExecutor(Executor* executor) : executor_(executor) {}

AsyncExecutor::~AsyncExecutor() {
  Stop();
}

void AsyncExecutor::Start() {
  if (worker_.joinable()) {
    return;
  }
  worker_ = std::thread(&AsyncExecutor::WorkerLoop, this);
}

void AsyncExecutor::Stop() {
  if (!worker_.joinable()) {
    return;
  }
  // 通过投递 stop 任务优雅退出，已排队订单先执行完。
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    task_queue_.push(Task{.type = Task::kStop, .order = {}});
  }
  queue_cv_.notify_one();
  worker_.join();
}

void AsyncExecutor::Submit(const ApprovedOrder& order) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    task_queue_.push(Task{.type = Task::kSubmit, .order = order});
  }
  queue_cv_.notify_one();
}

void AsyncExecutor::PollResults(std::vector<FillReport>* out_results) {
  if (out_results == nullptr) return;
  out_results->clear();
  std::lock_guard<std::mutex> lock(result_mutex_);
  if (results_.empty()) {
    return;
  }
  // swap 方式把锁持有时间降到最短。
  out_results->swap(results_);
}

bool AsyncExecutor::WaitForResults(std::size_t expected,
                                   std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(result_mutex_);
  return result_cv_.wait_for(lock, timeout,
                             [this, expected] { return results_.size() >= expected; });
}

void AsyncExecutor::WorkerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !task_queue_.empty(); });
      task = std::move(task_queue_.front());
      task_queue_.pop();
    }

    // 统一由 stop 任务驱动退出，保证线程收敛路径可控。
    if (task.type == Task::kStop) {
      break;
    }

    FillReport report;
    report.order_id = task.order.order_id;
    if (executor_ == nullptr) {
      report.error = "executor 未配置";
    } else {
      try {
        report = executor_->SubmitOrder(task.order);
        report.order_id = task.order.order_id;
      } catch (const std::exception& ex) {
        report.filled = false;
        report.error = std::string("SubmitOrder 异常: ") + ex.what();
        LogError("EXECUTOR_EXCEPTION: order_id=" + task.order.order_id +
                 ", error=" + ex.what());
      }
    }

    {
      std::lock_guard<std::mutex> lock(result_mutex_);
      results_.push_back(std::move(report));
    }
    result_cv_.notify_all();
  }
}

}  // namespace hydra
