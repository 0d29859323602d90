#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "core/config.h"
#include "monitor/dashboard_snapshot.h"

namespace hydra {

/// 路由结果（与传输层解耦，便于单测）。
struct DashboardResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

/**
 * @brief 只读快照 HTTP 服务（Boost.Beast，单连接串行处理，读写受 io_timeout_ms 约束）
 *
 * 路由：
 * - `GET /api/snapshot`：最近一次 DashboardSnapshot；
 * - `GET /api/health`：存活与是否已有快照。
 * 其余方法返回 405，其余路径返回 404。
 */
class DashboardServer {
 public:
  DashboardServer(DashboardConfig config, const SnapshotStore* store);
  ~DashboardServer();

  DashboardServer(const DashboardServer&) = delete;
  DashboardServer& operator=(const DashboardServer&) = delete;

  /// 绑定端口并启动服务线程；绑定失败返回 false。
  bool Start(std::string* out_error);
  void Stop();

  /// 实际监听端口（配置端口为 0 时由系统分配）。
  int bound_port() const { return bound_port_; }

  static DashboardResponse HandleRequest(const std::string& method,
                                         const std::string& target,
                                         const SnapshotStore& store);

 private:
  void ServeLoop();

  DashboardConfig config_;
  const SnapshotStore* store_{nullptr};
  std::atomic<bool> running_{false};
  int bound_port_{0};
  std::thread worker_;
  struct Impl;
  std::unique_ptr<Impl> impl_;  ///< asio 上下文与 acceptor（隔离 Beast 头文件）。
};

}  // namespace hydra
