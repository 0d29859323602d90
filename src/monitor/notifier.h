#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/config.h"
#include "exchange/http_transport.h"

namespace hydra {

/// 通知事件类型。
enum class NotifyEventType {
  kApproved,
  kRejected,
  kKillSwitch,
  kPositionClosed,
  kPositionUnpriced,
  kOrderFailed,
  kRiskHalted,
};

const char* ToString(NotifyEventType type);

/// 结构化通知事件：fields 保持插入顺序。
struct NotifyEvent {
  NotifyEventType type{NotifyEventType::kApproved};
  std::int64_t ts_ms{0};
  std::vector<std::pair<std::string, std::string>> fields;

  NotifyEvent& With(std::string key, std::string value) {
    fields.emplace_back(std::move(key), std::move(value));
    return *this;
  }
  /// 单行文本：`TYPE k=v, k=v`。
  std::string ToText() const;
};

/// 通知下游接口。
class NotifySink {
 public:
  virtual ~NotifySink() = default;
  virtual std::string Name() const = 0;
  virtual bool Deliver(const NotifyEvent& event, std::string* out_error) = 0;
};

/// 写入日志。
class LogNotifySink final : public NotifySink {
 public:
  std::string Name() const override { return "log"; }
  bool Deliver(const NotifyEvent& event, std::string* out_error) override;
};

/// Telegram Bot API：POST /bot<token>/sendMessage。
class TelegramNotifySink final : public NotifySink {
 public:
  TelegramNotifySink(std::string api_base, std::string bot_token,
                     std::string chat_id,
                     std::unique_ptr<HttpTransport> transport);

  std::string Name() const override { return "telegram"; }
  bool Deliver(const NotifyEvent& event, std::string* out_error) override;

  /// sendMessage 请求体。
  static std::string BuildPayload(const std::string& chat_id,
                                  const NotifyEvent& event);

 private:
  std::string api_base_;
  std::string bot_token_;
  std::string chat_id_;
  std::unique_ptr<HttpTransport> transport_;
};

/**
 * @brief 异步通知器（有界队列 + 单工作线程）
 *
 * `Publish` 永不阻塞决策线程：队列满时丢弃最旧事件并计数。
 * 投递失败只记日志，不回传核心。
 */
class Notifier {
 public:
  explicit Notifier(std::size_t capacity = 256);
  ~Notifier();

  Notifier(const Notifier&) = delete;
  Notifier& operator=(const Notifier&) = delete;

  /// 仅在 Start 之前调用。
  void AddSink(std::unique_ptr<NotifySink> sink);

  void Start();
  /// 排空队列后退出（幂等）。
  void Stop();

  void Publish(NotifyEvent event);

  /// 等待队列清空并且当前事件投递完毕，超时返回 false。
  bool Flush(std::chrono::milliseconds timeout);

  std::uint64_t dropped_count() const;
  std::uint64_t delivered_count() const;
  std::size_t pending_count() const;

 private:
  void WorkerLoop();

  std::size_t capacity_;
  std::vector<std::unique_ptr<NotifySink>> sinks_;
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<NotifyEvent> queue_;
  bool stopping_{false};
  bool busy_{false};
  std::uint64_t dropped_{0};
  std::uint64_t delivered_{0};
};

/// 按配置构建通知器（日志 sink 恒启用；凭据齐全时追加 Telegram）。
std::unique_ptr<Notifier> BuildNotifier(const NotifyConfig& config);

}  // namespace hydra
