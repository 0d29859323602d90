#include "monitor/notifier.h"

#include <algorithm>
#include <chrono>
#include <exception>

#include "core/json_utils.h"
#include "core/log.h"

namespace hydra {

const char* ToString(NotifyEventType type) {
  switch (type) {
    case NotifyEventType::kApproved:
      return "APPROVED";
    case NotifyEventType::kRejected:
      return "REJECTED";
    case NotifyEventType::kKillSwitch:
      return "KILL_SWITCH";
    case NotifyEventType::kPositionClosed:
      return "POSITION_CLOSED";
    case NotifyEventType::kPositionUnpriced:
      return "POSITION_UNPRICED";
    case NotifyEventType::kOrderFailed:
      return "ORDER_FAILED";
    case NotifyEventType::kRiskHalted:
      return "RISK_HALTED";
  }
  return "UNKNOWN";
}

std::string NotifyEvent::ToText() const {
  std::string text = ToString(type);
  for (std::size_t i = 0; i < fields.size(); ++i) {
    text += (i == 0 ? " " : ", ");
    text += fields[i].first + "=" + fields[i].second;
  }
  return text;
}

bool LogNotifySink::Deliver(const NotifyEvent& event, std::string* out_error) {
  (void)out_error;
  if (event.type == NotifyEventType::kRiskHalted ||
      event.type == NotifyEventType::kKillSwitch ||
      event.type == NotifyEventType::kOrderFailed) {
    LogError("NOTIFY: " + event.ToText());
  } else {
    LogInfo("NOTIFY: " + event.ToText());
  }
  return true;
}

TelegramNotifySink::TelegramNotifySink(std::string api_base,
                                       std::string bot_token,
                                       std::string chat_id,
                                       std::unique_ptr<HttpTransport> transport)
    : api_base_(std::move(api_base)),
      bot_token_(std::move(bot_token)),
      chat_id_(std::move(chat_id)),
      transport_(std::move(transport)) {}

std::string TelegramNotifySink::BuildPayload(const std::string& chat_id,
                                             const NotifyEvent& event) {
  std::string text = std::string("[HYDRA] ") + ToString(event.type);
  for (const auto& [key, value] : event.fields) {
    text += "\n" + key + ": " + value;
  }
  JsonWriter writer;
  writer.BeginObject()
      .Key("chat_id").String(chat_id)
      .Key("text").String(text)
      .Key("disable_web_page_preview").Bool(true)
      .EndObject();
  return writer.str();
}

bool TelegramNotifySink::Deliver(const NotifyEvent& event,
                                 std::string* out_error) {
  if (transport_ == nullptr) {
    if (out_error != nullptr) *out_error = "telegram transport 未配置";
    return false;
  }
  const HttpResponse response = transport_->Send(
      "POST", api_base_ + "/bot" + bot_token_ + "/sendMessage",
      {{"Content-Type", "application/json"}}, BuildPayload(chat_id_, event));
  if (!response.error.empty()) {
    if (out_error != nullptr) *out_error = response.error;
    return false;
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    if (out_error != nullptr) {
      *out_error = "HTTP 状态码异常: " + std::to_string(response.status_code);
    }
    return false;
  }
  return true;
}

Notifier::Notifier(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

Notifier::~Notifier() {
  Stop();
}

void Notifier::AddSink(std::unique_ptr<NotifySink> sink) {
  if (sink != nullptr) {
    sinks_.push_back(std::move(sink));
  }
}

void Notifier::Start() {
  if (worker_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  worker_ = std::thread(&Notifier::WorkerLoop, this);
}

void Notifier::Stop() {
  if (!worker_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_one();
  worker_.join();
}

void Notifier::Publish(NotifyEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(std::move(event));
  }
  queue_cv_.notify_one();
}

bool Notifier::Flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout,
                           [this] { return queue_.empty() && !busy_; });
}

std::uint64_t Notifier::dropped_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::uint64_t Notifier::delivered_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delivered_;
}

std::size_t Notifier::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void Notifier::WorkerLoop() {
  while (true) {
    NotifyEvent event;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      // stop 前排空已入队事件。
      if (queue_.empty()) {
        idle_cv_.notify_all();
        return;
      }
      event = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    for (auto& sink : sinks_) {
      std::string error;
      bool ok = false;
      try {
        ok = sink->Deliver(event, &error);
      } catch (const std::exception& ex) {
        error = ex.what();
      }
      if (!ok) {
        LogError("NOTIFY_DELIVERY_FAILED: sink=" + sink->Name() +
                 ", event=" + ToString(event.type) + ", error=" + error);
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
      ++delivered_;
    }
    idle_cv_.notify_all();
  }
}

std::unique_ptr<Notifier> BuildNotifier(const NotifyConfig& config) {
  auto notifier = std::make_unique<Notifier>(
      static_cast<std::size_t>(std::max(1, config.queue_capacity)));
  notifier->AddSink(std::make_unique<LogNotifySink>());
  if (!config.telegram_bot_token.empty() && !config.telegram_chat_id.empty()) {
    notifier->AddSink(std::make_unique<TelegramNotifySink>(
        config.telegram_api_base, config.telegram_bot_token,
        config.telegram_chat_id,
        std::make_unique<CurlHttpTransport>(config.timeout_ms, config.timeout_ms)));
    LogInfo("NOTIFIER_TELEGRAM_ENABLED: chat_id=" + config.telegram_chat_id);
  }
  return notifier;
}

}  // namespace hydra
