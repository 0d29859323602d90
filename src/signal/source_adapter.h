#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/clock.h"
#include "core/config.h"
#include "core/types.h"
#include "exchange/http_transport.h"
#include "signal/signal_aggregator.h"

namespace hydra {

/**
 * @brief 信号来源适配器接口
 *
 * 每次 `Poll` 拉取一批新信号；外部 I/O 失败在适配器内部消化为
 * `false + out_error`，不得抛出到聚合器。
 */
class SourceAdapter {
 public:
  virtual ~SourceAdapter() = default;
  virtual std::string Name() const = 0;
  virtual bool Poll(std::vector<Signal>* out_signals, std::string* out_error) = 0;
};

/**
 * @brief Binance U 本位合约资金费率 / 持仓量适配器
 *
 * 1. 资金费率绝对值超过阈值：反向拥挤方（source=funding_rate）；
 * 2. 持仓量相对上次采样下跌超过阈值：视为强平级联（source=liquidation_map）。
 */
class BinanceFundingAdapter final : public SourceAdapter {
 public:
  BinanceFundingAdapter(AdaptersConfig config,
                        SignalSourceDefaults funding_source,
                        SignalSourceDefaults liquidation_source,
                        std::unique_ptr<HttpTransport> transport,
                        ClockFn clock = SystemClockMs);

  std::string Name() const override { return "binance_funding"; }
  bool Poll(std::vector<Signal>* out_signals, std::string* out_error) override;

  /// 解析 `/fapi/v1/fundingRate` 响应，取最后一条费率。
  static bool ParseFundingRate(const std::string& body, double* out_rate,
                               std::string* out_error);
  /// 解析 `/fapi/v1/openInterest` 响应。
  static bool ParseOpenInterest(const std::string& body, double* out_open_interest,
                                std::string* out_error);

 private:
  AdaptersConfig config_;
  SignalSourceDefaults funding_source_;
  SignalSourceDefaults liquidation_source_;
  std::unique_ptr<HttpTransport> transport_;
  ClockFn clock_;
  std::unordered_map<std::string, double> last_open_interest_;  ///< symbol -> 上次 OI。
};

/**
 * @brief 追加写 NDJSON 信号文件适配器
 *
 * 外部生产者每行写一条 JSON 信号；本适配器记录已读偏移，只消费完整行。
 * 缺省的 reliability_weight / half_life_ms 由来源默认表补齐；
 * 文件被截断时从头重新读取。
 */
class SpoolFileAdapter final : public SourceAdapter {
 public:
  using DefaultsFn = std::function<SignalSourceDefaults(const std::string&)>;

  SpoolFileAdapter(std::string path, DefaultsFn defaults,
                   ClockFn clock = SystemClockMs);

  std::string Name() const override { return "spool_file"; }
  bool Poll(std::vector<Signal>* out_signals, std::string* out_error) override;

  /// 单行 JSON -> Signal（不做范围校验，交由聚合器）。
  bool ParseLine(const std::string& line, Signal* out_signal,
                 std::string* out_error) const;

  std::uint64_t offset() const { return offset_; }

 private:
  std::string path_;
  DefaultsFn defaults_;
  ClockFn clock_;
  std::uint64_t offset_{0};
};

/**
 * @brief 来源适配器运行器
 *
 * 每个适配器一个线程，按各自节奏轮询并写入聚合器。
 * 停止通过条件变量唤醒，`Stop` 幂等。
 */
class SourceAdapterRunner {
 public:
  explicit SourceAdapterRunner(SignalAggregator* aggregator)
      : aggregator_(aggregator) {}
  ~SourceAdapterRunner();

  SourceAdapterRunner(const SourceAdapterRunner&) = delete;
  SourceAdapterRunner& operator=(const SourceAdapterRunner&) = delete;

  /// 仅在 Start 之前调用。
  void Add(std::unique_ptr<SourceAdapter> adapter, int poll_interval_ms);

  void Start();
  void Stop();

  /// 同步轮询全部适配器一次，返回写入的信号数；仅在未 Start 时调用。
  int PollAllOnce();

  std::size_t adapter_count() const { return entries_.size(); }
  std::uint64_t ingested_count() const { return ingested_.load(); }

 private:
  struct Entry {
    std::unique_ptr<SourceAdapter> adapter;
    int poll_interval_ms{1000};
  };

  int PollEntry(Entry* entry);
  void RunLoop(Entry* entry);

  SignalAggregator* aggregator_{nullptr};
  std::vector<std::unique_ptr<Entry>> entries_;
  std::vector<std::thread> threads_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_{false};
  std::atomic<std::uint64_t> ingested_{0};
};

}  // namespace hydra
