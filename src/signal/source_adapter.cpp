#include "signal/source_adapter.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <utility>

#include "core/json_utils.h"
#include "core/log.h"

namespace hydra {

BinanceFundingAdapter::BinanceFundingAdapter(
    AdaptersConfig config, SignalSourceDefaults funding_source,
    SignalSourceDefaults liquidation_source,
    std::unique_ptr<HttpTransport> transport, ClockFn clock)
    : config_(std::move(config)),
      funding_source_(std::move(funding_source)),
      liquidation_source_(std::move(liquidation_source)),
      transport_(std::move(transport)),
      clock_(std::move(clock)) {}

bool BinanceFundingAdapter::ParseFundingRate(const std::string& body,
                                             double* out_rate,
                                             std::string* out_error) {
  JsonValue root;
  if (!ParseJson(body, &root, out_error)) {
    return false;
  }
  if (root.type != JsonType::kArray || root.array_value.empty()) {
    if (out_error != nullptr) *out_error = "fundingRate 响应为空";
    return false;
  }
  const auto rate =
      JsonAsNumber(JsonObjectField(&root.array_value.back(), "fundingRate"));
  if (!rate.has_value() || !std::isfinite(*rate)) {
    if (out_error != nullptr) *out_error = "fundingRate 字段缺失";
    return false;
  }
  *out_rate = *rate;
  return true;
}

bool BinanceFundingAdapter::ParseOpenInterest(const std::string& body,
                                              double* out_open_interest,
                                              std::string* out_error) {
  JsonValue root;
  if (!ParseJson(body, &root, out_error)) {
    return false;
  }
  const auto oi = JsonAsNumber(JsonObjectField(&root, "openInterest"));
  if (!oi.has_value() || !std::isfinite(*oi) || *oi <= 0.0) {
    if (out_error != nullptr) *out_error = "openInterest 字段缺失";
    return false;
  }
  *out_open_interest = *oi;
  return true;
}

bool BinanceFundingAdapter::Poll(std::vector<Signal>* out_signals,
                                 std::string* out_error) {
  if (out_signals == nullptr || transport_ == nullptr) {
    if (out_error != nullptr) *out_error = "funding adapter 未初始化";
    return false;
  }
  const std::int64_t now_ms = clock_();
  std::string errors;
  for (const auto& symbol : config_.funding_symbols) {
    const std::string encoded = UrlEncode(symbol);
    std::string body;
    std::string error;
    double rate = 0.0;
    if (HttpGet(*transport_,
                config_.funding_base_url + "/fapi/v1/fundingRate?symbol=" +
                    encoded + "&limit=1",
                &body, &error) &&
        ParseFundingRate(body, &rate, &error)) {
      if (std::fabs(rate) > config_.funding_extreme_rate) {
        // 反向拥挤方：多头付费则看空。
        out_signals->push_back(Signal{
            .source_id = funding_source_.source_id,
            .asset = symbol,
            .name = symbol + " funding extreme",
            .direction = rate > 0.0 ? -1.0 : 1.0,
            .strength = std::min(
                1.0, std::fabs(rate) / (2.0 * config_.funding_extreme_rate)),
            .reliability_weight = funding_source_.reliability_weight,
            .timestamp_ms = now_ms,
            .half_life_ms = funding_source_.half_life_ms,
        });
      }
    } else {
      errors += symbol + " fundingRate: " + error + "; ";
    }

    double open_interest = 0.0;
    if (HttpGet(*transport_,
                config_.funding_base_url + "/fapi/v1/openInterest?symbol=" + encoded,
                &body, &error) &&
        ParseOpenInterest(body, &open_interest, &error)) {
      const auto it = last_open_interest_.find(symbol);
      if (it != last_open_interest_.end() && it->second > 0.0) {
        const double change = (open_interest - it->second) / it->second;
        if (change < -config_.open_interest_cascade_drop) {
          out_signals->push_back(Signal{
              .source_id = liquidation_source_.source_id,
              .asset = symbol,
              .name = symbol + " open interest cascade",
              .direction = -1.0,
              .strength = std::min(1.0, std::fabs(change) * 10.0),
              .reliability_weight = liquidation_source_.reliability_weight,
              .timestamp_ms = now_ms,
              .half_life_ms = liquidation_source_.half_life_ms,
          });
        }
      }
      last_open_interest_[symbol] = open_interest;
    } else {
      errors += symbol + " openInterest: " + error + "; ";
    }
  }
  if (!errors.empty()) {
    if (out_error != nullptr) *out_error = errors;
    return false;
  }
  return true;
}

SpoolFileAdapter::SpoolFileAdapter(std::string path, DefaultsFn defaults,
                                   ClockFn clock)
    : path_(std::move(path)),
      defaults_(std::move(defaults)),
      clock_(std::move(clock)) {}

bool SpoolFileAdapter::ParseLine(const std::string& line, Signal* out_signal,
                                 std::string* out_error) const {
  JsonValue root;
  if (!ParseJson(line, &root, out_error)) {
    return false;
  }
  if (root.type != JsonType::kObject) {
    if (out_error != nullptr) *out_error = "信号行不是 JSON 对象";
    return false;
  }
  const auto source_id = JsonAsString(JsonObjectField(&root, "source_id"));
  const auto asset = JsonAsString(JsonObjectField(&root, "asset"));
  const auto direction = JsonAsNumber(JsonObjectField(&root, "direction"));
  const auto strength = JsonAsNumber(JsonObjectField(&root, "strength"));
  if (!source_id.has_value() || !asset.has_value() || !direction.has_value() ||
      !strength.has_value()) {
    if (out_error != nullptr) {
      *out_error = "缺少必填字段 source_id/asset/direction/strength";
    }
    return false;
  }
  const SignalSourceDefaults defaults =
      defaults_ ? defaults_(*source_id) : SignalSourceDefaults{};

  Signal signal;
  signal.source_id = *source_id;
  signal.asset = *asset;
  signal.name = JsonAsString(JsonObjectField(&root, "name")).value_or(*source_id);
  signal.direction = *direction;
  signal.strength = *strength;
  signal.reliability_weight =
      JsonAsNumber(JsonObjectField(&root, "reliability_weight"))
          .value_or(defaults.reliability_weight);
  signal.half_life_ms = JsonAsInt64(JsonObjectField(&root, "half_life_ms"))
                            .value_or(defaults.half_life_ms);
  signal.timestamp_ms = JsonAsInt64(JsonObjectField(&root, "timestamp_ms"))
                            .value_or(clock_());
  *out_signal = std::move(signal);
  return true;
}

bool SpoolFileAdapter::Poll(std::vector<Signal>* out_signals,
                            std::string* out_error) {
  if (out_signals == nullptr) {
    if (out_error != nullptr) *out_error = "out_signals 为空";
    return false;
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    // 生产者尚未创建文件：视为无新数据。
    return true;
  }
  in.seekg(0, std::ios::end);
  const auto size = static_cast<std::uint64_t>(in.tellg());
  if (size < offset_) {
    LogInfo("SPOOL_TRUNCATED: path=" + path_ + ", offset=" +
            std::to_string(offset_) + " -> 0");
    offset_ = 0;
  }
  if (size == offset_) {
    return true;
  }
  in.seekg(static_cast<std::streamoff>(offset_), std::ios::beg);
  std::string chunk(static_cast<std::size_t>(size - offset_), '\0');
  in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  chunk.resize(static_cast<std::size_t>(in.gcount()));

  int bad_lines = 0;
  std::size_t line_start = 0;
  while (true) {
    const std::size_t line_end = chunk.find('\n', line_start);
    if (line_end == std::string::npos) {
      break;  // 不完整行留待下次读取。
    }
    std::string line = chunk.substr(line_start, line_end - line_start);
    line_start = line_end + 1;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }
    Signal signal;
    std::string error;
    if (!ParseLine(line, &signal, &error)) {
      ++bad_lines;
      LogError("SPOOL_LINE_INVALID: path=" + path_ + ", error=" + error);
      continue;
    }
    out_signals->push_back(std::move(signal));
  }
  offset_ += line_start;
  if (bad_lines > 0 && out_error != nullptr) {
    *out_error = std::to_string(bad_lines) + " 行解析失败";
  }
  return bad_lines == 0;
}

SourceAdapterRunner::~SourceAdapterRunner() {
  Stop();
}

void SourceAdapterRunner::Add(std::unique_ptr<SourceAdapter> adapter,
                              int poll_interval_ms) {
  if (adapter == nullptr) {
    return;
  }
  auto entry = std::make_unique<Entry>();
  entry->adapter = std::move(adapter);
  entry->poll_interval_ms = std::max(1, poll_interval_ms);
  entries_.push_back(std::move(entry));
}

int SourceAdapterRunner::PollEntry(Entry* entry) {
  std::vector<Signal> signals;
  std::string error;
  if (!entry->adapter->Poll(&signals, &error)) {
    LogError("SOURCE_POLL_FAILED: adapter=" + entry->adapter->Name() +
             ", error=" + error);
  }
  int ingested = 0;
  for (const auto& signal : signals) {
    std::string ingest_error;
    if (aggregator_ == nullptr || !aggregator_->Ingest(signal, &ingest_error)) {
      LogError("SIGNAL_REJECTED: adapter=" + entry->adapter->Name() +
               ", source=" + signal.source_id + ", asset=" + signal.asset +
               ", error=" + ingest_error);
      continue;
    }
    ++ingested;
  }
  ingested_ += static_cast<std::uint64_t>(ingested);
  return ingested;
}

int SourceAdapterRunner::PollAllOnce() {
  int total = 0;
  for (auto& entry : entries_) {
    total += PollEntry(entry.get());
  }
  return total;
}

void SourceAdapterRunner::RunLoop(Entry* entry) {
  while (true) {
    PollEntry(entry);
    std::unique_lock<std::mutex> lock(stop_mutex_);
    if (stop_cv_.wait_for(lock,
                          std::chrono::milliseconds(entry->poll_interval_ms),
                          [this] { return stopping_; })) {
      return;
    }
  }
}

void SourceAdapterRunner::Start() {
  if (!threads_.empty()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stopping_ = false;
  }
  for (auto& entry : entries_) {
    threads_.emplace_back(&SourceAdapterRunner::RunLoop, this, entry.get());
    LogInfo("SOURCE_ADAPTER_STARTED: adapter=" + entry->adapter->Name() +
            ", interval_ms=" + std::to_string(entry->poll_interval_ms));
  }
}

void SourceAdapterRunner::Stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

}  // namespace hydra
