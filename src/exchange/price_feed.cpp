#include "exchange/price_feed.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <utility>

#include "core/json_utils.h"

namespace hydra {

namespace {

std::string TrimCell(const std::string& text) {
  const std::size_t begin = text.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return "";
  }
  const std::size_t end = text.find_last_not_of(" \t\r");
  return text.substr(begin, end - begin + 1);
}

bool SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

// Bybit V5 统一信封：retCode == 0 才视为成功。
bool CheckRetCode(const JsonValue& root, std::string* out_error) {
  const auto ret_code = JsonAsNumber(JsonObjectField(&root, "retCode"));
  if (!ret_code.has_value()) {
    return SetError(out_error, "Bybit 响应缺少 retCode");
  }
  if (static_cast<int>(*ret_code) != 0) {
    const auto ret_msg = JsonAsString(JsonObjectField(&root, "retMsg"));
    return SetError(out_error, "Bybit retCode=" +
                                   std::to_string(static_cast<int>(*ret_code)) +
                                   ", retMsg=" + ret_msg.value_or(""));
  }
  return true;
}

}  // namespace

bool ReplayPriceFeed::GetPrice(const std::string& asset, double* out_price,
                               std::string* out_error) const {
  if (out_price == nullptr) {
    return SetError(out_error, "out_price 为空");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = bars_.find(asset);
  if (it == bars_.end()) {
    return SetError(out_error, "回放无此资产: " + asset);
  }
  const auto& series = it->second;
  const auto upper = std::upper_bound(
      series.begin(), series.end(), now_ms_,
      [](std::int64_t ts, const OhlcBar& bar) { return ts < bar.ts_ms; });
  if (upper == series.begin()) {
    return SetError(out_error, "回放尚无可用价格: " + asset);
  }
  *out_price = std::prev(upper)->close;
  return true;
}

bool ReplayPriceFeed::GetOhlcHistory(const std::string& asset, int window,
                                     std::vector<OhlcBar>* out_bars,
                                     std::string* out_error) const {
  if (out_bars == nullptr) {
    return SetError(out_error, "out_bars 为空");
  }
  out_bars->clear();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = bars_.find(asset);
  if (it == bars_.end()) {
    return SetError(out_error, "回放无此资产: " + asset);
  }
  const auto& series = it->second;
  const auto upper = std::upper_bound(
      series.begin(), series.end(), now_ms_,
      [](std::int64_t ts, const OhlcBar& bar) { return ts < bar.ts_ms; });
  const auto available = static_cast<int>(upper - series.begin());
  const int count = std::min(std::max(0, window), available);
  out_bars->assign(upper - count, upper);
  return true;
}

void ReplayPriceFeed::AppendBar(const std::string& asset, const OhlcBar& bar) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& series = bars_[asset];
  if (!series.empty() && bar.ts_ms <= series.back().ts_ms) {
    return;
  }
  series.push_back(bar);
}

void ReplayPriceFeed::AppendClose(const std::string& asset, std::int64_t ts_ms,
                                  double close) {
  AppendBar(asset, OhlcBar{.ts_ms = ts_ms,
                           .open = close,
                           .high = close,
                           .low = close,
                           .close = close,
                           .volume = 0.0});
}

void ReplayPriceFeed::AdvanceTo(std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ms_ = now_ms;
}

std::int64_t ReplayPriceFeed::now_ms() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_ms_;
}

bool ReplayPriceFeed::TimeRange(std::int64_t* out_first_ms,
                                std::int64_t* out_last_ms) const {
  std::lock_guard<std::mutex> lock(mutex_);
  bool found = false;
  std::int64_t first = 0;
  std::int64_t last = 0;
  for (const auto& [asset, series] : bars_) {
    if (series.empty()) {
      continue;
    }
    if (!found) {
      first = series.front().ts_ms;
      last = series.back().ts_ms;
      found = true;
      continue;
    }
    first = std::min(first, series.front().ts_ms);
    last = std::max(last, series.back().ts_ms);
  }
  if (found) {
    if (out_first_ms != nullptr) *out_first_ms = first;
    if (out_last_ms != nullptr) *out_last_ms = last;
  }
  return found;
}

bool ReplayPriceFeed::LoadCsv(const std::string& path, std::string* out_error) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return SetError(out_error, "无法打开回放文件: " + path);
  }
  std::map<std::string, std::vector<OhlcBar>> loaded;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string trimmed = TrimCell(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    std::istringstream iss(trimmed);
    std::string asset;
    std::string ts_text;
    std::string close_text;
    if (!std::getline(iss, asset, ',') || !std::getline(iss, ts_text, ',') ||
        !std::getline(iss, close_text, ',')) {
      return SetError(out_error, "回放文件列数不足，行号: " + std::to_string(line_no));
    }
    asset = TrimCell(asset);
    if (asset == "asset") {
      continue;  // 表头
    }
    OhlcBar bar;
    try {
      bar.ts_ms = std::stoll(TrimCell(ts_text));
      bar.close = std::stod(TrimCell(close_text));
    } catch (const std::exception&) {
      return SetError(out_error, "回放文件数值解析失败，行号: " + std::to_string(line_no));
    }
    if (!std::isfinite(bar.close) || bar.close <= 0.0) {
      return SetError(out_error, "回放价格非法，行号: " + std::to_string(line_no));
    }
    bar.open = bar.high = bar.low = bar.close;
    loaded[asset].push_back(bar);
  }
  for (auto& [asset, series] : loaded) {
    std::stable_sort(series.begin(), series.end(),
                     [](const OhlcBar& lhs, const OhlcBar& rhs) {
                       return lhs.ts_ms < rhs.ts_ms;
                     });
    for (const auto& bar : series) {
      AppendBar(asset, bar);
    }
  }
  return true;
}

void ReplayPriceFeed::GenerateSynthetic(const std::vector<std::string>& assets,
                                        std::int64_t start_ms,
                                        std::int64_t bar_interval_ms,
                                        int bar_count, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<double> shock(0.0, 0.0015);
  for (std::size_t i = 0; i < assets.size(); ++i) {
    double price = 100.0 + 10.0 * static_cast<double>(i);
    for (int n = 0; n < bar_count; ++n) {
      price *= std::exp(shock(rng));
      AppendClose(assets[i], start_ms + n * bar_interval_ms, price);
    }
  }
}

BybitPriceFeed::BybitPriceFeed(std::string base_url, std::string category,
                               std::string kline_interval,
                               std::unique_ptr<HttpTransport> transport)
    : base_url_(std::move(base_url)),
      category_(std::move(category)),
      kline_interval_(std::move(kline_interval)),
      transport_(std::move(transport)) {
  if (transport_ == nullptr) {
    transport_ = std::make_unique<CurlHttpTransport>();
  }
}

bool BybitPriceFeed::ParseTickerPrice(const std::string& body,
                                      double* out_price,
                                      std::string* out_error) {
  JsonValue root;
  if (!ParseJson(body, &root, out_error)) {
    return false;
  }
  if (!CheckRetCode(root, out_error)) {
    return false;
  }
  const JsonValue* list = JsonFindPath(&root, {"result", "list"});
  const auto price = JsonAsNumber(JsonObjectField(JsonArrayAt(list, 0), "lastPrice"));
  if (!price.has_value() || !std::isfinite(*price) || *price <= 0.0) {
    return SetError(out_error, "Bybit ticker 缺少有效 lastPrice");
  }
  *out_price = *price;
  return true;
}

bool BybitPriceFeed::ParseKlines(const std::string& body,
                                 std::vector<OhlcBar>* out_bars,
                                 std::string* out_error) {
  JsonValue root;
  if (!ParseJson(body, &root, out_error)) {
    return false;
  }
  if (!CheckRetCode(root, out_error)) {
    return false;
  }
  const JsonValue* list = JsonFindPath(&root, {"result", "list"});
  if (list == nullptr || list->type != JsonType::kArray) {
    return SetError(out_error, "Bybit kline 缺少 result.list");
  }
  std::vector<OhlcBar> bars;
  bars.reserve(list->array_value.size());
  for (const auto& row : list->array_value) {
    const auto ts = JsonAsInt64(JsonArrayAt(&row, 0));
    const auto open = JsonAsNumber(JsonArrayAt(&row, 1));
    const auto high = JsonAsNumber(JsonArrayAt(&row, 2));
    const auto low = JsonAsNumber(JsonArrayAt(&row, 3));
    const auto close = JsonAsNumber(JsonArrayAt(&row, 4));
    const auto volume = JsonAsNumber(JsonArrayAt(&row, 5));
    if (!ts.has_value() || !open.has_value() || !high.has_value() ||
        !low.has_value() || !close.has_value()) {
      return SetError(out_error, "Bybit kline 行格式非法");
    }
    bars.push_back(OhlcBar{.ts_ms = *ts,
                           .open = *open,
                           .high = *high,
                           .low = *low,
                           .close = *close,
                           .volume = volume.value_or(0.0)});
  }
  std::sort(bars.begin(), bars.end(), [](const OhlcBar& lhs, const OhlcBar& rhs) {
    return lhs.ts_ms < rhs.ts_ms;
  });
  *out_bars = std::move(bars);
  return true;
}

bool BybitPriceFeed::GetPrice(const std::string& asset, double* out_price,
                              std::string* out_error) const {
  if (out_price == nullptr) {
    return SetError(out_error, "out_price 为空");
  }
  const std::string url = base_url_ + "/v5/market/tickers?category=" +
                          UrlEncode(category_) + "&symbol=" + UrlEncode(asset);
  std::string body;
  if (!HttpGet(*transport_, url, &body, out_error)) {
    return false;
  }
  return ParseTickerPrice(body, out_price, out_error);
}

bool BybitPriceFeed::GetOhlcHistory(const std::string& asset, int window,
                                    std::vector<OhlcBar>* out_bars,
                                    std::string* out_error) const {
  if (out_bars == nullptr) {
    return SetError(out_error, "out_bars 为空");
  }
  // Bybit 单次 kline 上限 1000。
  const int limit = std::clamp(window, 1, 1000);
  const std::string url = base_url_ + "/v5/market/kline?category=" +
                          UrlEncode(category_) + "&symbol=" + UrlEncode(asset) +
                          "&interval=" + UrlEncode(kline_interval_) +
                          "&limit=" + std::to_string(limit);
  std::string body;
  if (!HttpGet(*transport_, url, &body, out_error)) {
    return false;
  }
  return ParseKlines(body, out_bars, out_error);
}

}  // namespace hydra
