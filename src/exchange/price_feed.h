#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.h"
#include "exchange/http_transport.h"

namespace hydra {

/**
 * @brief 价格源抽象
 *
 * 返回 false 表示"当前不可用"（超时、无数据、解析失败），
 * 调用方据此降级，不视为致命错误。实现需线程安全。
 */
class PriceFeed {
 public:
  virtual ~PriceFeed() = default;
  virtual std::string Name() const = 0;
  virtual bool GetPrice(const std::string& asset, double* out_price,
                        std::string* out_error) const = 0;
  /// 最近 window 根 K 线，按时间升序。
  virtual bool GetOhlcHistory(const std::string& asset, int window,
                              std::vector<OhlcBar>* out_bars,
                              std::string* out_error) const = 0;
};

/**
 * @brief 回放价格源
 *
 * 以内存序列驱动：`AdvanceTo(now)` 后仅暴露时间戳不晚于 now 的 bar。
 * 场景：单元测试、离线回放、无外网开发环境。
 */
class ReplayPriceFeed : public PriceFeed {
 public:
  std::string Name() const override { return "replay"; }
  bool GetPrice(const std::string& asset, double* out_price,
                std::string* out_error) const override;
  bool GetOhlcHistory(const std::string& asset, int window,
                      std::vector<OhlcBar>* out_bars,
                      std::string* out_error) const override;

  /// 追加一根 bar（需按时间递增）。
  void AppendBar(const std::string& asset, const OhlcBar& bar);
  /// 追加收盘价（开高低收同值）。
  void AppendClose(const std::string& asset, std::int64_t ts_ms, double close);
  void AdvanceTo(std::int64_t now_ms);
  std::int64_t now_ms() const;
  /// 全部资产中最早/最晚的 bar 时间戳；无数据返回 false。
  bool TimeRange(std::int64_t* out_first_ms, std::int64_t* out_last_ms) const;

  /**
   * @brief 从 CSV 加载（列：asset,ts_ms,close；`#` 开头为注释）
   */
  bool LoadCsv(const std::string& path, std::string* out_error);

  /// 生成确定性几何随机游走序列（同 seed 输出一致）。
  void GenerateSynthetic(const std::vector<std::string>& assets,
                         std::int64_t start_ms, std::int64_t bar_interval_ms,
                         int bar_count, std::uint32_t seed);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<OhlcBar>> bars_;
  std::int64_t now_ms_{0};
};

/**
 * @brief Bybit V5 公共行情价格源
 *
 * - 最新价：`/v5/market/tickers` 的 lastPrice；
 * - K 线：`/v5/market/kline`（返回倒序，此处翻转为升序）。
 */
class BybitPriceFeed : public PriceFeed {
 public:
  BybitPriceFeed(std::string base_url, std::string category,
                 std::string kline_interval,
                 std::unique_ptr<HttpTransport> transport);

  std::string Name() const override { return "bybit"; }
  bool GetPrice(const std::string& asset, double* out_price,
                std::string* out_error) const override;
  bool GetOhlcHistory(const std::string& asset, int window,
                      std::vector<OhlcBar>* out_bars,
                      std::string* out_error) const override;

  static bool ParseTickerPrice(const std::string& body, double* out_price,
                               std::string* out_error);
  static bool ParseKlines(const std::string& body,
                          std::vector<OhlcBar>* out_bars,
                          std::string* out_error);

 private:
  std::string base_url_;
  std::string category_;
  std::string kline_interval_;
  std::unique_ptr<HttpTransport> transport_;
};

}  // namespace hydra
