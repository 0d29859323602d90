#pragma once

#include <string>
#include <utility>
#include <vector>

namespace hydra {

/// HTTP 响应统一结构，便于 mock 与真实传输层复用。
struct HttpResponse {
  int status_code{0};
  std::string body;
  std::string error;   ///< 非空表示传输层失败（超时、DNS、TLS 等）。
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief HTTP 传输抽象
 *
 * 作用：
 * 1. 业务层（价格源、信号源、通知）不直接依赖 libcurl；
 * 2. 单元测试可注入 mock transport。
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse Send(const std::string& method,
                            const std::string& url,
                            const HttpHeaders& headers,
                            const std::string& body) const = 0;
};

/// libcurl 实现：每次请求独立 easy handle，必带连接与总超时。
class CurlHttpTransport final : public HttpTransport {
 public:
  CurlHttpTransport(long connect_timeout_ms = 3000, long timeout_ms = 5000)
      : connect_timeout_ms_(connect_timeout_ms), timeout_ms_(timeout_ms) {}

  HttpResponse Send(const std::string& method,
                    const std::string& url,
                    const HttpHeaders& headers,
                    const std::string& body) const override;

 private:
  long connect_timeout_ms_{3000};
  long timeout_ms_{5000};
};

/// GET 并校验 2xx；失败时写入 `out_error`。
bool HttpGet(const HttpTransport& transport, const std::string& url,
             std::string* out_body, std::string* out_error);

/// URL 查询参数编码（RFC 3986 unreserved 之外全部百分号编码）。
std::string UrlEncode(const std::string& text);

}  // namespace hydra
