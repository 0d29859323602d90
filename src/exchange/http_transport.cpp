#include "exchange/http_transport.h"

#include <cctype>

#include <curl/curl.h>

namespace hydra {

namespace {

std::size_t WriteToString(char* ptr, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  if (ptr == nullptr || userdata == nullptr) {
    return 0;
  }
  std::string* out = static_cast<std::string*>(userdata);
  const std::size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

}  // namespace

HttpResponse CurlHttpTransport::Send(const std::string& method,
                                     const std::string& url,
                                     const HttpHeaders& headers,
                                     const std::string& body) const {
  HttpResponse out;
  static const bool kCurlGlobalInit = []() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  }();
  if (!kCurlGlobalInit) {
    out.error = "curl_global_init 失败";
    return out;
  }

  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    out.error = "curl_easy_init 失败";
    return out;
  }

  struct curl_slist* header_list = nullptr;
  for (const auto& [key, value] : headers) {
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }

  std::string response_body;
  char curl_error[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curl_error);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "hydra/0.1");
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  if (method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  out.status_code = static_cast<int>(status_code);
  out.body = std::move(response_body);
  if (code != CURLE_OK) {
    const std::string detailed = (curl_error[0] != '\0')
                                     ? std::string(curl_error)
                                     : std::string(curl_easy_strerror(code));
    out.error = "curl_easy_perform 失败: " + detailed;
  }

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);
  return out;
}

bool HttpGet(const HttpTransport& transport, const std::string& url,
             std::string* out_body, std::string* out_error) {
  const HttpResponse response = transport.Send("GET", url, {}, "");
  if (!response.error.empty()) {
    if (out_error != nullptr) {
      *out_error = response.error;
    }
    return false;
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    if (out_error != nullptr) {
      *out_error = "HTTP 状态码异常: " + std::to_string(response.status_code);
    }
    return false;
  }
  if (out_body != nullptr) {
    *out_body = response.body;
  }
  return true;
}

std::string UrlEncode(const std::string& text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    const unsigned char c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHex[(c >> 4U) & 0x0FU]);
      out.push_back(kHex[c & 0x0FU]);
    }
  }
  return out;
}

}  // namespace hydra
