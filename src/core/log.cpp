#include "core/log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace hydra {

namespace {

std::mutex g_log_mutex;

void WriteLine(std::ostream& out, std::string_view level,
               std::string_view message) {
  // 信息日志和错误日志共享同一把锁，保证多线程下时序可读。
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  out << std::put_time(&tm, "%F %T") << " [" << level << "] " << message
      << '\n';
}

}  // namespace

void LogInfo(std::string_view message) {
  WriteLine(std::cout, "INFO", message);
}

void LogError(std::string_view message) {
  WriteLine(std::cerr, "ERROR", message);
}

std::string FormatFixed(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

}  // namespace hydra
