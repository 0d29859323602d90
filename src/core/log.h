#pragma once

#include <string>
#include <string_view>

namespace hydra {

/**
 * @brief 输出 INFO 级日志
 *
 * 行为：
 * 1. 线程安全串行写入（信号源线程、执行线程、周期线程共用）；
 * 2. 输出到 `stdout`；
 * 3. 自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stderr`；
 * 3. 自动附加本地时间戳和 `[ERROR]` 前缀。
 */
void LogError(std::string_view message);

/// 数值格式化（固定小数位），供日志拼接使用。
std::string FormatFixed(double value, int precision = 2);

}  // namespace hydra
