#pragma once

namespace wledbackup::core {

namespace exit_code {

constexpr int kSuccess = 0;
constexpr int kBackupFailed = 1; // 至少一个设备备份失败
constexpr int kFatal = 2;        // 命令行错误、发现失败、输出目录无法创建

} // namespace exit_code

} // namespace wledbackup::core
