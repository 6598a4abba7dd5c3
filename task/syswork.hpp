#pragma once

#include "lock.hpp"
#include "workqueue.hpp"
#include <atomic>
#include <chrono>

namespace fhosts {

// 获取系统全局工作队列；threads 参数:
//  >0 : 指定工作线程数量 (仅第一次调用生效)
//   0 : 自动检测 (std::thread::hardware_concurrency, 至少 2)
//  后续再次调用忽略 threads 参数，返回同一个实例。
workqueue<SpinLock>& get_sys_workqueue(int threads = 0);

// 等待原子完成标志变为 true（由协程完成回调置位）。
void sys_wait_until(std::atomic_bool& finished);

// 带超时的版本；超时返回 false。
bool sys_wait_until(std::atomic_bool& finished, std::chrono::milliseconds timeout);

} // namespace fhosts
