#pragma once

#include "esp_err.h"
#include "esp_timer.h"
#include "scheduler.h"

#include <map>
#include <vector>

/**
 * @brief 基于 esp_timer 的调度器
 *
 * esp_timer 回调只把定时器 ID 投递到 EventLoop，真正的回调在事件循环
 * 任务里执行；投递途中被取消的定时器直接丢弃。队列满时到期事件留在
 * 重投列表里，稍后再投递。除到期投递外，所有方法都只能在事件循环任务
 * 中调用。
 */
class EspTimerScheduler : public Scheduler {
public:
  static EspTimerScheduler &instance();

  EspTimerScheduler(const EspTimerScheduler &) = delete;
  EspTimerScheduler &operator=(const EspTimerScheduler &) = delete;

  int64_t nowMs() const override;

  size_t activeCount() const { return m_timers.size(); }

protected:
  TimerId scheduleOnce(uint32_t delayMs, TimerCallback callback) override;
  TimerId schedulePeriodic(uint32_t periodMs, TimerCallback callback) override;
  void cancelTimer(TimerId id) override;
  bool isPending(TimerId id) const override;

private:
  EspTimerScheduler() = default;
  ~EspTimerScheduler() = default;

  struct Entry {
    esp_timer_handle_t handle = nullptr;
    TimerCallback callback;
    bool periodic = false;
  };

  struct Redelivery {
    TimerId id = kInvalidTimerId;
    int attempts = 0;
  };

  static constexpr uint32_t kRedeliveryDelayUs = 20 * 1000;
  static constexpr int kMaxRedeliveryAttempts = 50;

  TimerId create(uint32_t ms, bool periodic, TimerCallback callback);
  void dispatch(TimerId id);
  esp_err_t ensureRedeliveryTimer();
  bool postExpiry(TimerId id);
  void queueRedelivery(Redelivery item);
  static void onExpired(void *arg);
  static void onRedelivery(void *arg);
  static void destroyHandle(esp_timer_handle_t handle);

  std::map<TimerId, Entry> m_timers;
  TimerId m_nextId = 1;

  // 只在 esp_timer 任务中访问
  esp_timer_handle_t m_redeliveryTimer = nullptr;
  std::vector<Redelivery> m_redelivery;
};
