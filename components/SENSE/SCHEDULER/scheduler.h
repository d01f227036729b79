#pragma once

#include <cstdint>
#include <functional>

using TimerCallback = std::function<void()>;
using TimerId = uint32_t;

/// 无效定时器 ID
static constexpr TimerId kInvalidTimerId = 0;

class Scheduler;

/**
 * @brief 定时器句柄（RAII）
 *
 * 析构、cancel() 或被重新赋值时取消对应定时器。句柄必须在 Scheduler
 * 之前销毁。
 */
class TimerHandle {
public:
  TimerHandle() = default;
  ~TimerHandle();

  TimerHandle(const TimerHandle &) = delete;
  TimerHandle &operator=(const TimerHandle &) = delete;
  TimerHandle(TimerHandle &&other) noexcept;
  TimerHandle &operator=(TimerHandle &&other) noexcept;

  /**
   * @brief 取消定时器（幂等，已触发的一次性定时器为空操作）
   */
  void cancel();

  /**
   * @brief 定时器是否仍会触发
   */
  bool pending() const;

private:
  friend class Scheduler;
  TimerHandle(Scheduler *scheduler, TimerId id)
      : m_scheduler(scheduler), m_id(id) {}

  Scheduler *m_scheduler = nullptr;
  TimerId m_id = kInvalidTimerId;
};

/**
 * @brief 协作式调度器接口
 *
 * 所有回调都在同一个执行上下文中依次执行（设备上是 EventLoop 任务，
 * 单元测试里是 FakeScheduler::advance 的调用者）。
 *
 * @example
 *   TimerHandle flush = scheduler.runAfter(1000, [this]() { flushNow(); });
 *   TimerHandle tick = scheduler.runEvery(50, [this]() { sample(); });
 *   flush.cancel();
 */
class Scheduler {
public:
  virtual ~Scheduler() = default;

  /**
   * @brief 单调时钟（毫秒）
   */
  virtual int64_t nowMs() const = 0;

  /**
   * @brief delayMs 毫秒后执行一次
   */
  TimerHandle runAfter(uint32_t delayMs, TimerCallback callback) {
    return TimerHandle(this, scheduleOnce(delayMs, std::move(callback)));
  }

  /**
   * @brief 每 periodMs 毫秒执行一次，直到句柄被取消
   */
  TimerHandle runEvery(uint32_t periodMs, TimerCallback callback) {
    return TimerHandle(this, schedulePeriodic(periodMs, std::move(callback)));
  }

protected:
  friend class TimerHandle;

  virtual TimerId scheduleOnce(uint32_t delayMs, TimerCallback callback) = 0;
  virtual TimerId schedulePeriodic(uint32_t periodMs,
                                   TimerCallback callback) = 0;
  virtual void cancelTimer(TimerId id) = 0;
  virtual bool isPending(TimerId id) const = 0;
};
