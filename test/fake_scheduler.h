#pragma once

#include "scheduler.h"

#include <cstdint>
#include <map>

/**
 * @brief 手动推进时钟的调度器
 */
class FakeScheduler : public Scheduler {
public:
  int64_t nowMs() const override { return m_now; }

  /**
   * @brief 推进时钟，按到期顺序执行定时器（包括回调中新建的）
   */
  void advance(int64_t ms) {
    int64_t target = m_now + ms;
    while (true) {
      auto next = nextDue(target);
      if (next == m_timers.end()) {
        break;
      }
      Timer timer = next->second;
      m_now = timer.due;
      if (timer.period == 0) {
        m_timers.erase(next);
      } else {
        next->second.due += timer.period;
      }
      ++m_fired;
      timer.callback();
    }
    m_now = target;
  }

  size_t pendingCount() const { return m_timers.size(); }
  size_t firedCount() const { return m_fired; }

protected:
  TimerId scheduleOnce(uint32_t delayMs, TimerCallback callback) override {
    TimerId id = m_nextId++;
    m_timers[id] = Timer{m_now + delayMs, 0, std::move(callback)};
    return id;
  }

  TimerId schedulePeriodic(uint32_t periodMs, TimerCallback callback) override {
    TimerId id = m_nextId++;
    uint32_t period = periodMs == 0 ? 1 : periodMs;
    m_timers[id] = Timer{m_now + period, period, std::move(callback)};
    return id;
  }

  void cancelTimer(TimerId id) override { m_timers.erase(id); }

  bool isPending(TimerId id) const override { return m_timers.count(id) != 0; }

private:
  struct Timer {
    int64_t due = 0;
    uint32_t period = 0;
    TimerCallback callback;
  };

  std::map<TimerId, Timer>::iterator nextDue(int64_t limit) {
    auto best = m_timers.end();
    for (auto it = m_timers.begin(); it != m_timers.end(); ++it) {
      if (it->second.due > limit) {
        continue;
      }
      if (best == m_timers.end() || it->second.due < best->second.due) {
        best = it;
      }
    }
    return best;
  }

  int64_t m_now = 0;
  TimerId m_nextId = 1;
  size_t m_fired = 0;
  std::map<TimerId, Timer> m_timers;
};
