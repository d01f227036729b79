#include "esp_timer_scheduler.h"

#include "esp_log.h"
#include "event_loop.h"

#include <cstdint>

static const char *TAG = "EspTimerScheduler";

EspTimerScheduler &EspTimerScheduler::instance() {
  static EspTimerScheduler instance;
  return instance;
}

int64_t EspTimerScheduler::nowMs() const { return esp_timer_get_time() / 1000; }

TimerId EspTimerScheduler::scheduleOnce(uint32_t delayMs,
                                        TimerCallback callback) {
  return create(delayMs, false, std::move(callback));
}

TimerId EspTimerScheduler::schedulePeriodic(uint32_t periodMs,
                                            TimerCallback callback) {
  return create(periodMs, true, std::move(callback));
}

esp_err_t EspTimerScheduler::ensureRedeliveryTimer() {
  if (m_redeliveryTimer) {
    return ESP_OK;
  }
  esp_timer_create_args_t args = {
      .callback = &EspTimerScheduler::onRedelivery,
      .arg = this,
      .dispatch_method = ESP_TIMER_TASK,
      .name = "sense_redeliver",
      .skip_unhandled_events = true,
  };
  return esp_timer_create(&args, &m_redeliveryTimer);
}

TimerId EspTimerScheduler::create(uint32_t ms, bool periodic,
                                  TimerCallback callback) {
  // 第一个定时器启动前建好，之后 esp_timer 任务只读
  esp_err_t err = ensureRedeliveryTimer();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Redelivery timer create failed: %s", esp_err_to_name(err));
    return kInvalidTimerId;
  }

  TimerId id = m_nextId++;
  if (m_nextId == kInvalidTimerId) {
    m_nextId = 1;
  }

  // arg 直接携带 ID，不持有任何指针
  esp_timer_create_args_t args = {
      .callback = &EspTimerScheduler::onExpired,
      .arg = reinterpret_cast<void *>(static_cast<uintptr_t>(id)),
      .dispatch_method = ESP_TIMER_TASK,
      .name = periodic ? "sense_tick" : "sense_once",
      .skip_unhandled_events = true,
  };

  esp_timer_handle_t handle = nullptr;
  err = esp_timer_create(&args, &handle);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "esp_timer_create failed: %s", esp_err_to_name(err));
    return kInvalidTimerId;
  }

  uint64_t us = (uint64_t)(ms == 0 ? 1 : ms) * 1000;
  err = periodic ? esp_timer_start_periodic(handle, us)
                 : esp_timer_start_once(handle, us);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "esp_timer start failed: %s", esp_err_to_name(err));
    destroyHandle(handle);
    return kInvalidTimerId;
  }

  m_timers[id] = Entry{handle, std::move(callback), periodic};
  return id;
}

void EspTimerScheduler::cancelTimer(TimerId id) {
  auto it = m_timers.find(id);
  if (it == m_timers.end()) {
    return;
  }
  destroyHandle(it->second.handle);
  m_timers.erase(it);
}

bool EspTimerScheduler::isPending(TimerId id) const {
  return m_timers.find(id) != m_timers.end();
}

void EspTimerScheduler::destroyHandle(esp_timer_handle_t handle) {
  if (!handle) {
    return;
  }
  esp_err_t err = esp_timer_stop(handle);
  // 已触发的一次性定时器返回 INVALID_STATE
  if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
    ESP_LOGW(TAG, "esp_timer_stop failed: %s", esp_err_to_name(err));
  }
  err = esp_timer_delete(handle);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "esp_timer_delete failed: %s", esp_err_to_name(err));
  }
}

bool EspTimerScheduler::postExpiry(TimerId id) {
  esp_err_t err = EventLoop::instance().post(
      [id]() { EspTimerScheduler::instance().dispatch(id); });
  return err == ESP_OK;
}

void EspTimerScheduler::queueRedelivery(Redelivery item) {
  m_redelivery.push_back(item);
  esp_err_t err = esp_timer_start_once(m_redeliveryTimer, kRedeliveryDelayUs);
  // 已在计时中返回 INVALID_STATE，等它到期一起重投
  if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
    ESP_LOGE(TAG, "Redelivery timer start failed: %s", esp_err_to_name(err));
  }
}

void EspTimerScheduler::onExpired(void *arg) {
  TimerId id = static_cast<TimerId>(reinterpret_cast<uintptr_t>(arg));
  auto &self = EspTimerScheduler::instance();
  if (!self.postExpiry(id)) {
    ESP_LOGW(TAG, "Timer %u expiry deferred, loop queue full", (unsigned)id);
    self.queueRedelivery(Redelivery{id, 1});
  }
}

void EspTimerScheduler::onRedelivery(void *arg) {
  auto *self = static_cast<EspTimerScheduler *>(arg);
  std::vector<Redelivery> items;
  items.swap(self->m_redelivery);

  for (const Redelivery &item : items) {
    if (self->postExpiry(item.id)) {
      continue;
    }
    if (item.attempts >= kMaxRedeliveryAttempts) {
      ESP_LOGE(TAG, "Timer %u expiry dropped after %d attempts", (unsigned)item.id,
               item.attempts);
      continue;
    }
    self->queueRedelivery(Redelivery{item.id, item.attempts + 1});
  }
}

void EspTimerScheduler::dispatch(TimerId id) {
  auto it = m_timers.find(id);
  if (it == m_timers.end()) {
    return; // 已取消
  }

  if (it->second.periodic) {
    TimerCallback cb = it->second.callback;
    cb();
    return;
  }

  TimerCallback cb = std::move(it->second.callback);
  destroyHandle(it->second.handle);
  m_timers.erase(it);
  cb();
}
