#include "event_loop.h"

#include "esp_log.h"

static const char *TAG = "EventLoop";

EventLoop &EventLoop::instance() {
  static EventLoop instance;
  return instance;
}

esp_err_t EventLoop::init(const EventLoopConfig &cfg) {
  if (m_inited) {
    return ESP_OK;
  }
  m_cfg = cfg;

  // 队列里放 Task*，由循环任务负责 delete
  m_queue = xQueueCreate(m_cfg.queue_len, sizeof(Task *));
  if (!m_queue) {
    ESP_LOGE(TAG, "Failed to create queue");
    return ESP_ERR_NO_MEM;
  }

  BaseType_t ok = xTaskCreatePinnedToCore(loopTask, "sense_loop", m_cfg.stack,
                                          this, m_cfg.prio, &m_task, m_cfg.core);
  if (ok != pdPASS) {
    vQueueDelete(m_queue);
    m_queue = nullptr;
    ESP_LOGE(TAG, "Failed to create loop task");
    return ESP_FAIL;
  }

  m_inited = true;
  ESP_LOGI(TAG, "Init: queue=%d stack=%d prio=%d core=%d", m_cfg.queue_len,
           m_cfg.stack, m_cfg.prio, m_cfg.core);
  return ESP_OK;
}

esp_err_t EventLoop::post(Task task) {
  if (!m_inited || !task) {
    return ESP_ERR_INVALID_STATE;
  }

  Task *item = new Task(std::move(task));
  if (xQueueSend(m_queue, &item, 0) != pdTRUE) {
    delete item;
    m_dropped = m_dropped + 1;
    ESP_LOGW(TAG, "Queue full, event dropped (%u total)", (unsigned)m_dropped);
    return ESP_ERR_TIMEOUT;
  }
  return ESP_OK;
}

bool EventLoop::inLoopTask() const {
  return m_task != nullptr && xTaskGetCurrentTaskHandle() == m_task;
}

void EventLoop::loopTask(void *arg) {
  auto *self = static_cast<EventLoop *>(arg);
  ESP_LOGI(TAG, "Loop task started");

  Task *item = nullptr;
  while (true) {
    if (xQueueReceive(self->m_queue, &item, portMAX_DELAY) != pdTRUE) {
      continue;
    }
    if (item) {
      (*item)();
      delete item;
      item = nullptr;
    }
  }
}
