#pragma once

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

#include <functional>

struct EventLoopConfig {
  int queue_len = 32;
  int stack = 8192;
  int prio = 5;
  int core = 1;
};

/**
 * @brief 单任务事件循环
 *
 * 采集核心（控制器、聚合器、融合、仲裁）只在这个任务中运行。WebSocket
 * 事件、esp_timer 到期、权限应答都通过 post() 投递进来。
 *
 * @example
 *   auto& loop = EventLoop::instance();
 *   loop.init({});
 *   loop.post([]() { ESP_LOGI("MAIN", "runs on the loop task"); });
 */
class EventLoop {
public:
  using Task = std::function<void()>;

  static EventLoop &instance();

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;
  EventLoop(EventLoop &&) = delete;
  EventLoop &operator=(EventLoop &&) = delete;

  esp_err_t init(const EventLoopConfig &cfg = EventLoopConfig{});

  /**
   * @brief 投递任务（任意任务中可调用，不阻塞）
   * @return ESP_ERR_INVALID_STATE 未初始化, ESP_ERR_TIMEOUT 队列已满
   */
  esp_err_t post(Task task);

  /**
   * @brief 当前是否在事件循环任务中
   */
  bool inLoopTask() const;

  uint32_t droppedCount() const { return m_dropped; }

private:
  EventLoop() = default;
  ~EventLoop() = default;

  static void loopTask(void *arg);

  EventLoopConfig m_cfg;
  bool m_inited = false;
  QueueHandle_t m_queue = nullptr;
  TaskHandle_t m_task = nullptr;
  volatile uint32_t m_dropped = 0;
};
