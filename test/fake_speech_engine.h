#pragma once

#include "speech_engine.h"

#include <memory>
#include <string>

/**
 * @brief 可观察的识别引擎
 *
 * 所有实例共享一个 Stats，用来断言同一时刻最多只有一个存活实例
 */
class FakeSpeechEngine : public SpeechEngine {
public:
  struct Stats {
    int created = 0;
    int alive = 0;
    int max_alive = 0;
    int starts = 0;
    int stops = 0;
    FakeSpeechEngine *current = nullptr;
    // 下一次 start() 的返回值，用后恢复 ESP_OK
    esp_err_t next_start_result = ESP_OK;
  };

  explicit FakeSpeechEngine(std::shared_ptr<Stats> stats)
      : m_stats(std::move(stats)) {
    m_stats->created++;
    m_stats->alive++;
    if (m_stats->alive > m_stats->max_alive) {
      m_stats->max_alive = m_stats->alive;
    }
    m_stats->current = this;
  }

  ~FakeSpeechEngine() override {
    m_stats->alive--;
    if (m_stats->current == this) {
      m_stats->current = nullptr;
    }
  }

  esp_err_t start() override {
    m_stats->starts++;
    esp_err_t result = m_stats->next_start_result;
    m_stats->next_start_result = ESP_OK;
    if (result == ESP_OK) {
      if (m_running) {
        return ESP_ERR_INVALID_STATE;
      }
      m_running = true;
    }
    return result;
  }

  esp_err_t stop() override {
    m_stats->stops++;
    m_running = false;
    return ESP_OK;
  }

  void setCallbacks(SpeechEngineCallbacks callbacks) override {
    m_callbacks = std::move(callbacks);
  }

  bool running() const { return m_running; }

  void emitResult(const std::string &text, bool isFinal) {
    if (m_callbacks.on_result) {
      m_callbacks.on_result(text, isFinal);
    }
  }

  /// 引擎自发结束
  void emitEnd() {
    m_running = false;
    if (m_callbacks.on_end) {
      m_callbacks.on_end();
    }
  }

  void emitError(CaptureError error) {
    if (m_callbacks.on_error) {
      m_callbacks.on_error(error);
    }
  }

  static SpeechEngineFactory factory(std::shared_ptr<Stats> stats) {
    return [stats](AudioStream &) -> std::unique_ptr<SpeechEngine> {
      return std::make_unique<FakeSpeechEngine>(stats);
    };
  }

private:
  std::shared_ptr<Stats> m_stats;
  bool m_running = false;
  SpeechEngineCallbacks m_callbacks;
};
