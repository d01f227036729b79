#pragma once

#include "esp_err.h"
#include "media_capture.h"
#include "scheduler.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

struct AudioLevelConfig {
  uint32_t sample_period_ms = 50;
  // mean(bins) / normalize_divisor, clamped to [0, 1]
  float normalize_divisor = 50.0f;
  // levels at or above this count as voice activity
  float activity_threshold = 0.1f;
};

/**
 * @brief 音量电平采样
 *
 * 只在 Listening 且系统未播报时运行，由 SpeechCaptureController 启停。
 * 用周期定时器采样，不占用任务。
 */
class AudioLevelMonitor {
public:
  using LevelCallback = std::function<void(float level)>;
  using ActivityCallback = std::function<void()>;

  explicit AudioLevelMonitor(Scheduler &scheduler,
                             const AudioLevelConfig &cfg = AudioLevelConfig{});
  ~AudioLevelMonitor();

  AudioLevelMonitor(const AudioLevelMonitor &) = delete;
  AudioLevelMonitor &operator=(const AudioLevelMonitor &) = delete;

  void setOnLevel(LevelCallback cb) { m_onLevel = std::move(cb); }
  void setOnActivity(ActivityCallback cb) { m_onActivity = std::move(cb); }

  /**
   * @brief 开始采样
   * @return ESP_OK, ESP_ERR_NOT_SUPPORTED 流不提供频谱分析
   */
  esp_err_t start(AudioStream &stream);

  /**
   * @brief 停止采样并立即上报 0
   */
  void stop();

  bool running() const { return m_analyser != nullptr; }
  float lastLevel() const { return m_lastLevel; }

  /**
   * @brief 由 0-255 频点计算归一化电平
   */
  static float ComputeLevel(const std::vector<uint8_t> &bins, float divisor);

private:
  void sample();
  void publish(float level);

  Scheduler &m_scheduler;
  AudioLevelConfig m_cfg;

  std::unique_ptr<SpectrumAnalyser> m_analyser;
  std::vector<uint8_t> m_bins;
  TimerHandle m_ticker;
  float m_lastLevel = 0.0f;

  LevelCallback m_onLevel;
  ActivityCallback m_onActivity;
};
