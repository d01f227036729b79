#include "audio_level_monitor.h"

#include "esp_log.h"

#include <algorithm>

static const char *TAG = "AudioLevel";

AudioLevelMonitor::AudioLevelMonitor(Scheduler &scheduler,
                                     const AudioLevelConfig &cfg)
    : m_scheduler(scheduler), m_cfg(cfg) {
  if (m_cfg.normalize_divisor <= 0.0f) {
    m_cfg.normalize_divisor = 50.0f;
  }
  if (m_cfg.sample_period_ms == 0) {
    m_cfg.sample_period_ms = 50;
  }
}

AudioLevelMonitor::~AudioLevelMonitor() {
  m_ticker.cancel();
  m_analyser.reset();
}

esp_err_t AudioLevelMonitor::start(AudioStream &stream) {
  if (running()) {
    return ESP_OK;
  }

  m_analyser = stream.createAnalyser();
  if (!m_analyser) {
    ESP_LOGW(TAG, "Stream has no spectrum analyser, level stays 0");
    return ESP_ERR_NOT_SUPPORTED;
  }

  m_ticker = m_scheduler.runEvery(m_cfg.sample_period_ms, [this]() { sample(); });
  ESP_LOGD(TAG, "Sampling every %u ms", (unsigned)m_cfg.sample_period_ms);
  return ESP_OK;
}

void AudioLevelMonitor::stop() {
  bool wasRunning = running();
  m_ticker.cancel();
  m_analyser.reset();

  if (wasRunning || m_lastLevel != 0.0f) {
    publish(0.0f);
  }
}

float AudioLevelMonitor::ComputeLevel(const std::vector<uint8_t> &bins,
                                      float divisor) {
  if (bins.empty() || divisor <= 0.0f) {
    return 0.0f;
  }
  uint32_t sum = 0;
  for (uint8_t b : bins) {
    sum += b;
  }
  float mean = (float)sum / (float)bins.size();
  return std::clamp(mean / divisor, 0.0f, 1.0f);
}

void AudioLevelMonitor::sample() {
  if (!m_analyser) {
    return;
  }
  m_analyser->readByteFrequencyData(m_bins);

  float level = ComputeLevel(m_bins, m_cfg.normalize_divisor);
  publish(level);

  if (level >= m_cfg.activity_threshold && m_onActivity) {
    m_onActivity();
  }
}

void AudioLevelMonitor::publish(float level) {
  m_lastLevel = level;
  if (m_onLevel) {
    m_onLevel(level);
  }
}
