/**
 * @file i2s_media_capture.cpp
 * @brief ESP32-S3 I2S 麦克风采集实现
 *
 * 使用 ESP-SR AFE 做降噪和自动增益，esp-dsp 做频谱分析。
 */

#include "i2s_media_capture.h"

#include "esp_afe_sr_models.h"
#include "esp_dsp.h"
#include "esp_log.h"
#include "event_loop.h"
#include "model_path.h"

#include <algorithm>
#include <cmath>
#include <cstring>

static const char *TAG = "I2sCapture";

/**
 * @brief 读取 fetch 任务算好的 0-255 频谱
 */
class I2sSpectrumAnalyser : public SpectrumAnalyser {
public:
  explicit I2sSpectrumAnalyser(I2sMediaCapture &owner) : m_owner(owner) {}

  size_t readByteFrequencyData(std::vector<uint8_t> &bins) override {
    std::array<uint8_t, I2sMediaCapture::kBinCount> snapshot{};
    m_owner.copyBins(snapshot);
    bins.assign(snapshot.begin(), snapshot.end());
    return bins.size();
  }

private:
  I2sMediaCapture &m_owner;
};

// ============= I2sAudioStream =============

I2sAudioStream::I2sAudioStream(I2sMediaCapture &owner) : m_owner(owner) {}

I2sAudioStream::~I2sAudioStream() { close(); }

std::unique_ptr<SpectrumAnalyser> I2sAudioStream::createAnalyser() {
  if (!m_open) {
    return nullptr;
  }
  return std::make_unique<I2sSpectrumAnalyser>(m_owner);
}

Subscription I2sAudioStream::addFrameListener(FrameCallback callback) {
  std::weak_ptr<Listeners> weak = m_listeners;
  int id = 0;
  {
    std::lock_guard<std::mutex> lock(m_listeners->mutex);
    id = m_listeners->nextId++;
    m_listeners->callbacks[id] = std::move(callback);
  }
  return Subscription([weak, id]() {
    if (auto listeners = weak.lock()) {
      std::lock_guard<std::mutex> lock(listeners->mutex);
      listeners->callbacks.erase(id);
    }
  });
}

void I2sAudioStream::close() {
  bool wasOpen = m_open.exchange(false);
  if (wasOpen) {
    m_owner.releaseStream(this);
  }
}

void I2sAudioStream::dispatchFrame(const int16_t *samples, size_t count) {
  if (!m_open) {
    return;
  }
  std::lock_guard<std::mutex> lock(m_listeners->mutex);
  for (auto &[id, cb] : m_listeners->callbacks) {
    if (cb) {
      cb(samples, count);
    }
  }
}

// ============= 单例实现 =============

I2sMediaCapture &I2sMediaCapture::instance() {
  static I2sMediaCapture instance;
  return instance;
}

void I2sMediaCapture::postResult(AudioCallback callback, CaptureError error,
                                 std::shared_ptr<AudioStream> stream) {
  esp_err_t err = EventLoop::instance().post(
      [callback = std::move(callback), error, stream = std::move(stream)]() {
        callback(error, stream);
      });
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to post capture result: %s", esp_err_to_name(err));
  }
}

void I2sMediaCapture::requestAudio(const MediaConstraints &constraints,
                                   AudioCallback callback) {
  if (!callback) {
    return;
  }

  if (constraints.sample_rate_hz != kSampleRate) {
    ESP_LOGI(TAG, "Requested %u Hz, microphone runs at %u Hz",
             (unsigned)constraints.sample_rate_hz, (unsigned)kSampleRate);
  }

  esp_err_t err = ESP_OK;
  if (!m_i2sReady) {
    err = initI2s();
  }
  if (err == ESP_OK && !m_afeReady) {
    err = initAfe(constraints);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Microphone unavailable: %s", esp_err_to_name(err));
    postResult(std::move(callback), CaptureError::DeviceNotFound, nullptr);
    return;
  }

  if (!m_dspReady) {
    esp_err_t dspErr = initDsp();
    if (dspErr != ESP_OK) {
      ESP_LOGW(TAG, "Spectrum disabled: %s", esp_err_to_name(dspErr));
    }
  }

  if (!m_running) {
    err = startTasks();
    if (err != ESP_OK) {
      postResult(std::move(callback), CaptureError::DeviceNotFound, nullptr);
      return;
    }
  }

  auto stream = std::make_shared<I2sAudioStream>(*this);
  {
    std::lock_guard<std::mutex> lock(m_streamsMutex);
    m_streams.push_back(stream);
  }
  if (m_openStreams.fetch_add(1) == 0) {
    m_resetAfe.store(true);
  }
  ESP_LOGI(TAG, "Audio stream opened (%d open)", m_openStreams.load());
  postResult(std::move(callback), CaptureError::None, stream);
}

void I2sMediaCapture::releaseStream(const I2sAudioStream *stream) {
  std::lock_guard<std::mutex> lock(m_streamsMutex);
  m_streams.erase(std::remove_if(m_streams.begin(), m_streams.end(),
                                 [stream](const std::weak_ptr<I2sAudioStream> &w) {
                                   auto s = w.lock();
                                   return !s || s.get() == stream;
                                 }),
                  m_streams.end());
  int left = m_openStreams.fetch_sub(1) - 1;
  ESP_LOGI(TAG, "Audio stream closed (%d open)", left);

  if (left == 0) {
    std::lock_guard<std::mutex> binsLock(m_binsMutex);
    m_bins.fill(0);
  }
}

void I2sMediaCapture::copyBins(std::array<uint8_t, kBinCount> &out) {
  std::lock_guard<std::mutex> lock(m_binsMutex);
  out = m_bins;
}

// ============= 内部初始化 =============

esp_err_t I2sMediaCapture::initI2s() {
  i2s_chan_config_t chanCfg =
      I2S_CHANNEL_DEFAULT_CONFIG((i2s_port_t)m_cfg.port, I2S_ROLE_MASTER);
  chanCfg.auto_clear = true;

  esp_err_t err = i2s_new_channel(&chanCfg, nullptr, &m_i2sRxHandle);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "i2s_new_channel failed: %s", esp_err_to_name(err));
    return err;
  }

  // INMP441 L/R 接 GND 时输出左声道
  i2s_std_slot_config_t slotCfg = I2S_STD_PHILIPS_SLOT_DEFAULT_CONFIG(
      I2S_DATA_BIT_WIDTH_16BIT, I2S_SLOT_MODE_MONO);
  slotCfg.slot_mask = I2S_STD_SLOT_LEFT;

  i2s_std_config_t stdCfg = {
      .clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG(kSampleRate),
      .slot_cfg = slotCfg,
      .gpio_cfg =
          {
              .mclk = I2S_GPIO_UNUSED,
              .bclk = (gpio_num_t)m_cfg.bck_io,
              .ws = (gpio_num_t)m_cfg.ws_io,
              .dout = I2S_GPIO_UNUSED,
              .din = (gpio_num_t)m_cfg.din_io,
              .invert_flags =
                  {
                      .mclk_inv = false,
                      .bclk_inv = false,
                      .ws_inv = false,
                  },
          },
  };

  err = i2s_channel_init_std_mode(m_i2sRxHandle, &stdCfg);
  if (err == ESP_OK) {
    err = i2s_channel_enable(m_i2sRxHandle);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "I2S setup failed: %s", esp_err_to_name(err));
    esp_err_t delErr = i2s_del_channel(m_i2sRxHandle);
    if (delErr != ESP_OK) {
      ESP_LOGW(TAG, "i2s_del_channel failed: %s", esp_err_to_name(delErr));
    }
    m_i2sRxHandle = nullptr;
    return err;
  }

  m_i2sReady = true;
  ESP_LOGI(TAG, "I2S ready (BCK:%d, WS:%d, DIN:%d)", m_cfg.bck_io, m_cfg.ws_io,
           m_cfg.din_io);
  return ESP_OK;
}

esp_err_t I2sMediaCapture::initAfe(const MediaConstraints &constraints) {
  m_models = esp_srmodel_init("model");
  if (m_models == nullptr) {
    ESP_LOGW(TAG, "No model partition, AFE runs without neural models");
  }

  // "M" = 单麦克风通道
  m_afeConfig = afe_config_init("M", m_models, AFE_TYPE_SR, AFE_MODE_LOW_COST);
  if (m_afeConfig == nullptr) {
    ESP_LOGE(TAG, "AFE config init failed");
    return ESP_ERR_NO_MEM;
  }

  // 只做前端处理，不需要唤醒词
  m_afeConfig->wakenet_init = false;
  m_afeConfig->vad_init = false;
  m_afeConfig->ns_init = constraints.noise_suppression;
  m_afeConfig->agc_init = constraints.auto_gain_control;
  // 没有回采通道
  m_afeConfig->aec_init = false;
  if (constraints.echo_cancellation) {
    ESP_LOGI(TAG, "Echo cancellation needs a reference channel, skipped");
  }
  afe_config_print(m_afeConfig);

  m_afeHandle = esp_afe_handle_from_config(m_afeConfig);
  if (m_afeHandle == nullptr) {
    ESP_LOGE(TAG, "AFE handle create failed");
    afe_config_free(m_afeConfig);
    m_afeConfig = nullptr;
    return ESP_ERR_NO_MEM;
  }

  m_afeData = m_afeHandle->create_from_config(m_afeConfig);
  if (m_afeData == nullptr) {
    ESP_LOGE(TAG, "AFE data create failed");
    afe_config_free(m_afeConfig);
    m_afeConfig = nullptr;
    return ESP_ERR_NO_MEM;
  }

  m_afeReady = true;
  ESP_LOGI(TAG, "AFE ready (ns=%d agc=%d)", constraints.noise_suppression ? 1 : 0,
           constraints.auto_gain_control ? 1 : 0);
  return ESP_OK;
}

esp_err_t I2sMediaCapture::initDsp() {
  esp_err_t err = dsps_fft2r_init_fc32(nullptr, kFftSize);
  if (err != ESP_OK) {
    return err;
  }
  dsps_wind_hann_f32(m_window, kFftSize);
  m_dspReady = true;
  return ESP_OK;
}

esp_err_t I2sMediaCapture::startTasks() {
  m_running = true;

  BaseType_t ret =
      xTaskCreatePinnedToCore(audioFeedTask, "mic_feed", m_cfg.feed_stack,
                              this, m_cfg.task_prio, &m_feedTaskHandle, 0);
  if (ret != pdPASS) {
    ESP_LOGE(TAG, "Failed to create feed task");
    m_running = false;
    return ESP_FAIL;
  }

  ret = xTaskCreatePinnedToCore(audioFetchTask, "mic_fetch", m_cfg.fetch_stack,
                                this, m_cfg.task_prio, &m_fetchTaskHandle, 1);
  if (ret != pdPASS) {
    ESP_LOGE(TAG, "Failed to create fetch task");
    stopTasks();
    return ESP_FAIL;
  }

  ESP_LOGI(TAG, "Capture tasks started");
  return ESP_OK;
}

void I2sMediaCapture::stopTasks() {
  m_running = false;
  // 任务自己检查 m_running 退出
  for (int i = 0; i < 20 && (m_feedTaskHandle || m_fetchTaskHandle); ++i) {
    vTaskDelay(pdMS_TO_TICKS(10));
  }
}

// ============= 任务函数 =============

void I2sMediaCapture::audioFeedTask(void *arg) {
  auto *self = static_cast<I2sMediaCapture *>(arg);

  int chunkSize = self->m_afeHandle->get_feed_chunksize(self->m_afeData);
  int16_t *buffer = (int16_t *)malloc(chunkSize * sizeof(int16_t));
  if (buffer == nullptr) {
    ESP_LOGE(TAG, "Failed to allocate feed buffer");
    self->m_feedTaskHandle = nullptr;
    vTaskDelete(nullptr);
    return;
  }

  ESP_LOGI(TAG, "Feed task started, chunk size: %d", chunkSize);

  size_t bytesRead = 0;
  while (self->m_running) {
    if (self->m_openStreams.load() == 0) {
      vTaskDelay(pdMS_TO_TICKS(20));
      continue;
    }
    if (self->m_resetAfe.exchange(false)) {
      self->m_afeHandle->reset_buffer(self->m_afeData);
    }

    esp_err_t ret = i2s_channel_read(self->m_i2sRxHandle, buffer,
                                     chunkSize * sizeof(int16_t), &bytesRead,
                                     portMAX_DELAY);
    if (ret == ESP_OK && bytesRead > 0) {
      self->m_afeHandle->feed(self->m_afeData, buffer);
    } else {
      ESP_LOGW(TAG, "I2S read failed: %s, bytesRead=%u", esp_err_to_name(ret),
               (unsigned)bytesRead);
    }
  }

  free(buffer);
  ESP_LOGI(TAG, "Feed task exited");
  self->m_feedTaskHandle = nullptr;
  vTaskDelete(nullptr);
}

void I2sMediaCapture::audioFetchTask(void *arg) {
  auto *self = static_cast<I2sMediaCapture *>(arg);
  ESP_LOGI(TAG, "Fetch task started");

  while (self->m_running) {
    afe_fetch_result_t *res = self->m_afeHandle->fetch(self->m_afeData);
    if (res == nullptr || res->ret_value == ESP_FAIL || res->data == nullptr ||
        res->data_size <= 0) {
      continue;
    }

    self->m_dispatchList.clear();
    {
      std::lock_guard<std::mutex> lock(self->m_streamsMutex);
      for (const auto &weak : self->m_streams) {
        if (auto stream = weak.lock()) {
          if (stream->isOpen()) {
            self->m_dispatchList.push_back(std::move(stream));
          }
        }
      }
    }
    if (self->m_dispatchList.empty()) {
      continue;
    }

    int samples = res->data_size / (int)sizeof(int16_t);
    self->analyse(res->data, samples);
    for (auto &stream : self->m_dispatchList) {
      stream->dispatchFrame(res->data, (size_t)samples);
    }
    self->m_dispatchList.clear();
  }

  ESP_LOGI(TAG, "Fetch task exited");
  self->m_fetchTaskHandle = nullptr;
  vTaskDelete(nullptr);
}

// ============= 频谱 =============

void I2sMediaCapture::analyse(const int16_t *samples, int numSamples) {
  if (!m_dspReady || samples == nullptr || numSamples <= 0) {
    return;
  }

  // 滑动窗口保留最近 kFftSize 个样本
  if (numSamples >= kFftSize) {
    memcpy(m_history, samples + (numSamples - kFftSize),
           kFftSize * sizeof(int16_t));
    m_historyFill = kFftSize;
  } else {
    int keep = kFftSize - numSamples;
    memmove(m_history, m_history + numSamples, keep * sizeof(int16_t));
    memcpy(m_history + keep, samples, numSamples * sizeof(int16_t));
    m_historyFill = std::min(kFftSize, m_historyFill + numSamples);
  }
  if (m_historyFill < kFftSize) {
    return;
  }

  for (int i = 0; i < kFftSize; ++i) {
    m_fftBuf[i * 2] = ((float)m_history[i] / 32768.0f) * m_window[i];
    m_fftBuf[i * 2 + 1] = 0.0f;
  }

  esp_err_t ret = dsps_fft2r_fc32(m_fftBuf, kFftSize);
  if (ret == ESP_OK) {
    ret = dsps_bit_rev_fc32(m_fftBuf, kFftSize);
  }
  if (ret == ESP_OK) {
    ret = dsps_cplx2reC_fc32(m_fftBuf, kFftSize);
  }
  if (ret != ESP_OK) {
    ESP_LOGW(TAG, "FFT failed: %s", esp_err_to_name(ret));
    return;
  }

  // 与 AnalyserNode 一致：平滑后的幅度转 dB，再线性映射到 0-255
  const float range = m_cfg.max_db - m_cfg.min_db;
  std::array<uint8_t, kBinCount> bytes{};
  for (int bin = 0; bin < kBinCount; ++bin) {
    float re = m_fftBuf[bin * 2];
    float im = m_fftBuf[bin * 2 + 1];
    float mag = sqrtf(re * re + im * im) / (float)kFftSize;
    m_smoothed[bin] =
        m_cfg.smoothing * m_smoothed[bin] + (1.0f - m_cfg.smoothing) * mag;

    float db = 20.0f * log10f(m_smoothed[bin] + 1e-12f);
    float scaled = range > 0.0f ? 255.0f * (db - m_cfg.min_db) / range : 0.0f;
    bytes[bin] = (uint8_t)std::clamp(scaled, 0.0f, 255.0f);
  }

  std::lock_guard<std::mutex> lock(m_binsMutex);
  m_bins = bytes;
}
