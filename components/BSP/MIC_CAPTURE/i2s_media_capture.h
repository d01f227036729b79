#pragma once

#include "driver/i2s_std.h"
#include "esp_afe_sr_iface.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "media_capture.h"

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief I2S 麦克风配置
 */
struct I2sCaptureConfig {
  int port = 0;    /*!< I2S 端口号 */
  int bck_io = 41; /*!< I2S BCK GPIO */
  int ws_io = 42;  /*!< I2S WS GPIO */
  int din_io = 2;  /*!< I2S DIN GPIO */

  /* 频谱分析参数，与浏览器 AnalyserNode 的默认值一致 */
  float min_db = -100.0f;
  float max_db = -30.0f;
  float smoothing = 0.8f;

  int feed_stack = 4096;
  int fetch_stack = 8192;
  int task_prio = 5;
};

class I2sAudioStream;

/**
 * @brief I2S 麦克风采集
 *
 * 单例，因为板子上只有一个麦克风。requestAudio() 首次调用时初始化
 * I2S 和 AFE（降噪 / 自动增益）并启动采集任务，每次请求返回一个新的
 * 音频流；结果通过 EventLoop 回调。没有打开的流时采集任务空转。
 *
 * 采集链路：I2S -> AFE feed -> AFE fetch -> (PCM 帧监听 + FFT 频谱)
 *
 * @example
 *   auto& mic = I2sMediaCapture::instance();
 *   mic.configure({.bck_io = 41, .ws_io = 42, .din_io = 2});
 *   mic.requestAudio(MediaConstraints::forProfile(PlatformProfile::Mobile),
 *       [](CaptureError err, std::shared_ptr<AudioStream> stream) { ... });
 */
class I2sMediaCapture : public MediaCapture {
public:
  static constexpr int kFftSize = 512;
  static constexpr int kBinCount = kFftSize / 2;
  static constexpr uint32_t kSampleRate = 16000;

  static I2sMediaCapture &instance();

  I2sMediaCapture(const I2sMediaCapture &) = delete;
  I2sMediaCapture &operator=(const I2sMediaCapture &) = delete;
  I2sMediaCapture(I2sMediaCapture &&) = delete;
  I2sMediaCapture &operator=(I2sMediaCapture &&) = delete;

  /**
   * @brief 设置引脚等参数（在第一次 requestAudio 之前调用）
   */
  void configure(const I2sCaptureConfig &cfg) { m_cfg = cfg; }

  void requestAudio(const MediaConstraints &constraints,
                    AudioCallback callback) override;

  bool isCapturing() const { return m_openStreams.load() > 0; }

private:
  friend class I2sAudioStream;
  friend class I2sSpectrumAnalyser;

  I2sMediaCapture() = default;
  ~I2sMediaCapture() = default;

  esp_err_t initI2s();
  esp_err_t initAfe(const MediaConstraints &constraints);
  esp_err_t initDsp();
  esp_err_t startTasks();
  void stopTasks();

  // 由 I2sAudioStream 调用
  void releaseStream(const I2sAudioStream *stream);
  void copyBins(std::array<uint8_t, kBinCount> &out);

  void postResult(AudioCallback callback, CaptureError error,
                  std::shared_ptr<AudioStream> stream);

  void analyse(const int16_t *samples, int numSamples);

  static void audioFeedTask(void *arg);
  static void audioFetchTask(void *arg);

  I2sCaptureConfig m_cfg;
  bool m_i2sReady = false;
  bool m_afeReady = false;
  bool m_dspReady = false;

  // ESP-SR
  const esp_afe_sr_iface_t *m_afeHandle = nullptr;
  esp_afe_sr_data_t *m_afeData = nullptr;
  afe_config_t *m_afeConfig = nullptr;
  srmodel_list_t *m_models = nullptr;

  // I2S
  i2s_chan_handle_t m_i2sRxHandle = nullptr;

  // FreeRTOS 任务
  TaskHandle_t m_feedTaskHandle = nullptr;
  TaskHandle_t m_fetchTaskHandle = nullptr;
  std::atomic<bool> m_running{false};

  std::mutex m_streamsMutex;
  std::vector<std::weak_ptr<I2sAudioStream>> m_streams;
  std::atomic<int> m_openStreams{0};
  std::atomic<bool> m_resetAfe{false};
  // 只在 fetch 任务中使用
  std::vector<std::shared_ptr<I2sAudioStream>> m_dispatchList;

  // FFT（只在 fetch 任务中使用）
  alignas(16) float m_window[kFftSize] = {};
  alignas(16) float m_fftBuf[kFftSize * 2] = {};
  int16_t m_history[kFftSize] = {};
  int m_historyFill = 0;
  float m_smoothed[kBinCount] = {};

  // fetch 任务写，事件循环读
  std::mutex m_binsMutex;
  std::array<uint8_t, kBinCount> m_bins{};
};

/**
 * @brief I2S 音频流
 *
 * 帧监听在 fetch 任务中回调，注册/注销可以在任意任务中进行。
 */
class I2sAudioStream : public AudioStream,
                       public std::enable_shared_from_this<I2sAudioStream> {
public:
  explicit I2sAudioStream(I2sMediaCapture &owner);
  ~I2sAudioStream() override;

  std::unique_ptr<SpectrumAnalyser> createAnalyser() override;
  Subscription addFrameListener(FrameCallback callback) override;
  void close() override;
  bool isOpen() const override { return m_open; }

  /**
   * @brief fetch 任务调用
   */
  void dispatchFrame(const int16_t *samples, size_t count);

private:
  struct Listeners {
    std::mutex mutex;
    std::map<int, FrameCallback> callbacks;
    int nextId = 0;
  };

  I2sMediaCapture &m_owner;
  std::atomic<bool> m_open{true};
  std::shared_ptr<Listeners> m_listeners = std::make_shared<Listeners>();
};
