#pragma once

#include "audio_level_monitor.h"
#include "capture_state.h"
#include "capture_state_machine.h"
#include "esp_err.h"
#include "media_capture.h"
#include "retry_policy.h"
#include "scheduler.h"
#include "speech_engine.h"
#include "subscription.h"
#include "transcript_aggregator.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

struct SpeechCaptureConfig {
  RetryPolicy retry = RetryPolicy::forProfile(PlatformProfile::Desktop);
  TranscriptConfig transcript;
  AudioLevelConfig audio_level;
};

/**
 * @brief 连续语音采集控制器
 *
 * 管理识别引擎生命周期和 Idle/Requesting/Listening/Suppressed/Error 状态。
 * 引擎自发结束时按 RetryPolicy 自动重启；致命错误进入 Error，需要重新
 * start()。所有方法都必须在调度器的执行上下文中调用。
 */
class SpeechCaptureController {
public:
  using TranscriptCallback =
      std::function<void(const std::string &text, bool is_final)>;
  using LevelCallback = std::function<void(float level)>;
  using StateCallback = std::function<void(CaptureState state)>;
  using ErrorCallback = std::function<void(CaptureError reason)>;
  using RestartInputsProvider = std::function<RestartInputs()>;

  SpeechCaptureController(Scheduler &scheduler, MediaCapture &media,
                          SpeechEngineFactory factory,
                          const SpeechCaptureConfig &cfg = SpeechCaptureConfig{});
  ~SpeechCaptureController();

  SpeechCaptureController(const SpeechCaptureController &) = delete;
  SpeechCaptureController &operator=(const SpeechCaptureController &) = delete;

  void setOnTranscript(TranscriptCallback cb) { m_onTranscript = std::move(cb); }
  void setOnAudioLevel(LevelCallback cb) { m_onAudioLevel = std::move(cb); }
  void setOnCaptureError(ErrorCallback cb) { m_onCaptureError = std::move(cb); }

  /**
   * @brief 注册状态变化监听（onCaptureStateChange）
   */
  Subscription addStateChangeListener(StateCallback cb);

  /**
   * @brief 设置自动重启输入来源，每次判断时实时调用
   *
   * 未设置时视为 {desired_listening=true, system_speaking=false}
   */
  void setRestartInputsProvider(RestartInputsProvider provider) {
    m_inputsProvider = std::move(provider);
  }

  /**
   * @brief 使用调用方提供的音频流，跳过权限申请；该流不会被关闭
   */
  void attachStream(std::shared_ptr<AudioStream> stream);

  void start();
  void stop();

  /**
   * @brief 系统播报期间暂停识别（保留引擎实例）
   */
  void suppress();

  /**
   * @brief 播报结束后恢复识别
   */
  void resume();

  void onEngineResult(const std::string &text, bool is_final);
  void onEngineEnd();
  void onEngineError(CaptureError error);

  CaptureState state() const { return m_stateMachine.getState(); }
  const CaptureSession &session() const { return m_session; }
  const RetryPolicy &policy() const { return m_cfg.retry; }
  CaptureError lastError() const { return m_lastError; }
  bool hasEngine() const { return m_engine != nullptr; }
  bool permissionPending() const { return m_permissionPending; }
  float audioLevel() const { return m_monitor.lastLevel(); }

private:
  void requestPermission();
  void onPermissionResult(uint32_t generation, CaptureError error,
                          std::shared_ptr<AudioStream> stream);
  bool enterState(CaptureState target);
  void beginListening();
  void abandonListening();
  bool ensureEngine();
  void onRestartTimer();
  void handleStartFault(esp_err_t err);
  void finishSession(const RestartInputs &inputs);
  void fail(CaptureError reason);
  void teardown();
  void releaseEngine();
  void closeStream();
  RestartInputs readInputs() const;

  Scheduler &m_scheduler;
  MediaCapture &m_media;
  SpeechEngineFactory m_factory;
  SpeechCaptureConfig m_cfg;

  CaptureStateMachine m_stateMachine;
  CaptureSession m_session;
  CaptureError m_lastError = CaptureError::None;

  TranscriptAggregator m_aggregator;
  AudioLevelMonitor m_monitor;

  std::unique_ptr<SpeechEngine> m_engine;
  std::shared_ptr<AudioStream> m_stream;
  bool m_ownsStream = false;

  // 权限申请代数，过期的应答直接丢弃
  uint32_t m_requestGeneration = 0;
  bool m_permissionPending = false;
  // 引擎会话正在运行（迟到的 onEngineEnd 据此忽略）
  bool m_sessionActive = false;
  TimerHandle m_restartTimer;

  RestartInputsProvider m_inputsProvider;
  TranscriptCallback m_onTranscript;
  LevelCallback m_onAudioLevel;
  ErrorCallback m_onCaptureError;

  std::shared_ptr<int> m_alive = std::make_shared<int>(0);
};
