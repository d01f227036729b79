#include "speech_capture_controller.h"

#include "esp_log.h"

static const char *TAG = "SpeechCapture";

SpeechCaptureController::SpeechCaptureController(Scheduler &scheduler,
                                                 MediaCapture &media,
                                                 SpeechEngineFactory factory,
                                                 const SpeechCaptureConfig &cfg)
    : m_scheduler(scheduler), m_media(media), m_factory(std::move(factory)),
      m_cfg(cfg), m_aggregator(scheduler, cfg.transcript),
      m_monitor(scheduler, cfg.audio_level) {
  m_session.profile = m_cfg.retry.profile;

  m_aggregator.setOnTranscript([this](const std::string &text, bool isFinal) {
    if (m_onTranscript) {
      m_onTranscript(text, isFinal);
    }
  });
  m_monitor.setOnLevel([this](float level) {
    if (m_onAudioLevel) {
      m_onAudioLevel(level);
    }
  });
  m_monitor.setOnActivity([this]() { m_aggregator.noteActivity(); });

  ESP_LOGI(TAG, "Init: profile=%s max_retries=%u delay=%ums hard_reset=%d",
           GetPlatformProfileName(m_cfg.retry.profile),
           (unsigned)m_cfg.retry.max_retries, (unsigned)m_cfg.retry.delay_ms,
           m_cfg.retry.hard_reset_on_fault ? 1 : 0);
}

SpeechCaptureController::~SpeechCaptureController() {
  m_alive.reset();
  m_restartTimer.cancel();
  m_sessionActive = false;
  releaseEngine();
  closeStream();
}

Subscription SpeechCaptureController::addStateChangeListener(StateCallback cb) {
  return m_stateMachine.addStateChangeListener(
      [cb = std::move(cb)](CaptureState, CaptureState newState) {
        if (cb) {
          cb(newState);
        }
      });
}

void SpeechCaptureController::attachStream(std::shared_ptr<AudioStream> stream) {
  if (m_ownsStream) {
    closeStream();
  }
  m_stream = std::move(stream);
  m_ownsStream = false;
  ESP_LOGI(TAG, "Using caller-supplied audio stream");
}

void SpeechCaptureController::start() {
  CaptureState st = state();
  if (st == CaptureState::Listening || st == CaptureState::Requesting ||
      st == CaptureState::Suppressed) {
    ESP_LOGD(TAG, "start() ignored in %s", GetCaptureStateName(st));
    return;
  }

  m_lastError = CaptureError::None;
  m_session.retry_count = 0;
  if (!enterState(CaptureState::Requesting)) {
    return;
  }

  if (m_stream && m_stream->isOpen()) {
    m_session.permission = PermissionState::Granted;
    beginListening();
    return;
  }
  requestPermission();
}

void SpeechCaptureController::requestPermission() {
  uint32_t generation = ++m_requestGeneration;
  m_permissionPending = true;

  MediaConstraints constraints = MediaConstraints::forProfile(m_cfg.retry.profile);
  ESP_LOGI(TAG, "Requesting microphone (%u Hz, request #%u)",
           (unsigned)constraints.sample_rate_hz, (unsigned)generation);

  std::weak_ptr<int> alive = m_alive;
  m_media.requestAudio(constraints, [this, alive, generation](
                                        CaptureError error,
                                        std::shared_ptr<AudioStream> stream) {
    if (alive.expired()) {
      if (stream) {
        stream->close();
      }
      return;
    }
    onPermissionResult(generation, error, std::move(stream));
  });
}

void SpeechCaptureController::onPermissionResult(
    uint32_t generation, CaptureError error,
    std::shared_ptr<AudioStream> stream) {
  if (generation != m_requestGeneration || !m_permissionPending) {
    ESP_LOGD(TAG, "Discarding stale permission answer #%u", (unsigned)generation);
    if (stream && stream != m_stream) {
      stream->close();
    }
    return;
  }
  m_permissionPending = false;

  if (error == CaptureError::None && !stream) {
    error = CaptureError::DeviceNotFound;
  }
  if (error != CaptureError::None) {
    if (stream) {
      stream->close();
    }
    fail(error);
    return;
  }

  m_session.permission = PermissionState::Granted;
  m_stream = std::move(stream);
  m_ownsStream = true;

  if (state() == CaptureState::Suppressed) {
    // 申请期间开始播报，等 resume()
    ESP_LOGI(TAG, "Permission granted while suppressed");
    return;
  }
  beginListening();
}

bool SpeechCaptureController::ensureEngine() {
  if (m_engine) {
    return true;
  }
  if (!m_factory || !m_stream) {
    return false;
  }
  m_engine = m_factory(*m_stream);
  if (!m_engine) {
    return false;
  }

  m_engine->setCallbacks(SpeechEngineCallbacks{
      .on_result = [this](const std::string &text,
                          bool isFinal) { onEngineResult(text, isFinal); },
      .on_error = [this](CaptureError err) { onEngineError(err); },
      .on_end = [this]() { onEngineEnd(); },
  });
  ESP_LOGI(TAG, "Speech engine created");
  return true;
}

bool SpeechCaptureController::enterState(CaptureState target) {
  // 监听器可能在通知中 stop()/suppress()，之后以当前状态为准
  return m_stateMachine.transitionTo(target) && state() == target;
}

void SpeechCaptureController::beginListening() {
  CaptureState from = state();
  if (from != CaptureState::Requesting && from != CaptureState::Suppressed) {
    ESP_LOGD(TAG, "beginListening() ignored in %s", GetCaptureStateName(from));
    return;
  }
  if (!ensureEngine()) {
    fail(CaptureError::UnsupportedPlatform);
    return;
  }

  // 引擎和电平采样先启动，再通知 Listening
  m_sessionActive = true;
  if (!m_monitor.running()) {
    esp_err_t err = m_monitor.start(*m_stream);
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "Audio level unavailable: %s", esp_err_to_name(err));
    }
  }

  esp_err_t err = m_engine->start();
  if (err == ESP_ERR_INVALID_STATE) {
    ESP_LOGD(TAG, "Engine already running");
    err = ESP_OK;
  }

  if (!enterState(CaptureState::Listening)) {
    abandonListening();
    return;
  }
  if (err != ESP_OK) {
    handleStartFault(err);
  }
}

void SpeechCaptureController::abandonListening() {
  ESP_LOGD(TAG, "Listening abandoned in %s", GetCaptureStateName(state()));
  m_sessionActive = false;
  m_monitor.stop();
  if (m_engine) {
    esp_err_t err = m_engine->stop();
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "Engine stop failed: %s", esp_err_to_name(err));
    }
  }
}

void SpeechCaptureController::stop() {
  ++m_requestGeneration;
  m_permissionPending = false;

  teardown();
  m_session.retry_count = 0;

  if (state() != CaptureState::Idle) {
    m_stateMachine.transitionTo(CaptureState::Idle);
  }
}

void SpeechCaptureController::suppress() {
  CaptureState st = state();
  if (st != CaptureState::Listening && st != CaptureState::Requesting) {
    return;
  }

  m_restartTimer.cancel();
  m_sessionActive = false;
  if (m_engine) {
    esp_err_t err = m_engine->stop();
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "Engine stop failed: %s", esp_err_to_name(err));
    }
  }
  m_monitor.stop();
  m_stateMachine.transitionTo(CaptureState::Suppressed);
}

void SpeechCaptureController::resume() {
  if (state() != CaptureState::Suppressed) {
    return;
  }

  if (m_permissionPending) {
    m_stateMachine.transitionTo(CaptureState::Requesting);
    return;
  }
  if (!m_stream || !m_stream->isOpen()) {
    if (enterState(CaptureState::Requesting)) {
      requestPermission();
    }
    return;
  }
  beginListening();
}

void SpeechCaptureController::onEngineResult(const std::string &text,
                                             bool is_final) {
  CaptureState st = state();
  if (st == CaptureState::Idle || st == CaptureState::Error) {
    return;
  }
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return;
  }

  if (m_session.retry_count != 0) {
    ESP_LOGD(TAG, "Result received, retry count reset");
  }
  m_session.retry_count = 0;

  if (is_final) {
    m_aggregator.onFinal(text);
  } else {
    m_aggregator.onPartial(text);
  }
}

void SpeechCaptureController::onEngineEnd() {
  if (state() != CaptureState::Listening || !m_sessionActive) {
    ESP_LOGD(TAG, "Engine end ignored in %s", GetCaptureStateName(state()));
    return;
  }
  m_sessionActive = false;

  RestartInputs inputs = readInputs();
  if (ShouldRestart(m_session, inputs, m_cfg.retry)) {
    m_session.retry_count++;
    ESP_LOGI(TAG, "Engine ended, restart %u/%u in %u ms",
             (unsigned)m_session.retry_count, (unsigned)m_cfg.retry.max_retries,
             (unsigned)m_cfg.retry.delay_ms);
    m_restartTimer =
        m_scheduler.runAfter(m_cfg.retry.delay_ms, [this]() { onRestartTimer(); });
    return;
  }
  finishSession(inputs);
}

void SpeechCaptureController::onRestartTimer() {
  if (state() != CaptureState::Listening || m_sessionActive) {
    return;
  }

  // 延迟期间输入可能已变化，重新检查
  RestartInputs inputs = readInputs();
  if (!inputs.desired_listening || inputs.system_speaking ||
      m_session.permission != PermissionState::Granted) {
    finishSession(inputs);
    return;
  }

  if (!ensureEngine()) {
    fail(CaptureError::UnsupportedPlatform);
    return;
  }

  m_sessionActive = true;
  esp_err_t err = m_engine->start();
  if (err == ESP_ERR_INVALID_STATE) {
    ESP_LOGD(TAG, "Restart: engine already running");
  } else if (err != ESP_OK) {
    handleStartFault(err);
  }
}

void SpeechCaptureController::handleStartFault(esp_err_t err) {
  ESP_LOGW(TAG, "Engine start failed: %s", esp_err_to_name(err));
  if (m_cfg.retry.hard_reset_on_fault) {
    fail(CaptureError::EngineInvalidState);
    return;
  }
  // 视为又一次结束，消耗重试次数
  onEngineEnd();
}

void SpeechCaptureController::finishSession(const RestartInputs &inputs) {
  m_restartTimer.cancel();

  if (inputs.desired_listening && !inputs.system_speaking &&
      m_session.permission == PermissionState::Granted &&
      RetriesExhausted(m_session, m_cfg.retry)) {
    fail(CaptureError::RetriesExhausted);
    return;
  }

  if (inputs.system_speaking) {
    m_monitor.stop();
    m_stateMachine.transitionTo(CaptureState::Suppressed);
    return;
  }
  stop();
}

void SpeechCaptureController::onEngineError(CaptureError error) {
  CaptureState st = state();
  if (st == CaptureState::Idle || st == CaptureState::Error) {
    return;
  }

  switch (ClassifyCaptureError(error)) {
  case ErrorSeverity::Benign:
    ESP_LOGD(TAG, "Ignoring engine error %s", GetCaptureErrorName(error));
    break;
  case ErrorSeverity::Transient:
    ESP_LOGW(TAG, "Transient engine error %s", GetCaptureErrorName(error));
    break;
  case ErrorSeverity::Recoverable:
    if (m_cfg.retry.hard_reset_on_fault) {
      fail(error);
    } else {
      ESP_LOGW(TAG, "Engine error %s", GetCaptureErrorName(error));
    }
    break;
  case ErrorSeverity::Fatal:
  default:
    fail(error);
    break;
  }
}

void SpeechCaptureController::fail(CaptureError reason) {
  if (state() == CaptureState::Error) {
    return;
  }
  ESP_LOGE(TAG, "Capture error: %s", GetCaptureErrorName(reason));

  ++m_requestGeneration;
  m_permissionPending = false;
  if (reason == CaptureError::PermissionDenied) {
    m_session.permission = PermissionState::Denied;
  }

  teardown();
  m_lastError = reason;
  m_stateMachine.transitionTo(CaptureState::Error);

  if (m_onCaptureError) {
    m_onCaptureError(reason);
  }
}

void SpeechCaptureController::teardown() {
  m_restartTimer.cancel();
  m_sessionActive = false;
  m_monitor.stop();
  m_aggregator.flush();
  releaseEngine();
  closeStream();
}

void SpeechCaptureController::releaseEngine() {
  if (!m_engine) {
    return;
  }
  std::unique_ptr<SpeechEngine> engine = std::move(m_engine);
  esp_err_t err = engine->stop();
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "Engine stop failed: %s", esp_err_to_name(err));
  }
  ESP_LOGI(TAG, "Speech engine released");
}

void SpeechCaptureController::closeStream() {
  if (m_stream && m_ownsStream) {
    m_stream->close();
    m_stream.reset();
    m_ownsStream = false;
  }
}

RestartInputs SpeechCaptureController::readInputs() const {
  if (m_inputsProvider) {
    return m_inputsProvider();
  }
  return RestartInputs{.desired_listening = true, .system_speaking = false};
}
