#include "fake_media_capture.h"
#include "fake_scheduler.h"
#include "fake_speech_engine.h"
#include "speech_capture_controller.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

class SpeechCaptureControllerTest : public ::testing::Test {
protected:
  void build(PlatformProfile profile,
             TranscriptConfig transcript = TranscriptConfig{}) {
    SpeechCaptureConfig cfg;
    cfg.retry = RetryPolicy::forProfile(profile);
    cfg.transcript = transcript;
    controller = std::make_unique<SpeechCaptureController>(
        scheduler, media, FakeSpeechEngine::factory(stats), cfg);
    wire();
  }

  void wire() {
    controller->setOnTranscript([this](const std::string &text, bool isFinal) {
      transcripts.emplace_back(text, isFinal);
    });
    controller->setOnAudioLevel([this](float level) { levels.push_back(level); });
    controller->setOnCaptureError(
        [this](CaptureError reason) { errors.push_back(reason); });
    stateSub = controller->addStateChangeListener(
        [this](CaptureState state) { states.push_back(state); });
  }

  void startListening() {
    controller->start();
    ASSERT_EQ(controller->state(), CaptureState::Requesting);
    media.grant();
    ASSERT_EQ(controller->state(), CaptureState::Listening);
  }

  FakeSpeechEngine *engine() const { return stats->current; }

  FakeScheduler scheduler;
  FakeMediaCapture media;
  std::shared_ptr<FakeSpeechEngine::Stats> stats =
      std::make_shared<FakeSpeechEngine::Stats>();
  std::unique_ptr<SpeechCaptureController> controller;

  std::vector<std::pair<std::string, bool>> transcripts;
  std::vector<float> levels;
  std::vector<CaptureError> errors;
  std::vector<CaptureState> states;
  Subscription stateSub;
};

} // namespace

TEST_F(SpeechCaptureControllerTest, GrantStartsSingleEngine) {
  build(PlatformProfile::Mobile);
  startListening();

  EXPECT_EQ(media.lastConstraints.sample_rate_hz, 16000u);
  EXPECT_TRUE(media.lastConstraints.noise_suppression);
  EXPECT_EQ(stats->created, 1);
  EXPECT_EQ(stats->starts, 1);
  EXPECT_EQ(controller->session().permission, PermissionState::Granted);
  EXPECT_EQ(states, (std::vector<CaptureState>{CaptureState::Requesting,
                                               CaptureState::Listening}));
}

TEST_F(SpeechCaptureControllerTest, DesktopRequestsHigherSampleRate) {
  build(PlatformProfile::Desktop);
  controller->start();
  EXPECT_EQ(media.lastConstraints.sample_rate_hz, 44100u);
  EXPECT_EQ(media.lastConstraints.channel_count, 1);
}

TEST_F(SpeechCaptureControllerTest, PermissionDeniedIsFatalWithoutEngine) {
  build(PlatformProfile::Desktop);
  controller->start();
  media.deny(CaptureError::PermissionDenied);

  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(controller->lastError(), CaptureError::PermissionDenied);
  EXPECT_EQ(controller->session().permission, PermissionState::Denied);
  EXPECT_EQ(stats->created, 0);
  EXPECT_EQ(errors, std::vector<CaptureError>{CaptureError::PermissionDenied});
}

TEST_F(SpeechCaptureControllerTest, MissingDeviceIsFatal) {
  build(PlatformProfile::Desktop);
  controller->start();
  media.deny(CaptureError::DeviceNotFound);
  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(controller->lastError(), CaptureError::DeviceNotFound);
  EXPECT_EQ(stats->created, 0);
}

TEST_F(SpeechCaptureControllerTest, MobileSixEndsExhaustRetries) {
  build(PlatformProfile::Mobile);
  startListening();

  for (uint32_t i = 1; i <= 5; ++i) {
    engine()->emitEnd();
    EXPECT_EQ(controller->session().retry_count, i);
    EXPECT_EQ(controller->state(), CaptureState::Listening);
    scheduler.advance(299);
    EXPECT_EQ(stats->starts, (int)i);
    scheduler.advance(1);
    EXPECT_EQ(stats->starts, (int)i + 1);
  }

  engine()->emitEnd();
  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(controller->lastError(), CaptureError::RetriesExhausted);
  EXPECT_FALSE(controller->hasEngine());
  EXPECT_EQ(stats->alive, 0);
  EXPECT_EQ(stats->created, 1);
  EXPECT_EQ(errors, std::vector<CaptureError>{CaptureError::RetriesExhausted});
}

TEST_F(SpeechCaptureControllerTest, DesktopAllowsThreeRestarts) {
  build(PlatformProfile::Desktop);
  startListening();

  for (int i = 0; i < 3; ++i) {
    engine()->emitEnd();
    scheduler.advance(100);
  }
  EXPECT_EQ(stats->starts, 4);
  EXPECT_EQ(controller->state(), CaptureState::Listening);

  engine()->emitEnd();
  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(controller->lastError(), CaptureError::RetriesExhausted);
}

TEST_F(SpeechCaptureControllerTest, ResultResetsRetryCount) {
  build(PlatformProfile::Desktop);
  startListening();

  engine()->emitEnd();
  scheduler.advance(100);
  engine()->emitEnd();
  scheduler.advance(100);
  EXPECT_EQ(controller->session().retry_count, 2u);

  engine()->emitResult("hello", true);
  EXPECT_EQ(controller->session().retry_count, 0u);
  ASSERT_FALSE(transcripts.empty());
  EXPECT_EQ(transcripts.back(), std::make_pair(std::string("hello"), true));
}

TEST_F(SpeechCaptureControllerTest, BlankResultDoesNotResetRetryCount) {
  build(PlatformProfile::Desktop);
  startListening();
  engine()->emitEnd();
  scheduler.advance(100);
  engine()->emitResult("  ", true);
  EXPECT_EQ(controller->session().retry_count, 1u);
  EXPECT_TRUE(transcripts.empty());
}

TEST_F(SpeechCaptureControllerTest, StopStartNeverYieldsTwoEngines) {
  build(PlatformProfile::Mobile);
  startListening();
  auto firstStream = media.lastStream;

  controller->stop();
  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_EQ(stats->alive, 0);
  EXPECT_EQ(firstStream->closeCount, 1);

  startListening();
  controller->start();
  EXPECT_EQ(stats->alive, 1);
  EXPECT_EQ(stats->max_alive, 1);
  EXPECT_EQ(media.requestCount, 2);
}

TEST_F(SpeechCaptureControllerTest, StopIsIdempotentAndClearsTimers) {
  build(PlatformProfile::Desktop);
  startListening();
  engine()->emitEnd();
  controller->stop();
  controller->stop();

  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_EQ(scheduler.pendingCount(), 0u);
  scheduler.advance(1000);
  EXPECT_EQ(stats->starts, 1);
}

TEST_F(SpeechCaptureControllerTest, PermissionAnswerAfterStopIsDiscarded) {
  build(PlatformProfile::Desktop);
  controller->start();
  controller->stop();
  auto stream = media.grant();

  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_EQ(stats->created, 0);
  EXPECT_EQ(stream->closeCount, 1);
}

TEST_F(SpeechCaptureControllerTest, StalePermissionGenerationIsIgnored) {
  build(PlatformProfile::Desktop);
  controller->start();
  controller->stop();
  controller->start();
  ASSERT_EQ(media.pendingCount(), 2u);

  auto stale = media.grant();
  EXPECT_EQ(controller->state(), CaptureState::Requesting);
  EXPECT_EQ(stale->closeCount, 1);

  media.grant();
  EXPECT_EQ(controller->state(), CaptureState::Listening);
  EXPECT_EQ(stats->alive, 1);
}

TEST_F(SpeechCaptureControllerTest, InvalidStateOnRestartIsBenign) {
  build(PlatformProfile::Mobile);
  startListening();

  engine()->emitEnd();
  stats->next_start_result = ESP_ERR_INVALID_STATE;
  scheduler.advance(300);

  EXPECT_EQ(controller->state(), CaptureState::Listening);
  EXPECT_TRUE(controller->hasEngine());
  EXPECT_TRUE(errors.empty());
}

TEST_F(SpeechCaptureControllerTest, MobileStartFaultHardResets) {
  build(PlatformProfile::Mobile);
  startListening();

  engine()->emitEnd();
  stats->next_start_result = ESP_FAIL;
  scheduler.advance(300);

  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(controller->lastError(), CaptureError::EngineInvalidState);
  EXPECT_FALSE(controller->hasEngine());
  EXPECT_EQ(stats->alive, 0);

  // 需要重新 start() 才会建新引擎
  startListening();
  EXPECT_EQ(stats->created, 2);
  EXPECT_EQ(controller->session().retry_count, 0u);
}

TEST_F(SpeechCaptureControllerTest, DesktopStartFaultCountsAsAnotherEnd) {
  build(PlatformProfile::Desktop);
  startListening();

  engine()->emitEnd();
  stats->next_start_result = ESP_FAIL;
  scheduler.advance(100);

  EXPECT_EQ(controller->state(), CaptureState::Listening);
  EXPECT_EQ(controller->session().retry_count, 2u);
  scheduler.advance(100);
  EXPECT_TRUE(engine()->running());
}

TEST_F(SpeechCaptureControllerTest, EngineErrorsFollowTaxonomy) {
  build(PlatformProfile::Desktop);
  startListening();

  engine()->emitError(CaptureError::NoSpeechTimeout);
  engine()->emitError(CaptureError::Aborted);
  engine()->emitError(CaptureError::NetworkError);
  engine()->emitError(CaptureError::EngineInvalidState);
  EXPECT_EQ(controller->state(), CaptureState::Listening);
  EXPECT_TRUE(errors.empty());

  engine()->emitError(CaptureError::DeviceNotFound);
  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(errors, std::vector<CaptureError>{CaptureError::DeviceNotFound});
}

TEST_F(SpeechCaptureControllerTest, MobileInvalidStateErrorHardResets) {
  build(PlatformProfile::Mobile);
  startListening();
  engine()->emitError(CaptureError::EngineInvalidState);
  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_FALSE(controller->hasEngine());
}

TEST_F(SpeechCaptureControllerTest, MissingEngineIsUnsupportedPlatform) {
  controller = std::make_unique<SpeechCaptureController>(
      scheduler, media,
      [](AudioStream &) -> std::unique_ptr<SpeechEngine> { return nullptr; });
  wire();
  controller->start();
  media.grant();
  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(controller->lastError(), CaptureError::UnsupportedPlatform);
  EXPECT_EQ(media.lastStream->closeCount, 1);
}

TEST_F(SpeechCaptureControllerTest, CallerSuppliedStreamIsNeverClosed) {
  build(PlatformProfile::Desktop);
  auto external = std::make_shared<FakeAudioStream>();
  controller->attachStream(external);

  controller->start();
  EXPECT_EQ(media.requestCount, 0);
  EXPECT_EQ(controller->state(), CaptureState::Listening);

  controller->stop();
  EXPECT_EQ(external->closeCount, 0);

  controller->start();
  engine()->emitError(CaptureError::DeviceNotFound);
  EXPECT_EQ(controller->state(), CaptureState::Error);
  EXPECT_EQ(external->closeCount, 0);
  EXPECT_TRUE(external->isOpen());
}

TEST_F(SpeechCaptureControllerTest, StopFlushesUndeliveredFinalText) {
  build(PlatformProfile::Desktop,
        TranscriptConfig{.silence_flush_ms = 1000, .immediate_emit = false});
  startListening();

  engine()->emitResult("good", false);
  engine()->emitResult("good morning", true);
  controller->stop();

  ASSERT_EQ(transcripts.size(), 2u);
  EXPECT_EQ(transcripts[0], std::make_pair(std::string("good"), false));
  EXPECT_EQ(transcripts[1], std::make_pair(std::string("good morning"), true));
}

TEST_F(SpeechCaptureControllerTest, FatalErrorFlushesOnce) {
  build(PlatformProfile::Desktop,
        TranscriptConfig{.silence_flush_ms = 1000, .immediate_emit = false});
  startListening();
  engine()->emitResult("partial sentence", true);
  engine()->emitError(CaptureError::DeviceNotFound);
  scheduler.advance(2000);

  ASSERT_EQ(transcripts.size(), 1u);
  EXPECT_EQ(transcripts[0].first, "partial sentence");
  EXPECT_EQ(errors.size(), 1u);
}

TEST_F(SpeechCaptureControllerTest, SuppressKeepsEngineAndZeroesLevel) {
  build(PlatformProfile::Desktop);
  startListening();
  media.lastStream->setLevel(25);
  scheduler.advance(50);
  ASSERT_FALSE(levels.empty());
  EXPECT_FLOAT_EQ(levels.back(), 0.5f);

  controller->suppress();
  EXPECT_EQ(controller->state(), CaptureState::Suppressed);
  EXPECT_FLOAT_EQ(levels.back(), 0.0f);
  EXPECT_TRUE(controller->hasEngine());
  EXPECT_FALSE(engine()->running());

  // 暂停期间迟到的结束事件被忽略
  engine()->emitEnd();
  EXPECT_EQ(controller->state(), CaptureState::Suppressed);
  EXPECT_EQ(controller->session().retry_count, 0u);

  controller->resume();
  EXPECT_EQ(controller->state(), CaptureState::Listening);
  EXPECT_TRUE(engine()->running());
  EXPECT_EQ(stats->created, 1);
}

TEST_F(SpeechCaptureControllerTest, EndWhileSpeakingSuppresses) {
  build(PlatformProfile::Desktop);
  bool speaking = false;
  controller->setRestartInputsProvider([&speaking]() {
    return RestartInputs{.desired_listening = true, .system_speaking = speaking};
  });
  startListening();

  speaking = true;
  engine()->emitEnd();
  EXPECT_EQ(controller->state(), CaptureState::Suppressed);
  EXPECT_EQ(controller->session().retry_count, 0u);
}

TEST_F(SpeechCaptureControllerTest, RestartRechecksInputsWhenTimerFires) {
  build(PlatformProfile::Desktop);
  bool desired = true;
  controller->setRestartInputsProvider([&desired]() {
    return RestartInputs{.desired_listening = desired, .system_speaking = false};
  });
  startListening();

  engine()->emitEnd();
  desired = false;
  scheduler.advance(100);

  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_EQ(stats->starts, 1);
  EXPECT_EQ(stats->alive, 0);
}

TEST_F(SpeechCaptureControllerTest, StopFromListeningListenerLeavesNothingRunning) {
  build(PlatformProfile::Mobile);
  Subscription stopper = controller->addStateChangeListener([this](CaptureState s) {
    if (s == CaptureState::Listening) {
      controller->stop();
    }
  });

  controller->start();
  auto stream = media.grant();

  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_EQ(stats->alive, 0);
  EXPECT_EQ(stream->closeCount, 1);
  EXPECT_TRUE(errors.empty());

  levels.clear();
  stream->setLevel(80);
  scheduler.advance(200);
  EXPECT_TRUE(levels.empty());
  EXPECT_EQ(scheduler.pendingCount(), 0u);
}

TEST_F(SpeechCaptureControllerTest, StopFromRequestingListenerSkipsAttachedStream) {
  build(PlatformProfile::Desktop);
  auto external = std::make_shared<FakeAudioStream>();
  external->setLevel(80);
  controller->attachStream(external);
  Subscription stopper = controller->addStateChangeListener([this](CaptureState s) {
    if (s == CaptureState::Requesting) {
      controller->stop();
    }
  });

  controller->start();

  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_EQ(stats->created, 0);
  EXPECT_EQ(external->analysersCreated, 0);
  scheduler.advance(200);
  EXPECT_TRUE(levels.empty());
}
