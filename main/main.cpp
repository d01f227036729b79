#include "cloud_session.h"
#include "cloud_speech_engine.h"
#include "emotion_fusion_engine.h"
#include "emotion_source_adapter.h"
#include "esp_log.h"
#include "esp_timer_scheduler.h"
#include "event_loop.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "i2s_media_capture.h"
#include "nvs_flash.h"
#include "sdkconfig.h"
#include "speaking_arbiter.h"
#include "speech_capture_controller.h"
#include "wifi_link.h"
#include <memory>
#include <string.h>

static const char *TAG = "main";

// 采集核心，只在事件循环任务中访问
static std::unique_ptr<SpeechCaptureController> controller;
static std::unique_ptr<SpeakingArbiter> arbiter;
static std::unique_ptr<EmotionSourceAdapter> voiceEmotion;
static std::unique_ptr<EmotionSourceAdapter> faceEmotion;
static std::unique_ptr<EmotionFusionEngine> fusion;
static Subscription stateSub;

static PlatformProfile configuredProfile() {
#ifdef CONFIG_SENSE_PROFILE_MOBILE
  return PlatformProfile::Mobile;
#else
  return PlatformProfile::Desktop;
#endif
}

static bool configuredAutoListen() {
#ifdef CONFIG_SENSE_AUTO_LISTEN
  return true;
#else
  return false;
#endif
}

static void buildCore() {
  auto &scheduler = EspTimerScheduler::instance();
  const PlatformProfile profile = configuredProfile();

  controller = std::make_unique<SpeechCaptureController>(
      scheduler, I2sMediaCapture::instance(),
      CloudSpeechEngine::factory(CloudSession::instance()),
      SpeechCaptureConfig{
          .retry = RetryPolicy::forProfile(profile),
          .transcript = {.silence_flush_ms = CONFIG_SENSE_SILENCE_FLUSH_MS,
                         .immediate_emit = true},
          .audio_level = {},
      });

  controller->setOnTranscript([](const std::string &text, bool isFinal) {
    if (isFinal) {
      ESP_LOGI(TAG, "Transcript: %s", text.c_str());
    } else {
      ESP_LOGD(TAG, "Interim: %s", text.c_str());
    }
  });
  controller->setOnAudioLevel(
      [](float level) { ESP_LOGV(TAG, "Audio level %.2f", (double)level); });
  controller->setOnCaptureError([](CaptureError reason) {
    ESP_LOGE(TAG, "Voice capture stopped: %s", GetCaptureErrorName(reason));
  });
  stateSub = controller->addStateChangeListener([](CaptureState state) {
    ESP_LOGI(TAG, "Capture state: %s", GetCaptureStateName(state));
  });

  arbiter = std::make_unique<SpeakingArbiter>(
      *controller, SpeakingArbiterConfig{.auto_listen = configuredAutoListen()});

  voiceEmotion =
      std::make_unique<EmotionSourceAdapter>(EmotionSource::Voice, scheduler);
  faceEmotion =
      std::make_unique<EmotionSourceAdapter>(EmotionSource::Face, scheduler);

  EmotionFusionConfig fusionCfg;
  fusionCfg.weights.face = CONFIG_SENSE_FUSION_FACE_WEIGHT_PCT / 100.0f;
  fusionCfg.weights.voice = CONFIG_SENSE_FUSION_VOICE_WEIGHT_PCT / 100.0f;
  fusion = std::make_unique<EmotionFusionEngine>(scheduler, fusionCfg);
  fusion->attach(*voiceEmotion, *faceEmotion);
  fusion->setOnEmotionUpdate([](const std::vector<EmotionReading> &readings) {
    if (!readings.empty()) {
      ESP_LOGI(TAG, "Emotion: %s %.2f", readings.front().name.c_str(),
               (double)readings.front().score);
    }
  });

  ESP_LOGI(TAG, "Core ready (profile=%s, auto_listen=%d)",
           GetPlatformProfileName(profile), configuredAutoListen() ? 1 : 0);
}

static void wireCloud(CloudSession &cloud) {
  cloud.setOnTtsState([](bool speaking) {
    if (arbiter) {
      arbiter->setSystemSpeaking(speaking);
    }
  });

  cloud.setOnExpression(
      [](const std::string &source, const CloudSession::ExpressionScores &scores) {
        EmotionSourceAdapter *adapter = nullptr;
        if (source == "voice") {
          adapter = voiceEmotion.get();
        } else if (source == "face") {
          adapter = faceEmotion.get();
        }
        if (adapter == nullptr) {
          ESP_LOGW(TAG, "Unknown expression source: %s", source.c_str());
          return;
        }
        adapter->publish(scores);
      });

  cloud.setOnConnection([](bool connected) {
    if (!connected || !controller || !arbiter) {
      return;
    }
    // 会话 Ready 后才能识别，开机和断网重连都从这里开始监听
    arbiter->onBackendAvailable();
  });
}

static void logInsight() {
  if (!fusion || fusion->history().empty()) {
    return;
  }
  EmotionProfile profile = fusion->profile();
  ESP_LOGI(TAG, "%s (stability=%.2f expressiveness=%.2f reactivity=%.2f)",
           fusion->insight().c_str(), (double)profile.stability,
           (double)profile.expressiveness, (double)profile.reactivity);
}

extern "C" void app_main(void) {
  ESP_LOGI(TAG, "========================================");
  ESP_LOGI(TAG, "    语音采集 + 情绪融合");
  ESP_LOGI(TAG, "========================================");

  ESP_ERROR_CHECK(EventLoop::instance().init({
      .queue_len = 32,
      .stack = 8192,
      .prio = 5,
      .core = 1,
  }));

  // NVS（WiFi 驱动需要）
  esp_err_t ret = nvs_flash_init();
  if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_ERROR_CHECK(nvs_flash_erase());
    ret = nvs_flash_init();
  }
  ESP_ERROR_CHECK(ret);

  // WiFi
  auto &wifi = WifiLink::instance();
  wifi.setOnLinkChange([](bool up) {
    if (up) {
      ESP_LOGI(TAG, "Network up: %s", WifiLink::instance().ipAddress().c_str());
    } else {
      ESP_LOGW(TAG, "Network down, capture resumes after cloud reconnects");
    }
  });
  ret = wifi.start({
      .ssid = CONFIG_SENSE_WIFI_SSID,
      .password = CONFIG_SENSE_WIFI_PASSWORD,
      .first_connect_attempts = 5,
  });
  if (ret == ESP_OK) {
    ret = wifi.waitUntilUp(30000);
  }
  if (ret != ESP_OK) {
    ESP_LOGW(TAG, "WiFi not connected: %s", esp_err_to_name(ret));
  }

  // 麦克风
  I2sMediaCapture::instance().configure({
      .port = 0,
      .bck_io = CONFIG_SENSE_MIC_BCK_IO,
      .ws_io = CONFIG_SENSE_MIC_WS_IO,
      .din_io = CONFIG_SENSE_MIC_DIN_IO,
  });

  // 云端
  auto &cloud = CloudSession::instance();
  const bool cloudEnabled = strlen(CONFIG_SENSE_CLOUD_WS_URL) > 0;
  if (cloudEnabled) {
    ret = cloud.init({
        .url = CONFIG_SENSE_CLOUD_WS_URL,
        .device_id = CONFIG_SENSE_DEVICE_ID,
        .reconnect_timeout_ms = 10000,
        .buffer_size = 4096,
        .sample_rate = (int)I2sMediaCapture::kSampleRate,
    });
    if (ret != ESP_OK) {
      ESP_LOGE(TAG, "Cloud session init failed: %s", esp_err_to_name(ret));
    }
  } else {
    ESP_LOGW(TAG, "Cloud URL empty, recognition disabled (set it in menuconfig)");
  }

  // 核心对象在事件循环任务中创建和使用，连上云端后才开始监听
  ret = EventLoop::instance().post([&cloud]() {
    buildCore();
    wireCloud(cloud);
  });
  ESP_ERROR_CHECK(ret);

  if (cloudEnabled) {
    ret = cloud.connect();
    if (ret != ESP_OK) {
      ESP_LOGE(TAG, "Cloud connect failed: %s", esp_err_to_name(ret));
    }
  }

  ESP_LOGI(TAG, "========================================");
  ESP_LOGI(TAG, "  系统已就绪!");
  ESP_LOGI(TAG, "  平台配置: %s", GetPlatformProfileName(configuredProfile()));
  ESP_LOGI(TAG, "  静默刷新: %d ms", CONFIG_SENSE_SILENCE_FLUSH_MS);
  ESP_LOGI(TAG, "========================================");

  while (1) {
    vTaskDelay(pdMS_TO_TICKS(10000));
    ret = EventLoop::instance().post(logInsight);
    if (ret != ESP_OK) {
      ESP_LOGW(TAG, "Event loop busy: %s", esp_err_to_name(ret));
    }
  }
}
