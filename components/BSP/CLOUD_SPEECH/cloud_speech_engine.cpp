#include "cloud_speech_engine.h"
#include "esp_log.h"

static const char* TAG = "CloudSpeech";

CloudSpeechEngine::CloudSpeechEngine(CloudSession& session, AudioStream& stream)
    : session_(session), stream_(stream) {}

CloudSpeechEngine::~CloudSpeechEngine() {
    esp_err_t err = stop();
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Stop on destroy failed: %s", esp_err_to_name(err));
    }
}

SpeechEngineFactory CloudSpeechEngine::factory(CloudSession& session) {
    return [&session](AudioStream& stream) -> std::unique_ptr<SpeechEngine> {
        return std::make_unique<CloudSpeechEngine>(session, stream);
    };
}

esp_err_t CloudSpeechEngine::start() {
    if (running_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (!stream_.isOpen()) {
        ESP_LOGE(TAG, "Audio stream closed");
        return ESP_FAIL;
    }
    if (!session_.isReady()) {
        ESP_LOGW(TAG, "Cloud session not ready");
        return ESP_FAIL;
    }

    stt_sub_ = session_.addSttListener(
        [this](const std::string& text, bool is_final) { onStt(text, is_final); });
    error_sub_ = session_.addErrorListener([this](CaptureError error) { onError(error); });

    esp_err_t err = session_.startListening();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "listen start failed: %s", esp_err_to_name(err));
        stt_sub_.reset();
        error_sub_.reset();
        // 会话层的 INVALID_STATE 不是引擎本身已在运行
        return err == ESP_ERR_INVALID_STATE ? ESP_FAIL : err;
    }

    // 帧回调在采集任务中执行，只引用会话单例
    CloudSession& session = session_;
    frame_sub_ = stream_.addFrameListener([&session](const int16_t* samples, size_t count) {
        esp_err_t send_err = session.sendAudio(reinterpret_cast<const uint8_t*>(samples),
                                               count * sizeof(int16_t));
        if (send_err != ESP_OK && send_err != ESP_ERR_INVALID_STATE) {
            ESP_LOGW(TAG, "Audio upload failed: %s", esp_err_to_name(send_err));
        }
    });

    running_ = true;
    ESP_LOGI(TAG, "Recognition started");
    return ESP_OK;
}

esp_err_t CloudSpeechEngine::stop() {
    if (!running_) {
        return ESP_OK;
    }
    running_ = false;
    frame_sub_.reset();
    stt_sub_.reset();
    error_sub_.reset();

    esp_err_t err = session_.stopListening();
    ESP_LOGI(TAG, "Recognition stopped");
    return err;
}

void CloudSpeechEngine::onStt(const std::string& text, bool is_final) {
    if (!running_) {
        return;
    }

    std::weak_ptr<int> alive = alive_;
    auto on_result = callbacks_.on_result;
    if (on_result) {
        on_result(text, is_final);
    }
    if (alive.expired() || !running_) {
        return;
    }

    // 一句话识别完成，本次会话结束
    if (is_final) {
        finish();
    }
}

void CloudSpeechEngine::onError(CaptureError error) {
    if (!running_) {
        return;
    }

    std::weak_ptr<int> alive = alive_;
    auto on_error = callbacks_.on_error;
    if (on_error) {
        on_error(error);
    }
    if (alive.expired() || !running_) {
        return;
    }
    finish();
}

void CloudSpeechEngine::finish() {
    esp_err_t err = stop();
    if (err != ESP_OK) {
        ESP_LOGD(TAG, "listen stop: %s", esp_err_to_name(err));
    }

    // on_end 里控制器可能销毁本对象，之后不能再访问成员
    auto on_end = callbacks_.on_end;
    if (on_end) {
        on_end();
    }
}
