#include "speaking_arbiter.h"
#include "esp_log.h"

static const char* TAG = "SpeakingArbiter";

SpeakingArbiter::SpeakingArbiter(SpeechCaptureController& controller,
                                 const SpeakingArbiterConfig& config)
    : controller_(controller), config_(config) {
    controller_.setRestartInputsProvider([this]() { return currentInputs(); });
    state_sub_ = controller_.addStateChangeListener([this](CaptureState) { reconcile(); });
    ESP_LOGI(TAG, "Init: auto_listen=%d", config_.auto_listen ? 1 : 0);
}

SpeakingArbiter::~SpeakingArbiter() {
    state_sub_.reset();
    controller_.setRestartInputsProvider(nullptr);
}

RestartInputs SpeakingArbiter::currentInputs() const {
    return RestartInputs{
        .desired_listening = desiredListening(),
        .system_speaking = system_speaking_,
    };
}

void SpeakingArbiter::setSystemSpeaking(bool speaking) {
    if (system_speaking_ == speaking) {
        return;
    }
    ESP_LOGI(TAG, "System speaking: %s", speaking ? "yes" : "no");
    system_speaking_ = speaking;
    reconcile();
}

void SpeakingArbiter::setDesiredListening(bool desired) {
    if (desired_.has_value() && *desired_ == desired) {
        return;
    }
    ESP_LOGI(TAG, "Desired listening: %s", desired ? "on" : "off");
    desired_ = desired;
    reconcile();
}

void SpeakingArbiter::clearDesiredListening() {
    if (!desired_.has_value()) {
        return;
    }
    ESP_LOGI(TAG, "Desired listening cleared (auto_listen=%d)", config_.auto_listen ? 1 : 0);
    desired_.reset();
    reconcile();
}

void SpeakingArbiter::reconcile() {
    if (reconciling_) {
        rerun_ = true;
        return;
    }

    reconciling_ = true;
    int passes = 0;
    do {
        rerun_ = false;
        reconcileOnce();
    } while (rerun_ && ++passes < kMaxPasses);
    reconciling_ = false;
}

void SpeakingArbiter::onBackendAvailable() {
    if (controller_.state() == CaptureState::Error) {
        CaptureError last = controller_.lastError();
        if (last == CaptureError::RetriesExhausted ||
            last == CaptureError::EngineInvalidState) {
            ESP_LOGI(TAG, "Backend available, clearing %s", GetCaptureErrorName(last));
            controller_.stop();
        }
    }
    reconcile();
}

void SpeakingArbiter::reconcileOnce() {
    CaptureState state = controller_.state();
    bool desired = desiredListening();

    if (!desired) {
        if (state == CaptureState::Listening ||
            state == CaptureState::Requesting ||
            state == CaptureState::Suppressed) {
            controller_.stop();
        }
        return;
    }

    if (system_speaking_) {
        // 播报优先，不管是否希望监听
        if (state == CaptureState::Listening || state == CaptureState::Requesting) {
            controller_.suppress();
        }
        return;
    }

    switch (state) {
        case CaptureState::Suppressed:
            controller_.resume();
            break;
        case CaptureState::Idle:
            if (controller_.session().permission != PermissionState::Denied) {
                controller_.start();
            }
            break;
        default:
            // Error 不自动重启
            break;
    }
}
