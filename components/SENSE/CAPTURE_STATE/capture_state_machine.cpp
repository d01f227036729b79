#include "capture_state_machine.h"
#include "esp_log.h"

static const char* TAG = "CaptureState";

bool CaptureStateMachine::transitionTo(CaptureState new_state) {
    CaptureState old_state = current_state_;

    if (old_state == new_state) {
        return true; // 已经在目标状态
    }

    if (!isValidTransition(old_state, new_state)) {
        ESP_LOGW(TAG, "Invalid transition: %s -> %s",
                 GetCaptureStateName(old_state), GetCaptureStateName(new_state));
        return false;
    }

    ESP_LOGI(TAG, "State transition: %s -> %s",
             GetCaptureStateName(old_state), GetCaptureStateName(new_state));

    current_state_ = new_state;
    listeners_.notify(old_state, new_state);
    return true;
}

bool CaptureStateMachine::canTransitionTo(CaptureState target) const {
    return isValidTransition(current_state_, target);
}

bool CaptureStateMachine::isValidTransition(CaptureState from, CaptureState to) {
    // 任何状态都可以进入 Error（致命错误）
    if (to == CaptureState::Error) {
        return from != CaptureState::Error;
    }

    switch (from) {
        case CaptureState::Idle:
            return to == CaptureState::Requesting;

        case CaptureState::Requesting:
            // 权限申请期间也可能被播报打断
            return to == CaptureState::Listening ||
                   to == CaptureState::Suppressed ||
                   to == CaptureState::Idle;

        case CaptureState::Listening:
            return to == CaptureState::Suppressed ||
                   to == CaptureState::Idle;

        case CaptureState::Suppressed:
            return to == CaptureState::Listening ||
                   to == CaptureState::Requesting ||
                   to == CaptureState::Idle;

        case CaptureState::Error:
            // 错误状态只能通过 start() 或 stop() 离开
            return to == CaptureState::Requesting ||
                   to == CaptureState::Idle;

        default:
            return false;
    }
}

Subscription CaptureStateMachine::addStateChangeListener(StateCallback callback) {
    ESP_LOGD(TAG, "Added state change listener (%u total)",
             (unsigned)(listeners_.size() + 1));
    return listeners_.add(std::move(callback));
}

void CaptureStateMachine::reset() {
    CaptureState old_state = current_state_;
    current_state_ = CaptureState::Idle;

    if (old_state != CaptureState::Idle) {
        listeners_.notify(old_state, CaptureState::Idle);
    }
    ESP_LOGI(TAG, "State machine reset");
}
