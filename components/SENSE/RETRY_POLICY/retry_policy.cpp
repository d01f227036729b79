#include "retry_policy.h"

namespace {
constexpr uint32_t kMobileMaxRetries = 5;
constexpr uint32_t kDesktopMaxRetries = 3;
constexpr uint32_t kMobileDelayMs = 300;
constexpr uint32_t kDesktopDelayMs = 100;
}

uint32_t MaxRetries(PlatformProfile profile) {
    return profile == PlatformProfile::Mobile ? kMobileMaxRetries : kDesktopMaxRetries;
}

uint32_t NextDelayMs(PlatformProfile profile) {
    return profile == PlatformProfile::Mobile ? kMobileDelayMs : kDesktopDelayMs;
}

RetryPolicy RetryPolicy::forProfile(PlatformProfile profile) {
    return RetryPolicy{
        .max_retries = MaxRetries(profile),
        .delay_ms = NextDelayMs(profile),
        .profile = profile,
        .hard_reset_on_fault = profile == PlatformProfile::Mobile,
    };
}

bool ShouldRestart(const CaptureSession &session, const RestartInputs &inputs,
                   const RetryPolicy &policy) {
    if (!inputs.desired_listening || inputs.system_speaking) {
        return false;
    }
    if (session.permission != PermissionState::Granted) {
        return false;
    }
    return !RetriesExhausted(session, policy);
}
