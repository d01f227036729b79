#ifndef _RETRY_POLICY_H_
#define _RETRY_POLICY_H_

#include <cstdint>

#include "capture_state.h"

/**
 * @brief 自动重启输入
 *
 * 每次判断时实时读取，不缓存
 */
struct RestartInputs {
    bool desired_listening = false;
    bool system_speaking = false;
};

/**
 * @brief 识别引擎自动重启策略
 *
 * 平台差异只体现在这里。Mobile 引擎经常自发结束，重试更多、间隔更长，
 * 启动失败时硬复位。
 */
struct RetryPolicy {
    uint32_t max_retries = 3;
    uint32_t delay_ms = 100;
    PlatformProfile profile = PlatformProfile::Desktop;
    bool hard_reset_on_fault = false;

    static RetryPolicy forProfile(PlatformProfile profile);
};

/**
 * @brief 最大重试次数（mobile=5, desktop=3）
 */
uint32_t MaxRetries(PlatformProfile profile);

/**
 * @brief 重启间隔（mobile=300ms, desktop=100ms）
 */
uint32_t NextDelayMs(PlatformProfile profile);

/**
 * @brief 引擎结束后是否应自动重启
 *
 * 条件：希望监听 && 系统未在播报 && 已授权 && 重试次数未用尽
 */
bool ShouldRestart(const CaptureSession &session, const RestartInputs &inputs,
                   const RetryPolicy &policy);

/**
 * @brief 重试次数是否已用尽
 */
inline bool RetriesExhausted(const CaptureSession &session, const RetryPolicy &policy) {
    return session.retry_count >= policy.max_retries;
}

#endif // _RETRY_POLICY_H_
