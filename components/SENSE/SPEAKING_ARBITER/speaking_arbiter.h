#ifndef _SPEAKING_ARBITER_H_
#define _SPEAKING_ARBITER_H_

#include <optional>

#include "retry_policy.h"
#include "speech_capture_controller.h"
#include "subscription.h"

struct SpeakingArbiterConfig {
    /// 没有显式设置 desired listening 时是否自动监听
    bool auto_listen = true;
};

/**
 * @brief 播报/监听互斥
 *
 * 系统播报（TTS）期间暂停识别，播报结束后按 desired listening 恢复。
 * 每次输入变化或采集状态变化都会重新协调；协调过程中触发的变化会
 * 再跑一轮，不会递归。
 *
 * @example
 *   SpeakingArbiter arbiter(controller, {.auto_listen = true});
 *   arbiter.reconcile();                 // 自动开始监听
 *   arbiter.setSystemSpeaking(true);     // TTS 开始 -> Suppressed
 *   arbiter.setSystemSpeaking(false);    // TTS 结束 -> Listening
 */
class SpeakingArbiter {
public:
    explicit SpeakingArbiter(SpeechCaptureController& controller,
                             const SpeakingArbiterConfig& config = SpeakingArbiterConfig{});
    ~SpeakingArbiter();

    SpeakingArbiter(const SpeakingArbiter&) = delete;
    SpeakingArbiter& operator=(const SpeakingArbiter&) = delete;

    void setSystemSpeaking(bool speaking);

    /**
     * @brief 显式设置是否希望监听，覆盖 auto_listen
     */
    void setDesiredListening(bool desired);

    /**
     * @brief 取消显式设置，回到 auto_listen
     */
    void clearDesiredListening();

    bool systemSpeaking() const { return system_speaking_; }
    bool desiredListening() const { return desired_.value_or(config_.auto_listen); }
    RestartInputs currentInputs() const;

    /**
     * @brief 按当前输入协调控制器状态
     */
    void reconcile();

    /**
     * @brief 识别后端重新可用
     *
     * 因后端不可用进入的 Error（重试用尽、引擎启动失败）先回到 Idle，
     * 再协调。权限、设备类错误保持不变。
     */
    void onBackendAvailable();

private:
    void reconcileOnce();

    static constexpr int kMaxPasses = 4;

    SpeechCaptureController& controller_;
    SpeakingArbiterConfig config_;

    bool system_speaking_ = false;
    std::optional<bool> desired_;

    bool reconciling_ = false;
    bool rerun_ = false;
    Subscription state_sub_;
};

#endif // _SPEAKING_ARBITER_H_
