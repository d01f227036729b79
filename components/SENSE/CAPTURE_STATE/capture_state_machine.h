#ifndef _CAPTURE_STATE_MACHINE_H_
#define _CAPTURE_STATE_MACHINE_H_

#include <functional>

#include "capture_state.h"
#include "subscription.h"

/**
 * @brief 采集状态机
 *
 * 管理采集状态转换，支持状态变化回调通知。只在调度器的执行上下文中使用。
 *
 * @example
 *   CaptureStateMachine sm;
 *   Subscription sub = sm.addStateChangeListener(
 *       [](CaptureState old, CaptureState new_state) {
 *           ESP_LOGI("SM", "State: %s -> %s",
 *                    GetCaptureStateName(old), GetCaptureStateName(new_state));
 *       });
 *   sm.transitionTo(CaptureState::Requesting);
 */
class CaptureStateMachine {
public:
    CaptureStateMachine() = default;

    CaptureStateMachine(const CaptureStateMachine&) = delete;
    CaptureStateMachine& operator=(const CaptureStateMachine&) = delete;

    /**
     * @brief 获取当前状态
     */
    CaptureState getState() const { return current_state_; }

    /**
     * @brief 尝试转换到新状态
     * @param new_state 目标状态
     * @return true 转换成功（或已在目标状态）, false 转换无效
     */
    bool transitionTo(CaptureState new_state);

    /**
     * @brief 检查是否可以转换到目标状态
     */
    bool canTransitionTo(CaptureState target) const;

    /**
     * @brief 状态变化回调类型
     * 参数: (旧状态, 新状态)
     */
    using StateCallback = std::function<void(CaptureState, CaptureState)>;

    /**
     * @brief 添加状态变化监听器
     * @return 订阅句柄，销毁即移除
     */
    Subscription addStateChangeListener(StateCallback callback);

    /**
     * @brief 重置状态机到 Idle（会通知监听器）
     */
    void reset();

    static bool isValidTransition(CaptureState from, CaptureState to);

private:
    CaptureState current_state_ = CaptureState::Idle;
    ListenerList<CaptureState, CaptureState> listeners_;
};

#endif // _CAPTURE_STATE_MACHINE_H_
