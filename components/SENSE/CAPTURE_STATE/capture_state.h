#ifndef _CAPTURE_STATE_H_
#define _CAPTURE_STATE_H_

#include <cstdint>

/**
 * @brief 采集状态枚举
 *
 * 定义语音采集会话的运行状态，用于状态机管理
 */
enum class CaptureState {
    Idle = 0,     ///< 空闲，无识别会话
    Requesting,   ///< 正在申请麦克风权限
    Listening,    ///< 正在识别
    Suppressed,   ///< 系统播报中，暂停识别
    Error         ///< 致命错误，需要重新 start()
};

/**
 * @brief 麦克风权限状态
 */
enum class PermissionState {
    Unknown = 0,
    Granted,
    Denied
};

/**
 * @brief 平台配置档
 *
 * Mobile 引擎更容易自发结束，重试次数更多、间隔更长
 */
enum class PlatformProfile {
    Mobile = 0,
    Desktop
};

/**
 * @brief 采集错误分类
 */
enum class CaptureError {
    None = 0,
    PermissionDenied,     ///< 致命：需要用户授权
    DeviceNotFound,       ///< 致命：没有麦克风
    NoSpeechTimeout,      ///< 良性：忽略
    Aborted,              ///< 良性：忽略
    NetworkError,         ///< 瞬时：仍按重启策略处理
    EngineInvalidState,   ///< 可恢复：移动端硬复位
    UnsupportedPlatform,  ///< 致命：上层应回退到文字输入
    RetriesExhausted      ///< 致命：重启次数用尽
};

/**
 * @brief 错误严重程度
 */
enum class ErrorSeverity {
    Benign = 0,
    Transient,
    Recoverable,
    Fatal
};

/**
 * @brief 采集会话
 *
 * 每个会话最多只有一个存活的识别引擎实例
 */
struct CaptureSession {
    CaptureState state = CaptureState::Idle;
    uint32_t retry_count = 0;
    PermissionState permission = PermissionState::Unknown;
    PlatformProfile profile = PlatformProfile::Desktop;
};

/**
 * @brief 获取状态名称字符串
 */
inline const char* GetCaptureStateName(CaptureState state) {
    switch (state) {
        case CaptureState::Idle:       return "Idle";
        case CaptureState::Requesting: return "Requesting";
        case CaptureState::Listening:  return "Listening";
        case CaptureState::Suppressed: return "Suppressed";
        case CaptureState::Error:      return "Error";
        default:                       return "Invalid";
    }
}

inline const char* GetPermissionStateName(PermissionState permission) {
    switch (permission) {
        case PermissionState::Unknown: return "Unknown";
        case PermissionState::Granted: return "Granted";
        case PermissionState::Denied:  return "Denied";
        default:                       return "Invalid";
    }
}

inline const char* GetPlatformProfileName(PlatformProfile profile) {
    return profile == PlatformProfile::Mobile ? "Mobile" : "Desktop";
}

inline const char* GetCaptureErrorName(CaptureError error) {
    switch (error) {
        case CaptureError::None:                return "None";
        case CaptureError::PermissionDenied:    return "PermissionDenied";
        case CaptureError::DeviceNotFound:      return "DeviceNotFound";
        case CaptureError::NoSpeechTimeout:     return "NoSpeechTimeout";
        case CaptureError::Aborted:             return "Aborted";
        case CaptureError::NetworkError:        return "NetworkError";
        case CaptureError::EngineInvalidState:  return "EngineInvalidState";
        case CaptureError::UnsupportedPlatform: return "UnsupportedPlatform";
        case CaptureError::RetriesExhausted:    return "RetriesExhausted";
        default:                                return "Invalid";
    }
}

/**
 * @brief 错误分类
 */
inline ErrorSeverity ClassifyCaptureError(CaptureError error) {
    switch (error) {
        case CaptureError::NoSpeechTimeout:
        case CaptureError::Aborted:
        case CaptureError::None:
            return ErrorSeverity::Benign;
        case CaptureError::NetworkError:
            return ErrorSeverity::Transient;
        case CaptureError::EngineInvalidState:
            return ErrorSeverity::Recoverable;
        case CaptureError::PermissionDenied:
        case CaptureError::DeviceNotFound:
        case CaptureError::UnsupportedPlatform:
        case CaptureError::RetriesExhausted:
        default:
            return ErrorSeverity::Fatal;
    }
}

#endif // _CAPTURE_STATE_H_
