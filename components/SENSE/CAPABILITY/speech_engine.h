#ifndef _SPEECH_ENGINE_H_
#define _SPEECH_ENGINE_H_

#include <functional>
#include <memory>
#include <string>

#include "esp_err.h"
#include "capture_state.h"

class AudioStream;

/**
 * @brief 识别引擎回调
 */
struct SpeechEngineCallbacks {
    /// 识别结果，is_final=false 为中间结果
    std::function<void(const std::string &text, bool is_final)> on_result;
    std::function<void(CaptureError error)> on_error;
    /// 一次识别会话结束（引擎可能自发结束）
    std::function<void()> on_end;
};

/**
 * @brief 连续语音识别引擎
 *
 * 一个实例可以反复 start()/stop()。
 */
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;

    /**
     * @brief 开始一次识别会话
     * @return ESP_OK 成功, ESP_ERR_INVALID_STATE 已在运行, 其它为引擎故障
     */
    virtual esp_err_t start() = 0;

    /**
     * @brief 结束识别会话（幂等）
     */
    virtual esp_err_t stop() = 0;

    virtual void setCallbacks(SpeechEngineCallbacks callbacks) = 0;
};

/**
 * @brief 引擎工厂，平台不支持时返回 nullptr
 */
using SpeechEngineFactory = std::function<std::unique_ptr<SpeechEngine>(AudioStream &stream)>;

#endif // _SPEECH_ENGINE_H_
