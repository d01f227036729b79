#pragma once

#include "cloud_session.h"
#include "media_capture.h"
#include "speech_engine.h"
#include "subscription.h"
#include <memory>

/**
 * @brief 基于 CloudSession 的识别引擎
 *
 * start() 发送 listen start 并把麦克风帧转发到服务器，stop() 发送
 * listen stop。服务器下发最终结果、no-speech 等错误或者断线后，本次
 * 识别会话结束并回调 on_end，由控制器决定是否重启。
 *
 * @example
 *   SpeechCaptureController controller(scheduler, mic,
 *       CloudSpeechEngine::factory(CloudSession::instance()), cfg);
 */
class CloudSpeechEngine : public SpeechEngine {
public:
    CloudSpeechEngine(CloudSession& session, AudioStream& stream);
    ~CloudSpeechEngine() override;

    CloudSpeechEngine(const CloudSpeechEngine&) = delete;
    CloudSpeechEngine& operator=(const CloudSpeechEngine&) = delete;

    esp_err_t start() override;
    esp_err_t stop() override;
    void setCallbacks(SpeechEngineCallbacks callbacks) override { callbacks_ = std::move(callbacks); }

    bool running() const { return running_; }

    static SpeechEngineFactory factory(CloudSession& session);

private:
    void onStt(const std::string& text, bool is_final);
    void onError(CaptureError error);
    void finish();

    CloudSession& session_;
    AudioStream& stream_;
    SpeechEngineCallbacks callbacks_;
    bool running_ = false;

    Subscription frame_sub_;
    Subscription stt_sub_;
    Subscription error_sub_;

    // 回调中可能销毁本对象
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};
