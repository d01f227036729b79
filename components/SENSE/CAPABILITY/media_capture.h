#ifndef _MEDIA_CAPTURE_H_
#define _MEDIA_CAPTURE_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "capture_state.h"
#include "subscription.h"

/**
 * @brief 音频采集参数
 */
struct MediaConstraints {
    uint32_t sample_rate_hz = 16000;
    uint8_t channel_count = 1;
    bool echo_cancellation = true;
    bool noise_suppression = true;
    bool auto_gain_control = true;

    /**
     * @brief 按平台选择采样率（mobile 16kHz, desktop 44.1kHz）
     */
    static MediaConstraints forProfile(PlatformProfile profile) {
        MediaConstraints c;
        c.sample_rate_hz = profile == PlatformProfile::Mobile ? 16000 : 44100;
        return c;
    }
};

/**
 * @brief 频谱分析器
 *
 * 由 AudioStream::createAnalyser() 创建，调用方独占
 */
class SpectrumAnalyser {
public:
    virtual ~SpectrumAnalyser() = default;

    /**
     * @brief 读取最新一帧的幅度谱，每个频点缩放到 0-255
     * @param bins 输出，会被调整为频点个数
     * @return 频点个数
     */
    virtual size_t readByteFrequencyData(std::vector<uint8_t> &bins) = 0;
};

/**
 * @brief 已打开的音频流
 */
class AudioStream {
public:
    /// 16 位单声道 PCM 帧
    using FrameCallback = std::function<void(const int16_t *samples, size_t count)>;

    virtual ~AudioStream() = default;

    virtual std::unique_ptr<SpectrumAnalyser> createAnalyser() = 0;

    /**
     * @brief 订阅 PCM 帧（在采集任务中回调）
     */
    virtual Subscription addFrameListener(FrameCallback callback) = 0;

    /**
     * @brief 关闭流，释放麦克风（幂等）
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

/**
 * @brief 麦克风权限与音频流获取
 *
 * requestAudio() 是异步的，回调在调度器的执行上下文中触发。
 * 成功时 error 为 CaptureError::None，stream 非空。
 */
class MediaCapture {
public:
    using AudioCallback =
        std::function<void(CaptureError error, std::shared_ptr<AudioStream> stream)>;

    virtual ~MediaCapture() = default;

    virtual void requestAudio(const MediaConstraints &constraints, AudioCallback callback) = 0;
};

#endif // _MEDIA_CAPTURE_H_
