#ifndef _EMOTION_SOURCE_ADAPTER_H_
#define _EMOTION_SOURCE_ADAPTER_H_

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "emotion_types.h"
#include "scheduler.h"
#include "subscription.h"

/**
 * @brief 情绪来源适配器
 *
 * 把某一路（语音或面部）原始的 name/score 结果转换为带时间戳的
 * EmotionReading 并发布给订阅者。每次发布都是该来源的完整快照。
 */
class EmotionSourceAdapter {
public:
    using RawScores = std::vector<std::pair<std::string, float>>;
    using ReadingsCallback = std::function<void(const std::vector<EmotionReading>&)>;

    EmotionSourceAdapter(EmotionSource source, Scheduler& scheduler);

    EmotionSourceAdapter(const EmotionSourceAdapter&) = delete;
    EmotionSourceAdapter& operator=(const EmotionSourceAdapter&) = delete;

    /**
     * @brief 发布一组原始分数
     *
     * 分数截断到 [0, 1]，空名字和非有限值被丢弃
     * @return 实际发布的读数个数
     */
    size_t publish(const RawScores& scores);

    /**
     * @brief 发布空快照（人脸丢失、语音静默）
     */
    void clear();

    Subscription subscribe(ReadingsCallback callback);

    EmotionSource source() const { return source_; }
    size_t subscriberCount() const { return listeners_.size(); }

private:
    EmotionSource source_;
    Scheduler& scheduler_;
    ListenerList<const std::vector<EmotionReading>&> listeners_;
};

#endif // _EMOTION_SOURCE_ADAPTER_H_
