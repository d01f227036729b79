#ifndef _EMOTION_FUSION_ENGINE_H_
#define _EMOTION_FUSION_ENGINE_H_

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "emotion_source_adapter.h"
#include "emotion_types.h"
#include "scheduler.h"
#include "subscription.h"

struct EmotionFusionConfig {
    FusionWeights weights;
    size_t history_capacity = 30;
    /// 融合分数不高于此值的情绪被丢弃
    float min_score = 0.01f;
    /// 趋势比较窗口（最近 N 条对比之前 N 条）
    size_t trend_window = 5;
    size_t profile_window = 20;
};

/**
 * @brief 多模态情绪融合
 *
 * 每个来源保留最新快照，任一来源更新即做一次融合：
 *   fused(name) = face(name) * w.face + voice(name) * w.voice
 * 结果截断到 [0, 1]，丢弃 <= min_score 的项，按分数降序（同分按名字）。
 * 每次融合都追加一条历史，超过容量淘汰最旧的。
 */
class EmotionFusionEngine {
public:
    using UpdateCallback = std::function<void(const std::vector<EmotionReading>&)>;

    explicit EmotionFusionEngine(Scheduler& scheduler,
                                 const EmotionFusionConfig& config = EmotionFusionConfig{});

    EmotionFusionEngine(const EmotionFusionEngine&) = delete;
    EmotionFusionEngine& operator=(const EmotionFusionEngine&) = delete;

    /**
     * @brief 订阅两路来源
     */
    void attach(EmotionSourceAdapter& voice, EmotionSourceAdapter& face);
    void detach();

    void setOnEmotionUpdate(UpdateCallback cb) { on_update_ = std::move(cb); }

    /**
     * @brief 替换某一来源的快照并融合
     */
    const std::vector<EmotionReading>& update(EmotionSource source,
                                              const std::vector<EmotionReading>& readings);

    const std::vector<EmotionReading>& latest() const { return latest_; }
    const std::deque<EmotionHistoryEntry>& history() const { return history_; }
    std::string dominant() const;

    EmotionTrend trend() const;
    EmotionProfile profile() const;

    /**
     * @brief 一句话描述当前情绪状态
     */
    std::string insight() const;

    void reset();

    /**
     * @brief 纯函数：按权重融合两路快照
     */
    static std::vector<EmotionReading> Fuse(const std::vector<EmotionReading>& voice,
                                            const std::vector<EmotionReading>& face,
                                            const FusionWeights& weights,
                                            float min_score, int64_t timestamp_ms);

    static EmotionTrend ClassifyTrend(const std::deque<EmotionHistoryEntry>& history,
                                      size_t window);

    static EmotionProfile BuildProfile(const std::deque<EmotionHistoryEntry>& history,
                                       size_t window);

    /**
     * @brief 正向情绪（不区分大小写）
     */
    static bool IsPositiveEmotion(const std::string& name);

private:
    Scheduler& scheduler_;
    EmotionFusionConfig config_;

    std::vector<EmotionReading> voice_;
    std::vector<EmotionReading> face_;
    std::vector<EmotionReading> latest_;
    std::deque<EmotionHistoryEntry> history_;

    Subscription voice_sub_;
    Subscription face_sub_;
    UpdateCallback on_update_;
};

#endif // _EMOTION_FUSION_ENGINE_H_
