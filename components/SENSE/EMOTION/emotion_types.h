#ifndef _EMOTION_TYPES_H_
#define _EMOTION_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief 情绪来源
 */
enum class EmotionSource {
    Voice = 0,  ///< 语音韵律
    Face,       ///< 面部表情
    Fused       ///< 融合结果
};

/**
 * @brief 单个情绪读数，score 在 [0, 1]
 */
struct EmotionReading {
    std::string name;
    float score = 0.0f;
    EmotionSource source = EmotionSource::Fused;
    int64_t timestamp_ms = 0;
};

/**
 * @brief 融合历史记录
 */
struct EmotionHistoryEntry {
    int64_t timestamp_ms = 0;
    std::vector<EmotionReading> readings;  ///< 按分数降序
    std::string dominant;
};

/**
 * @brief 融合权重
 */
struct FusionWeights {
    float face = 0.6f;
    float voice = 0.4f;
};

enum class EmotionTrend {
    Stable = 0,
    Improving,
    Declining
};

/**
 * @brief 情绪画像（基于最近若干条历史）
 */
struct EmotionProfile {
    std::string dominant = "neutral";
    float stability = 0.5f;       ///< max(0, 1 - 方差)
    float expressiveness = 0.5f;  ///< 主导情绪平均强度
    float reactivity = 0.5f;      ///< 主导情绪切换频率
};

inline const char* GetEmotionSourceName(EmotionSource source) {
    switch (source) {
        case EmotionSource::Voice: return "voice";
        case EmotionSource::Face:  return "face";
        case EmotionSource::Fused: return "fused";
        default:                   return "unknown";
    }
}

inline const char* GetEmotionTrendName(EmotionTrend trend) {
    switch (trend) {
        case EmotionTrend::Stable:    return "stable";
        case EmotionTrend::Improving: return "improving";
        case EmotionTrend::Declining: return "declining";
        default:                      return "unknown";
    }
}

#endif // _EMOTION_TYPES_H_
