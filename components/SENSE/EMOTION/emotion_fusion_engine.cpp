#include "emotion_fusion_engine.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

#include "esp_log.h"

static const char* TAG = "EmotionFusion";

namespace {

constexpr const char* kNeutral = "neutral";

const char* const kPositiveEmotions[] = {
    "joy", "happiness", "interest", "excitement", "amusement", "contentment",
};

float positiveSum(const EmotionHistoryEntry& entry) {
    float sum = 0.0f;
    for (const auto& r : entry.readings) {
        if (EmotionFusionEngine::IsPositiveEmotion(r.name)) {
            sum += r.score;
        }
    }
    return sum;
}

float dominantScore(const EmotionHistoryEntry& entry) {
    return entry.readings.empty() ? 0.0f : entry.readings.front().score;
}

} // namespace

EmotionFusionEngine::EmotionFusionEngine(Scheduler& scheduler, const EmotionFusionConfig& config)
    : scheduler_(scheduler), config_(config) {
    if (config_.history_capacity == 0) {
        config_.history_capacity = 30;
    }
    ESP_LOGI(TAG, "Init: weights face=%.2f voice=%.2f history=%u",
             config_.weights.face, config_.weights.voice,
             (unsigned)config_.history_capacity);
}

void EmotionFusionEngine::attach(EmotionSourceAdapter& voice, EmotionSourceAdapter& face) {
    voice_sub_ = voice.subscribe([this](const std::vector<EmotionReading>& readings) {
        update(EmotionSource::Voice, readings);
    });
    face_sub_ = face.subscribe([this](const std::vector<EmotionReading>& readings) {
        update(EmotionSource::Face, readings);
    });
}

void EmotionFusionEngine::detach() {
    voice_sub_.reset();
    face_sub_.reset();
}

const std::vector<EmotionReading>& EmotionFusionEngine::update(
    EmotionSource source, const std::vector<EmotionReading>& readings) {
    if (source == EmotionSource::Voice) {
        voice_ = readings;
    } else if (source == EmotionSource::Face) {
        face_ = readings;
    } else {
        ESP_LOGW(TAG, "Ignoring update from fused source");
        return latest_;
    }

    int64_t now = scheduler_.nowMs();
    latest_ = Fuse(voice_, face_, config_.weights, config_.min_score, now);

    EmotionHistoryEntry entry;
    entry.timestamp_ms = now;
    entry.readings = latest_;
    entry.dominant = latest_.empty() ? kNeutral : latest_.front().name;
    history_.push_back(std::move(entry));
    while (history_.size() > config_.history_capacity) {
        history_.pop_front();
    }

    ESP_LOGD(TAG, "Fused %u emotions from %s, dominant=%s",
             (unsigned)latest_.size(), GetEmotionSourceName(source),
             history_.back().dominant.c_str());

    if (on_update_) {
        on_update_(latest_);
    }
    return latest_;
}

std::vector<EmotionReading> EmotionFusionEngine::Fuse(const std::vector<EmotionReading>& voice,
                                                      const std::vector<EmotionReading>& face,
                                                      const FusionWeights& weights,
                                                      float min_score, int64_t timestamp_ms) {
    // name -> (voice, face)，同名取最后一个
    std::map<std::string, std::pair<float, float>> scores;
    for (const auto& r : voice) {
        scores[r.name].first = r.score;
    }
    for (const auto& r : face) {
        scores[r.name].second = r.score;
    }

    std::vector<EmotionReading> fused;
    fused.reserve(scores.size());
    for (const auto& [name, pair] : scores) {
        float score = pair.second * weights.face + pair.first * weights.voice;
        score = std::clamp(score, 0.0f, 1.0f);
        if (score <= min_score) {
            continue;
        }
        fused.push_back(EmotionReading{
            .name = name,
            .score = score,
            .source = EmotionSource::Fused,
            .timestamp_ms = timestamp_ms,
        });
    }

    std::stable_sort(fused.begin(), fused.end(),
                     [](const EmotionReading& a, const EmotionReading& b) {
                         if (a.score != b.score) {
                             return a.score > b.score;
                         }
                         return a.name < b.name;
                     });
    return fused;
}

bool EmotionFusionEngine::IsPositiveEmotion(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    for (const char* positive : kPositiveEmotions) {
        if (lower == positive) {
            return true;
        }
    }
    return false;
}

EmotionTrend EmotionFusionEngine::ClassifyTrend(const std::deque<EmotionHistoryEntry>& history,
                                                size_t window) {
    if (history.size() < 3 || window == 0) {
        return EmotionTrend::Stable;
    }

    size_t n = history.size();
    size_t recentBegin = n > window ? n - window : 0;
    size_t olderBegin = recentBegin > window ? recentBegin - window : 0;

    float recent = 0.0f;
    for (size_t i = recentBegin; i < n; ++i) {
        recent += positiveSum(history[i]);
    }
    float older = 0.0f;
    for (size_t i = olderBegin; i < recentBegin; ++i) {
        older += positiveSum(history[i]);
    }

    if (recent > older * 1.2f) {
        return EmotionTrend::Improving;
    }
    if (recent < older * 0.8f) {
        return EmotionTrend::Declining;
    }
    return EmotionTrend::Stable;
}

EmotionTrend EmotionFusionEngine::trend() const {
    return ClassifyTrend(history_, config_.trend_window);
}

EmotionProfile EmotionFusionEngine::BuildProfile(const std::deque<EmotionHistoryEntry>& history,
                                                 size_t window) {
    EmotionProfile profile;
    if (history.empty() || window == 0) {
        return profile;
    }

    size_t begin = history.size() > window ? history.size() - window : 0;
    size_t count = history.size() - begin;

    // 主导情绪：按强度累加
    std::map<std::string, float> totals;
    float sum = 0.0f;
    for (size_t i = begin; i < history.size(); ++i) {
        float s = dominantScore(history[i]);
        totals[history[i].dominant] += s;
        sum += s;
    }
    float best = -1.0f;
    for (const auto& [name, total] : totals) {
        if (total > best) {
            best = total;
            profile.dominant = name;
        }
    }

    float mean = sum / (float)count;
    float variance = 0.0f;
    for (size_t i = begin; i < history.size(); ++i) {
        float d = dominantScore(history[i]) - mean;
        variance += d * d;
    }
    variance /= (float)count;

    profile.stability = std::max(0.0f, 1.0f - variance);
    profile.expressiveness = mean;

    if (count > 1) {
        size_t changes = 0;
        for (size_t i = begin + 1; i < history.size(); ++i) {
            if (history[i].dominant != history[i - 1].dominant) {
                ++changes;
            }
        }
        profile.reactivity = (float)changes / (float)(count - 1);
    } else {
        profile.reactivity = 0.0f;
    }
    return profile;
}

EmotionProfile EmotionFusionEngine::profile() const {
    return BuildProfile(history_, config_.profile_window);
}

std::string EmotionFusionEngine::dominant() const {
    return latest_.empty() ? std::string(kNeutral) : latest_.front().name;
}

std::string EmotionFusionEngine::insight() const {
    if (history_.empty()) {
        return "Unable to determine current emotional state";
    }

    const EmotionHistoryEntry& current = history_.back();
    float intensity = dominantScore(current);

    std::string text = "User is currently feeling " + current.dominant;
    if (intensity > 0.7f) {
        text += " with high intensity";
    } else if (intensity < 0.3f) {
        text += " mildly";
    }

    EmotionTrend t = trend();
    if (t != EmotionTrend::Stable) {
        text += " and emotional state is ";
        text += GetEmotionTrendName(t);
    }

    EmotionProfile p = profile();
    if (p.stability < 0.3f) {
        text += ". Emotions are quite variable";
    } else if (p.stability > 0.7f) {
        text += ". Emotional state is very stable";
    }
    return text;
}

void EmotionFusionEngine::reset() {
    voice_.clear();
    face_.clear();
    latest_.clear();
    history_.clear();
    ESP_LOGI(TAG, "Reset");
}
