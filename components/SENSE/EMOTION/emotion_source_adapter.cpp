#include "emotion_source_adapter.h"

#include <algorithm>
#include <cmath>

#include "esp_log.h"

static const char* TAG = "EmotionSource";

EmotionSourceAdapter::EmotionSourceAdapter(EmotionSource source, Scheduler& scheduler)
    : source_(source), scheduler_(scheduler) {}

size_t EmotionSourceAdapter::publish(const RawScores& scores) {
    int64_t now = scheduler_.nowMs();

    std::vector<EmotionReading> readings;
    readings.reserve(scores.size());
    for (const auto& [name, score] : scores) {
        if (name.empty() || !std::isfinite(score)) {
            ESP_LOGD(TAG, "[%s] dropping invalid reading", GetEmotionSourceName(source_));
            continue;
        }
        readings.push_back(EmotionReading{
            .name = name,
            .score = std::clamp(score, 0.0f, 1.0f),
            .source = source_,
            .timestamp_ms = now,
        });
    }

    ESP_LOGD(TAG, "[%s] publishing %u readings", GetEmotionSourceName(source_),
             (unsigned)readings.size());
    listeners_.notify(readings);
    return readings.size();
}

void EmotionSourceAdapter::clear() {
    listeners_.notify(std::vector<EmotionReading>{});
}

Subscription EmotionSourceAdapter::subscribe(ReadingsCallback callback) {
    return listeners_.add(std::move(callback));
}
