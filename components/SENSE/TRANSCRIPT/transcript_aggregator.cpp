#include "transcript_aggregator.h"

#include "esp_log.h"

static const char *TAG = "Transcript";

namespace {
static std::string trimCopy(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) {
    return std::string();
  }
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}
} // namespace

TranscriptAggregator::TranscriptAggregator(Scheduler &scheduler,
                                           const TranscriptConfig &cfg)
    : m_scheduler(scheduler), m_cfg(cfg) {}

void TranscriptAggregator::onSegment(const TranscriptSegment &segment) {
  if (segment.is_final) {
    onFinal(segment.text);
  } else {
    onPartial(segment.text);
  }
}

void TranscriptAggregator::onPartial(const std::string &text) {
  std::string t = trimCopy(text);
  if (t.empty()) {
    return;
  }
  m_interim = t;
  emit(m_interim, false);
  armSilenceTimer();
}

void TranscriptAggregator::onFinal(const std::string &text) {
  std::string chunk = trimCopy(text);
  if (chunk.empty()) {
    return;
  }
  m_interim.clear();

  if (!m_finalBuffer.empty()) {
    m_finalBuffer.push_back(' ');
  }
  m_finalBuffer += chunk;

  if (m_cfg.immediate_emit) {
    m_deliveredLen = m_finalBuffer.size();
    emit(chunk, true);
  }
  ESP_LOGD(TAG, "Final chunk (%u chars buffered, %u delivered)",
           (unsigned)m_finalBuffer.size(), (unsigned)m_deliveredLen);
  armSilenceTimer();
}

void TranscriptAggregator::noteActivity() {
  if (m_finalBuffer.empty() && m_interim.empty()) {
    return;
  }
  armSilenceTimer();
}

void TranscriptAggregator::flush() {
  m_silenceTimer.cancel();

  if (m_deliveredLen < m_finalBuffer.size()) {
    std::string rest = trimCopy(m_finalBuffer.substr(m_deliveredLen));
    m_deliveredLen = m_finalBuffer.size();
    if (!rest.empty()) {
      ESP_LOGI(TAG, "Utterance: %s", rest.c_str());
      emit(rest, true);
    }
  }

  m_finalBuffer.clear();
  m_interim.clear();
  m_deliveredLen = 0;
}

void TranscriptAggregator::reset() {
  m_silenceTimer.cancel();
  m_finalBuffer.clear();
  m_interim.clear();
  m_deliveredLen = 0;
}

void TranscriptAggregator::armSilenceTimer() {
  m_silenceTimer = m_scheduler.runAfter(m_cfg.silence_flush_ms, [this]() {
    ESP_LOGD(TAG, "Silence for %u ms, flushing", (unsigned)m_cfg.silence_flush_ms);
    flush();
  });
}

void TranscriptAggregator::emit(const std::string &text, bool isFinal) {
  if (m_onTranscript) {
    m_onTranscript(text, isFinal);
  }
}
