#pragma once

#include "scheduler.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

struct TranscriptConfig {
  // silence after the last activity before buffered finals are flushed
  uint32_t silence_flush_ms = 1000;
  // false: finals are only delivered by the silence flush, as one utterance
  bool immediate_emit = true;
};

/**
 * @brief 识别片段
 */
struct TranscriptSegment {
  std::string text;
  bool is_final = false;
  int64_t timestamp_ms = 0;
};

/**
 * @brief 识别结果聚合
 *
 * 中间结果覆盖 interim 并立即下发；最终结果追加到 final buffer，静音
 * 超时后下发尚未下发过的部分。已下发前缀由 m_deliveredLen 记录，同一段
 * 文字不会下发两次。
 */
class TranscriptAggregator {
public:
  using TranscriptCallback =
      std::function<void(const std::string &text, bool is_final)>;

  explicit TranscriptAggregator(Scheduler &scheduler,
                                const TranscriptConfig &cfg = TranscriptConfig{});

  TranscriptAggregator(const TranscriptAggregator &) = delete;
  TranscriptAggregator &operator=(const TranscriptAggregator &) = delete;

  void setOnTranscript(TranscriptCallback cb) { m_onTranscript = std::move(cb); }

  void onSegment(const TranscriptSegment &segment);
  void onPartial(const std::string &text);
  void onFinal(const std::string &text);

  /**
   * @brief 语音活动，重新开始静音计时（无待下发内容时忽略）
   */
  void noteActivity();

  /**
   * @brief 立即下发未下发的最终文本并清空
   */
  void flush();

  /**
   * @brief 丢弃所有内容，不下发
   */
  void reset();

  const std::string &interim() const { return m_interim; }
  const std::string &finalBuffer() const { return m_finalBuffer; }
  size_t deliveredLength() const { return m_deliveredLen; }
  bool silenceTimerPending() const { return m_silenceTimer.pending(); }

private:
  void armSilenceTimer();
  void emit(const std::string &text, bool isFinal);

  Scheduler &m_scheduler;
  TranscriptConfig m_cfg;

  std::string m_interim;
  std::string m_finalBuffer;
  size_t m_deliveredLen = 0;
  TimerHandle m_silenceTimer;

  TranscriptCallback m_onTranscript;
};
