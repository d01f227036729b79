#include "fake_scheduler.h"
#include "transcript_aggregator.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

class TranscriptAggregatorTest : public ::testing::Test {
protected:
  void build(const TranscriptConfig &cfg = TranscriptConfig{}) {
    aggregator = std::make_unique<TranscriptAggregator>(scheduler, cfg);
    aggregator->setOnTranscript([this](const std::string &text, bool isFinal) {
      delivered.emplace_back(text, isFinal);
    });
  }

  std::vector<std::string> finals() const {
    std::vector<std::string> out;
    for (const auto &[text, isFinal] : delivered) {
      if (isFinal) {
        out.push_back(text);
      }
    }
    return out;
  }

  FakeScheduler scheduler;
  std::unique_ptr<TranscriptAggregator> aggregator;
  std::vector<std::pair<std::string, bool>> delivered;
};

} // namespace

TEST_F(TranscriptAggregatorTest, PartialsOverwriteInterim) {
  build();
  aggregator->onPartial("hel");
  aggregator->onPartial("hello");
  EXPECT_EQ(aggregator->interim(), "hello");
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[1], std::make_pair(std::string("hello"), false));
}

TEST_F(TranscriptAggregatorTest, FinalEmittedOnceDespiteSilenceFlush) {
  build();
  aggregator->onFinal("hello world");
  EXPECT_EQ(finals(), std::vector<std::string>{"hello world"});

  scheduler.advance(1000);
  EXPECT_EQ(finals(), std::vector<std::string>{"hello world"});
  EXPECT_TRUE(aggregator->finalBuffer().empty());
}

TEST_F(TranscriptAggregatorTest, FinalBufferJoinsChunksWithSpaces) {
  build();
  aggregator->onFinal("  hello ");
  aggregator->onFinal("world");
  EXPECT_EQ(aggregator->finalBuffer(), "hello world");
  EXPECT_EQ(aggregator->deliveredLength(), aggregator->finalBuffer().size());
  EXPECT_EQ(finals(), (std::vector<std::string>{"hello", "world"}));
}

TEST_F(TranscriptAggregatorTest, RepeatedFlushDeliversNothingNew) {
  build();
  aggregator->onFinal("one");
  aggregator->flush();
  aggregator->flush();
  scheduler.advance(5000);
  EXPECT_EQ(finals(), std::vector<std::string>{"one"});
}

TEST_F(TranscriptAggregatorTest, BatchModeDeliversOneUtterance) {
  build(TranscriptConfig{.silence_flush_ms = 1000, .immediate_emit = false});
  aggregator->onFinal("turn on");
  aggregator->onFinal("the lights");
  EXPECT_TRUE(finals().empty());

  scheduler.advance(999);
  EXPECT_TRUE(finals().empty());
  scheduler.advance(1);
  EXPECT_EQ(finals(), std::vector<std::string>{"turn on the lights"});
}

TEST_F(TranscriptAggregatorTest, ActivityPostponesFlush) {
  build(TranscriptConfig{.silence_flush_ms = 1000, .immediate_emit = false});
  aggregator->onFinal("wait");
  scheduler.advance(900);
  aggregator->noteActivity();
  scheduler.advance(900);
  EXPECT_TRUE(finals().empty());
  scheduler.advance(100);
  EXPECT_EQ(finals(), std::vector<std::string>{"wait"});
}

TEST_F(TranscriptAggregatorTest, ActivityWithoutTextDoesNotArmTimer) {
  build();
  aggregator->noteActivity();
  EXPECT_FALSE(aggregator->silenceTimerPending());
}

TEST_F(TranscriptAggregatorTest, FlushDeliversOnlyUndeliveredRemainder) {
  build(TranscriptConfig{.silence_flush_ms = 1000, .immediate_emit = false});
  aggregator->onFinal("first");
  aggregator->flush();
  aggregator->onFinal("second");
  scheduler.advance(1000);
  EXPECT_EQ(finals(), (std::vector<std::string>{"first", "second"}));
}

TEST_F(TranscriptAggregatorTest, ResetDiscardsWithoutDelivering) {
  build(TranscriptConfig{.silence_flush_ms = 1000, .immediate_emit = false});
  aggregator->onPartial("draft");
  aggregator->onFinal("discard me");
  aggregator->reset();
  scheduler.advance(2000);
  EXPECT_TRUE(finals().empty());
  EXPECT_TRUE(aggregator->interim().empty());
}

TEST_F(TranscriptAggregatorTest, IgnoresBlankSegments) {
  build();
  aggregator->onSegment(TranscriptSegment{.text = "   ", .is_final = true});
  aggregator->onSegment(TranscriptSegment{.text = "", .is_final = false});
  EXPECT_TRUE(delivered.empty());
  EXPECT_FALSE(aggregator->silenceTimerPending());
}
