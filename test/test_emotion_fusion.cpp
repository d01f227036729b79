#include "emotion_fusion_engine.h"
#include "emotion_source_adapter.h"
#include "fake_scheduler.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

EmotionReading reading(const char *name, float score, EmotionSource source) {
  EmotionReading r;
  r.name = name;
  r.score = score;
  r.source = source;
  return r;
}

class EmotionFusionTest : public ::testing::Test {
protected:
  EmotionFusionTest()
      : voice(EmotionSource::Voice, scheduler),
        face(EmotionSource::Face, scheduler), engine(scheduler) {
    engine.attach(voice, face);
  }

  // 每条历史的 joy 来自 face，fused = 0.6 * score
  void pushFaceJoy(float score, int times) {
    for (int i = 0; i < times; ++i) {
      scheduler.advance(100);
      face.publish({{"joy", score}});
    }
  }

  FakeScheduler scheduler;
  EmotionSourceAdapter voice;
  EmotionSourceAdapter face;
  EmotionFusionEngine engine;
};

} // namespace

TEST_F(EmotionFusionTest, WeightedJoyExample) {
  face.publish({{"joy", 0.8f}});
  voice.publish({{"joy", 0.4f}});

  const auto &fused = engine.latest();
  ASSERT_EQ(fused.size(), 1u);
  EXPECT_EQ(fused[0].name, "joy");
  EXPECT_NEAR(fused[0].score, 0.64f, 1e-5);
  EXPECT_EQ(fused[0].source, EmotionSource::Fused);
  EXPECT_EQ(engine.dominant(), "joy");
  EXPECT_EQ(engine.history().size(), 2u);
}

TEST_F(EmotionFusionTest, SourceUpdateReplacesSnapshot) {
  face.publish({{"joy", 0.8f}});
  face.publish({{"sadness", 0.5f}});
  const auto &fused = engine.latest();
  ASSERT_EQ(fused.size(), 1u);
  EXPECT_EQ(fused[0].name, "sadness");
  EXPECT_NEAR(fused[0].score, 0.3f, 1e-5);

  face.clear();
  EXPECT_TRUE(engine.latest().empty());
  EXPECT_EQ(engine.dominant(), "neutral");
  EXPECT_EQ(engine.history().back().dominant, "neutral");
}

TEST_F(EmotionFusionTest, DropsNegligibleScores) {
  face.publish({{"calm", 0.01f}, {"anger", 0.5f}});
  ASSERT_EQ(engine.latest().size(), 1u);
  EXPECT_EQ(engine.latest()[0].name, "anger");
}

TEST_F(EmotionFusionTest, ScoresStayInUnitRange) {
  FusionWeights heavy{.face = 1.0f, .voice = 1.0f};
  std::vector<EmotionReading> v{reading("joy", 0.9f, EmotionSource::Voice)};
  std::vector<EmotionReading> f{reading("joy", 0.9f, EmotionSource::Face),
                                reading("fear", 0.2f, EmotionSource::Face)};
  auto fused = EmotionFusionEngine::Fuse(v, f, heavy, 0.01f, 0);
  ASSERT_EQ(fused.size(), 2u);
  for (const auto &r : fused) {
    EXPECT_GE(r.score, 0.0f);
    EXPECT_LE(r.score, 1.0f);
  }
  EXPECT_FLOAT_EQ(fused[0].score, 1.0f);
}

TEST_F(EmotionFusionTest, FusionIsDeterministic) {
  std::vector<EmotionReading> v{reading("surprise", 0.5f, EmotionSource::Voice),
                                reading("joy", 0.2f, EmotionSource::Voice)};
  std::vector<EmotionReading> f{reading("awe", 0.5f, EmotionSource::Face),
                                reading("boredom", 0.5f, EmotionSource::Face)};
  FusionWeights w;
  auto a = EmotionFusionEngine::Fuse(v, f, w, 0.01f, 42);
  auto b = EmotionFusionEngine::Fuse(v, f, w, 0.01f, 42);
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].name, b[i].name);
    EXPECT_FLOAT_EQ(a[i].score, b[i].score);
  }
  // 同分按名字排序
  ASSERT_EQ(a.size(), 4u);
  EXPECT_EQ(a[0].name, "awe");
  EXPECT_EQ(a[1].name, "boredom");
  EXPECT_EQ(a[2].name, "surprise");
  EXPECT_EQ(a[3].name, "joy");
}

TEST_F(EmotionFusionTest, HistoryIsCappedAtThirty) {
  pushFaceJoy(0.5f, 40);
  ASSERT_EQ(engine.history().size(), 30u);
  EXPECT_EQ(engine.history().front().timestamp_ms, 1100);
  EXPECT_EQ(engine.history().back().timestamp_ms, 4000);
}

TEST_F(EmotionFusionTest, TrendStableBelowThreeEntries) {
  EXPECT_EQ(engine.trend(), EmotionTrend::Stable);
  pushFaceJoy(0.9f, 2);
  EXPECT_EQ(engine.trend(), EmotionTrend::Stable);
}

TEST_F(EmotionFusionTest, TrendImproving) {
  pushFaceJoy(0.1f, 5);
  pushFaceJoy(0.9f, 5);
  EXPECT_EQ(engine.trend(), EmotionTrend::Improving);
}

TEST_F(EmotionFusionTest, TrendDeclining) {
  pushFaceJoy(0.9f, 5);
  pushFaceJoy(0.1f, 5);
  EXPECT_EQ(engine.trend(), EmotionTrend::Declining);
}

TEST_F(EmotionFusionTest, TrendStableWithinThresholds) {
  pushFaceJoy(0.5f, 5);
  pushFaceJoy(0.55f, 5);
  EXPECT_EQ(engine.trend(), EmotionTrend::Stable);
}

TEST_F(EmotionFusionTest, PositiveNamesAreCaseInsensitive) {
  EXPECT_TRUE(EmotionFusionEngine::IsPositiveEmotion("Joy"));
  EXPECT_TRUE(EmotionFusionEngine::IsPositiveEmotion("CONTENTMENT"));
  EXPECT_TRUE(EmotionFusionEngine::IsPositiveEmotion("amusement"));
  EXPECT_FALSE(EmotionFusionEngine::IsPositiveEmotion("sadness"));
  EXPECT_FALSE(EmotionFusionEngine::IsPositiveEmotion(""));
}

TEST_F(EmotionFusionTest, ProfileAndInsight) {
  EXPECT_EQ(engine.insight(), "Unable to determine current emotional state");

  pushFaceJoy(0.8f, 3);
  EmotionProfile p = engine.profile();
  EXPECT_EQ(p.dominant, "joy");
  EXPECT_NEAR(p.expressiveness, 0.48f, 1e-5);
  EXPECT_NEAR(p.stability, 1.0f, 1e-5);
  EXPECT_FLOAT_EQ(p.reactivity, 0.0f);

  EXPECT_EQ(engine.insight(),
            "User is currently feeling joy and emotional state is improving. "
            "Emotional state is very stable");
}

TEST_F(EmotionFusionTest, ReactivityCountsDominantChanges) {
  face.publish({{"joy", 0.8f}});
  face.publish({{"anger", 0.8f}});
  face.publish({{"joy", 0.8f}});
  EXPECT_FLOAT_EQ(engine.profile().reactivity, 1.0f);
}

TEST_F(EmotionFusionTest, HighIntensityInsight) {
  face.publish({{"anger", 1.0f}});
  voice.publish({{"anger", 1.0f}});
  EXPECT_EQ(engine.insight(),
            "User is currently feeling anger with high intensity. "
            "Emotional state is very stable");
}

TEST_F(EmotionFusionTest, UpdateCallbackReceivesFusedReadings) {
  std::vector<std::string> dominants;
  engine.setOnEmotionUpdate([&dominants](const std::vector<EmotionReading> &r) {
    dominants.push_back(r.empty() ? "neutral" : r.front().name);
  });
  voice.publish({{"interest", 0.7f}});
  face.clear();
  EXPECT_EQ(dominants, (std::vector<std::string>{"interest", "interest"}));
}

TEST_F(EmotionFusionTest, DetachStopsUpdates) {
  engine.detach();
  face.publish({{"joy", 0.8f}});
  EXPECT_TRUE(engine.history().empty());
}

TEST(EmotionSourceAdapterTest, SanitizesAndTimestamps) {
  FakeScheduler scheduler;
  scheduler.advance(1234);
  EmotionSourceAdapter adapter(EmotionSource::Voice, scheduler);

  std::vector<EmotionReading> got;
  Subscription sub = adapter.subscribe(
      [&got](const std::vector<EmotionReading> &readings) { got = readings; });

  size_t n = adapter.publish({{"joy", 1.5f},
                              {"", 0.5f},
                              {"fear", -0.2f},
                              {"calm", std::numeric_limits<float>::quiet_NaN()}});
  EXPECT_EQ(n, 2u);
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0].name, "joy");
  EXPECT_FLOAT_EQ(got[0].score, 1.0f);
  EXPECT_EQ(got[0].source, EmotionSource::Voice);
  EXPECT_EQ(got[0].timestamp_ms, 1234);
  EXPECT_EQ(got[1].name, "fear");
  EXPECT_FLOAT_EQ(got[1].score, 0.0f);

  sub.reset();
  adapter.publish({{"joy", 0.3f}});
  EXPECT_EQ(got.size(), 2u);
  EXPECT_EQ(adapter.subscriberCount(), 0u);
}
