#include "retry_policy.h"

#include <gtest/gtest.h>

TEST(RetryPolicyTest, ProfileBudgets) {
  EXPECT_EQ(MaxRetries(PlatformProfile::Mobile), 5u);
  EXPECT_EQ(MaxRetries(PlatformProfile::Desktop), 3u);
  EXPECT_EQ(NextDelayMs(PlatformProfile::Mobile), 300u);
  EXPECT_EQ(NextDelayMs(PlatformProfile::Desktop), 100u);

  RetryPolicy mobile = RetryPolicy::forProfile(PlatformProfile::Mobile);
  EXPECT_EQ(mobile.max_retries, 5u);
  EXPECT_EQ(mobile.delay_ms, 300u);
  EXPECT_TRUE(mobile.hard_reset_on_fault);

  RetryPolicy desktop = RetryPolicy::forProfile(PlatformProfile::Desktop);
  EXPECT_EQ(desktop.profile, PlatformProfile::Desktop);
  EXPECT_FALSE(desktop.hard_reset_on_fault);
}

TEST(RetryPolicyTest, RestartsOnlyWhenAllInputsAllow) {
  RetryPolicy policy = RetryPolicy::forProfile(PlatformProfile::Desktop);
  CaptureSession session;
  session.permission = PermissionState::Granted;

  RestartInputs want{.desired_listening = true, .system_speaking = false};
  EXPECT_TRUE(ShouldRestart(session, want, policy));

  RestartInputs speaking{.desired_listening = true, .system_speaking = true};
  EXPECT_FALSE(ShouldRestart(session, speaking, policy));

  RestartInputs unwanted{.desired_listening = false, .system_speaking = false};
  EXPECT_FALSE(ShouldRestart(session, unwanted, policy));

  session.permission = PermissionState::Denied;
  EXPECT_FALSE(ShouldRestart(session, want, policy));
}

TEST(RetryPolicyTest, BudgetIsExclusive) {
  RetryPolicy policy = RetryPolicy::forProfile(PlatformProfile::Mobile);
  CaptureSession session;
  session.permission = PermissionState::Granted;
  RestartInputs want{.desired_listening = true, .system_speaking = false};

  session.retry_count = 4;
  EXPECT_TRUE(ShouldRestart(session, want, policy));
  EXPECT_FALSE(RetriesExhausted(session, policy));

  session.retry_count = 5;
  EXPECT_FALSE(ShouldRestart(session, want, policy));
  EXPECT_TRUE(RetriesExhausted(session, policy));
}
