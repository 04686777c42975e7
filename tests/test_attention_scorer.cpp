/**
 * @file test_attention_scorer.cpp
 * @brief Attention score deductions
 */

#include <gtest/gtest.h>
#include <proctoreye/gaze/AttentionScorer.hpp>

using namespace proctoreye::gaze;

class AttentionScorerTest : public ::testing::Test {
protected:
    AttentionInputs normal() const {
        AttentionInputs inputs;
        inputs.blink_rate = 15.0f;
        return inputs;
    }

    EngineConfig config_;
    AttentionScorer scorer_{config_};
};

TEST_F(AttentionScorerTest, AttentiveSubjectScoresFull) {
    EXPECT_FLOAT_EQ(scorer_.score(normal()), AttentionScorer::MAX_SCORE);
}

TEST_F(AttentionScorerTest, LookingAwayAndExcessiveBlinking) {
    AttentionInputs inputs = normal();
    inputs.looking_away = true;
    inputs.excessive_blinking = true;
    EXPECT_FLOAT_EQ(scorer_.score(inputs), 50.0f);
}

TEST_F(AttentionScorerTest, DeductionsAreIndependent) {
    AttentionInputs inputs = normal();
    inputs.suspicious_movement = true;
    EXPECT_FLOAT_EQ(scorer_.score(inputs), 75.0f);

    inputs.blink_rate = 2.0f;
    EXPECT_FLOAT_EQ(scorer_.score(inputs), 60.0f);
}

TEST_F(AttentionScorerTest, BlinkRateBandIsInclusive) {
    AttentionInputs inputs = normal();
    inputs.blink_rate = 5.0f;
    EXPECT_FLOAT_EQ(scorer_.score(inputs), 100.0f);
    inputs.blink_rate = 30.0f;
    EXPECT_FLOAT_EQ(scorer_.score(inputs), 100.0f);
    inputs.blink_rate = 30.5f;
    EXPECT_FLOAT_EQ(scorer_.score(inputs), 85.0f);
}

TEST_F(AttentionScorerTest, AllFlagsScoreTen) {
    AttentionInputs inputs;
    inputs.looking_away = true;
    inputs.excessive_blinking = true;
    inputs.suspicious_movement = true;
    inputs.blink_rate = 0.0f;
    EXPECT_FLOAT_EQ(scorer_.score(inputs), 10.0f);
}

TEST_F(AttentionScorerTest, ClampsAtZero) {
    EngineConfig harsh;
    harsh.look_away_penalty = 80.0f;
    harsh.excessive_blinking_penalty = 80.0f;
    AttentionScorer scorer(harsh);

    AttentionInputs inputs = normal();
    inputs.looking_away = true;
    inputs.excessive_blinking = true;
    EXPECT_FLOAT_EQ(scorer.score(inputs), 0.0f);
}
