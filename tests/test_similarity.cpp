/**
 * @file test_similarity.cpp
 * @brief 페이지 유사도 단위 테스트
 *
 * 테스트 대상:
 *   - SimilarityScorer: 범위, 동일 입력, 빈/없는 입력, 대칭성, 알려진 비율
 */

#include <gtest/gtest.h>

#include "scan/similarity_scorer.h"

#include <string>
#include <vector>

using namespace clonescan::scan;

// ============================================================
// SimilarityScorer 테스트
// ============================================================

class SimilarityScorerTest : public ::testing::Test {
protected:
    std::vector<std::string> samples_ = {
        "Welcome to Example Bank Sign in Username Password",
        "Welcome to Examp1e Bank Sign in Username Password Forgot?",
        "Totally unrelated page about gardening and tomatoes",
        "abcd",
        "bcde",
        "aaaa bbbb aaaa",
        "x",
    };
};

// 1. 동일한 비어 있지 않은 텍스트는 1.0
TEST_F(SimilarityScorerTest, IdenticalTextIsOne) {
    for (const auto& s : samples_) {
        EXPECT_DOUBLE_EQ(SimilarityScorer::ratio(s, s), 1.0)
            << "동일 텍스트의 유사도는 1이어야 합니다: " << s;
    }
}

// 2. 없거나 빈 입력은 0.0
TEST_F(SimilarityScorerTest, AbsentOrEmptyIsZero) {
    EXPECT_DOUBLE_EQ(SimilarityScorer::similarity(std::nullopt, std::string("page")), 0.0);
    EXPECT_DOUBLE_EQ(SimilarityScorer::similarity(std::string("page"), std::nullopt), 0.0);
    EXPECT_DOUBLE_EQ(SimilarityScorer::similarity(std::nullopt, std::nullopt), 0.0);
    EXPECT_DOUBLE_EQ(SimilarityScorer::similarity(std::string(), std::string()), 0.0)
        << "빈 문자열끼리도 0이어야 합니다";
    EXPECT_DOUBLE_EQ(SimilarityScorer::ratio("", "page"), 0.0);
}

// 3. 모든 쌍에서 [0, 1] 범위 + 대칭
TEST_F(SimilarityScorerTest, BoundedAndSymmetric) {
    for (const auto& a : samples_) {
        for (const auto& b : samples_) {
            double ab = SimilarityScorer::ratio(a, b);
            double ba = SimilarityScorer::ratio(b, a);
            EXPECT_GE(ab, 0.0);
            EXPECT_LE(ab, 1.0);
            EXPECT_DOUBLE_EQ(ab, ba) << "유사도는 대칭이어야 합니다: '" << a << "' / '" << b << "'";
        }
    }
}

// 4. 알려진 비율: 2·M / (len(a) + len(b))
TEST_F(SimilarityScorerTest, KnownRatios) {
    // 최장 일치 "bcd" → M = 3
    EXPECT_EQ(SimilarityScorer::matchedLength("abcd", "bcde"), 3u);
    EXPECT_DOUBLE_EQ(SimilarityScorer::ratio("abcd", "bcde"), 0.75);

    // "hello " (6) + 오른쪽 구간의 "r" (1) → M = 7
    EXPECT_EQ(SimilarityScorer::matchedLength("hello world", "hello there"), 7u);
    EXPECT_NEAR(SimilarityScorer::ratio("hello world", "hello there"), 14.0 / 22.0, 1e-12);

    // 공통 문자가 없으면 0
    EXPECT_DOUBLE_EQ(SimilarityScorer::ratio("abc", "xyz"), 0.0);
}

// 5. 한 글자 차이의 복제 페이지는 높은 유사도
TEST_F(SimilarityScorerTest, NearCloneScoresHigh) {
    double score = SimilarityScorer::similarity(samples_[0], samples_[1]);
    EXPECT_GT(score, 0.85) << "거의 동일한 복제 페이지는 0.85를 넘어야 합니다";

    double unrelated = SimilarityScorer::similarity(samples_[0], samples_[2]);
    EXPECT_LT(unrelated, score);
}
