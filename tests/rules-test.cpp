// Tests for review scoring and consumption rules, and the default strategy set.

#include <recsim/ReviewRule.hpp>
#include <recsim/ConsumptionRule.hpp>
#include <recsim/Strategies.hpp>
#include <recsim/random/rng.hpp>
#include <gtest/gtest.h>
#include <memory>

using namespace recsim;

TEST(ReviewRule, Ternary) {
    random::rng_t rng(1);
    review::Ternary t(4, 2);
    EXPECT_DOUBLE_EQ(0, t.neutral());
    EXPECT_DOUBLE_EQ(1, t.score(7, rng));
    EXPECT_DOUBLE_EQ(1, t.score(6.01, rng));
    EXPECT_DOUBLE_EQ(0, t.score(6, rng));
    EXPECT_DOUBLE_EQ(0, t.score(4, rng));
    EXPECT_DOUBLE_EQ(0, t.score(2, rng));
    EXPECT_DOUBLE_EQ(-1, t.score(1.99, rng));
    EXPECT_DOUBLE_EQ(-1, t.score(-10, rng));
}

TEST(ReviewRule, TernaryNoise) {
    review::Ternary t(4, 2, 1);
    random::rng_t rng1(5), rng2(5);
    int positive = 0;
    for (int i = 0; i < 200; i++) {
        double a = t.score(5.5, rng1);
        EXPECT_EQ(a, t.score(5.5, rng2));
        EXPECT_TRUE(a == -1 or a == 0 or a == 1);
        if (a == 1) positive++;
    }
    // Utility 5.5 is within one sd of the mean: without noise it would always score 0
    EXPECT_GT(positive, 0);
    EXPECT_LT(positive, 200);
}

TEST(ReviewRule, Scaled) {
    random::rng_t rng(1);
    review::Scaled s(5, 4, 2);
    EXPECT_EQ(5, s.k());
    EXPECT_DOUBLE_EQ(3, s.neutral());
    EXPECT_DOUBLE_EQ(3, s.score(4, rng));
    EXPECT_DOUBLE_EQ(5, s.score(100, rng));
    EXPECT_DOUBLE_EQ(1, s.score(-100, rng));
    // 4 + 2*0.5 is the 69th percentile: the fourth of five buckets
    EXPECT_DOUBLE_EQ(4, s.score(5, rng));
    EXPECT_DOUBLE_EQ(2, s.score(3, rng));

    review::Scaled two(2, 0, 1);
    EXPECT_DOUBLE_EQ(1.5, two.neutral());
    EXPECT_DOUBLE_EQ(1, two.score(-0.5, rng));
    EXPECT_DOUBLE_EQ(2, two.score(0.5, rng));

    EXPECT_THROW(review::Scaled(1, 4, 2), std::domain_error);
    EXPECT_THROW(review::Scaled(5, 4, 0), std::domain_error);
}

TEST(ReviewRule, Simple) {
    random::rng_t rng(1);
    ReviewRule::Simple r([](double u) { return u > 5 ? 10 : 1; }, 5.5);
    EXPECT_DOUBLE_EQ(5.5, r.neutral());
    EXPECT_DOUBLE_EQ(10, r.score(6, rng));
    EXPECT_DOUBLE_EQ(1, r.score(5, rng));
}

TEST(ConsumptionRule, Cutoff) {
    consumption::Cutoff zero;
    EXPECT_DOUBLE_EQ(0, zero.cutoff());
    EXPECT_TRUE(zero.consume(0.1));
    EXPECT_FALSE(zero.consume(0));
    EXPECT_FALSE(zero.consume(-3));

    consumption::Cutoff four(4);
    EXPECT_TRUE(four.consume(4.5));
    EXPECT_FALSE(four.consume(4));
}

TEST(ConsumptionRule, Simple) {
    ConsumptionRule::Simple never([](double) { return false; });
    EXPECT_FALSE(never.consume(100));
    ConsumptionRule::Simple always([](double) { return true; });
    EXPECT_TRUE(always.consume(-100));
}

TEST(Strategies, Defaults) {
    Config c;
    auto s = Strategies::defaults(c);
    EXPECT_NO_THROW(s.check());
    ASSERT_TRUE(std::dynamic_pointer_cast<const review::Ternary>(s.review));
    EXPECT_DOUBLE_EQ(0, s.review->neutral());
    auto agree = std::dynamic_pointer_cast<const similarity::Agreement>(s.similarity);
    ASSERT_TRUE(agree);
    EXPECT_DOUBLE_EQ(0, agree->neutral());
    auto cutoff = std::dynamic_pointer_cast<const consumption::Cutoff>(s.consumption);
    ASSERT_TRUE(cutoff);
    EXPECT_DOUBLE_EQ(0, cutoff->cutoff());

    c.rating_scale = 5;
    c.consumption_cutoff = 2;
    s = Strategies::defaults(c);
    ASSERT_TRUE(std::dynamic_pointer_cast<const review::Scaled>(s.review));
    EXPECT_DOUBLE_EQ(3, s.review->neutral());
    agree = std::dynamic_pointer_cast<const similarity::Agreement>(s.similarity);
    ASSERT_TRUE(agree);
    EXPECT_DOUBLE_EQ(3, agree->neutral());
    EXPECT_FALSE(s.consumption->consume(2));
    EXPECT_TRUE(s.consumption->consume(2.5));

    s.review.reset();
    EXPECT_THROW(s.check(), std::invalid_argument);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
