// Tests for a single user's search/consume decisions within a tick.

#include <recsim/UserAgent.hpp>
#include <recsim/MatrixStore.hpp>
#include <recsim/User.hpp>
#include <recsim/Strategies.hpp>
#include <gtest/gtest.h>
#include <memory>

using namespace recsim;

Config config3() {
    Config c;
    c.matrix_size = 3;
    c.top_n = 1;
    c.initial_reviews = 0;
    return c;
}

// Every user gets true utility 7 (a +1 ternary review) and expected utility 5 from every good
UtilityMatrix utility3(size_t rows = 3) {
    return UtilityMatrix{Eigen::MatrixXd::Constant(rows, 3, 7), Eigen::MatrixXd::Constant(rows, 3, 5)};
}

// User 0 reviewed goods 0 and 1, user 1 reviewed good 0, user 2 reviewed good 2 (which nobody
// else has reviewed).
struct Scenario {
    Scenario() : store(utility3()) {
        for (user_t u = 0; u < 3; u++) users.emplace_back(u, 10);
        UserAgent::consume(users[0], store, 0, 1);
        UserAgent::consume(users[0], store, 1, 1);
        UserAgent::consume(users[1], store, 0, 1);
        UserAgent::consume(users[2], store, 2, 1);
    }
    MatrixStore store;
    std::vector<User> users;
    random::rng_t rng{1};
};

TEST(User, Budget) {
    User u(4, 10);
    EXPECT_EQ(4, u.id());
    EXPECT_TRUE(u.canAfford(10));
    u.pay(6);
    EXPECT_DOUBLE_EQ(4, u.budget());
    EXPECT_FALSE(u.canAfford(5));
    EXPECT_THROW(u.pay(5), std::logic_error);
    EXPECT_DOUBLE_EQ(4, u.budget());
    u.pay(4);
    EXPECT_DOUBLE_EQ(0, u.budget());

    u.recommended(3);
    u.consumed(3, 2.5);
    u.resetForTick(10);
    EXPECT_DOUBLE_EQ(10, u.budget());
    EXPECT_TRUE(u.recommendedThisTick().empty());
    EXPECT_EQ(std::set<good_t>({3}), u.consumedGoods());
    EXPECT_DOUBLE_EQ(2.5, u.actualUtility());
    EXPECT_THROW(u.consumed(3, 1), std::logic_error);
}

TEST(UserAgent, Consume) {
    Scenario s;
    EXPECT_EQ(4, s.store.totalReviews());
    EXPECT_EQ(std::set<good_t>({0, 1}), s.users[0].consumedGoods());
    EXPECT_DOUBLE_EQ(14, s.users[0].actualUtility());
    EXPECT_DOUBLE_EQ(14, s.users[0].optimalUtility());
    // Seeding charges nothing
    EXPECT_DOUBLE_EQ(10, s.users[0].budget());
    EXPECT_THROW(UserAgent::consume(s.users[0], s.store, 1, 1), MatrixStore::already_reviewed_error);
}

TEST(UserAgent, NoOverlap) {
    Scenario s;
    UserAgent agent(config3(), Strategies::defaults(config3()));
    auto a = agent.runTick(s.users[2], s.store, s.store, s.rng);
    EXPECT_EQ(1, a.searches);
    EXPECT_TRUE(a.exhausted);
    EXPECT_TRUE(a.recommendations.empty());
    EXPECT_DOUBLE_EQ(9, s.users[2].budget());
    EXPECT_EQ(1, s.store.reviewsFor(2).size());
}

TEST(UserAgent, ConsumeRecommendation) {
    Scenario s;
    UserAgent agent(config3(), Strategies::defaults(config3()));
    auto a = agent.runTick(s.users[1], s.store, s.store, s.rng);
    // search (9), consume good 1 (4), search with nothing left (3)
    EXPECT_EQ(2, a.searches);
    EXPECT_TRUE(a.exhausted);
    ASSERT_EQ(1, a.recommendations.size());
    EXPECT_EQ(1, a.recommendations[0].good);
    EXPECT_TRUE(a.recommendations[0].affordable);
    EXPECT_TRUE(a.recommendations[0].consumed);
    EXPECT_EQ(1, a.consumed());
    EXPECT_DOUBLE_EQ(3, s.users[1].budget());
    EXPECT_TRUE(s.store.hasReview(1, 1));
    EXPECT_DOUBLE_EQ(1, s.store.review(1, 1));
    EXPECT_EQ(std::set<good_t>({0, 1}), s.users[1].consumedGoods());
    EXPECT_DOUBLE_EQ(14, s.users[1].actualUtility());
}

TEST(UserAgent, Reject) {
    Scenario s;
    auto strategies = Strategies::defaults(config3());
    strategies.consumption = std::make_shared<ConsumptionRule::Simple>([](double) { return false; });
    UserAgent agent(config3(), strategies);
    auto a = agent.runTick(s.users[1], s.store, s.store, s.rng);
    EXPECT_EQ(2, a.searches);
    ASSERT_EQ(1, a.recommendations.size());
    EXPECT_TRUE(a.recommendations[0].affordable);
    EXPECT_FALSE(a.recommendations[0].consumed);
    EXPECT_EQ(std::set<good_t>({1}), s.users[1].recommendedThisTick());
    EXPECT_FALSE(s.store.hasReview(1, 1));
    EXPECT_DOUBLE_EQ(8, s.users[1].budget());

    // Rejections are forgotten at the next tick: good 1 is recommended again
    s.users[1].resetForTick(10);
    a = agent.runTick(s.users[1], s.store, s.store, s.rng);
    ASSERT_EQ(1, a.recommendations.size());
    EXPECT_EQ(1, a.recommendations[0].good);
}

TEST(UserAgent, InsufficientBudget) {
    Scenario s;
    auto c = config3();
    c.starting_budget = 5.5;
    UserAgent agent(c, Strategies::defaults(c));
    s.users[1].resetForTick(5.5);
    auto a = agent.runTick(s.users[1], s.store, s.store, s.rng);
    ASSERT_EQ(1, a.recommendations.size());
    EXPECT_FALSE(a.recommendations[0].affordable);
    EXPECT_FALSE(a.recommendations[0].consumed);
    EXPECT_FALSE(s.store.hasReview(1, 1));
    EXPECT_DOUBLE_EQ(3.5, s.users[1].budget());
    EXPECT_GE(s.users[1].budget(), 0);

    // Less than the search price: nothing happens at all
    s.users[1].resetForTick(0.5);
    a = agent.runTick(s.users[1], s.store, s.store, s.rng);
    EXPECT_EQ(0, a.searches);
    EXPECT_FALSE(a.exhausted);
    EXPECT_DOUBLE_EQ(0.5, s.users[1].budget());
}

TEST(UserAgent, BudgetExhaustion) {
    // Five goods liked by user 0; user 1 shares good 0 and can only pay for some of the rest
    UtilityMatrix u{Eigen::MatrixXd::Constant(2, 5, 7), Eigen::MatrixXd::Constant(2, 5, 5)};
    MatrixStore store(u);
    std::vector<User> users{User(0, 10), User(1, 10)};
    for (good_t g = 0; g < 5; g++) UserAgent::consume(users[0], store, g, 1);
    UserAgent::consume(users[1], store, 0, 1);

    auto c = config3();
    c.matrix_size = 5;
    c.starting_budget = 20;
    UserAgent agent(c, Strategies::defaults(c));
    random::rng_t rng(3);
    users[1].resetForTick(20);
    auto a = agent.runTick(users[1], store, store, rng);
    // 20 -> search 19 -> consume 14 -> 13 -> 8 -> 7 -> 2 -> search 1 (unaffordable) -> search 0
    // (no candidate left)
    EXPECT_EQ(5, a.searches);
    ASSERT_EQ(4, a.recommendations.size());
    EXPECT_EQ(3, a.consumed());
    EXPECT_EQ(4, a.recommendations[3].good);
    EXPECT_FALSE(a.recommendations[3].affordable);
    EXPECT_TRUE(a.exhausted);
    EXPECT_DOUBLE_EQ(0, users[1].budget());
    EXPECT_EQ(std::set<good_t>({0, 1, 2, 3}), users[1].consumedGoods());
}

TEST(UserAgent, Newcomer) {
    Scenario s;
    MatrixStore newcomers(utility3(1));
    User newbie(0, 10);
    UserAgent agent(config3(), Strategies::defaults(config3()));

    auto a = agent.runTick(newbie, newcomers, s.store, s.rng);
    EXPECT_EQ(1, a.searches);
    EXPECT_TRUE(a.exhausted);
    EXPECT_EQ(0, newcomers.totalReviews());

    // With the population fallback the newcomer gets the most liked good, 0
    newbie.resetForTick(10);
    a = agent.runTick(newbie, newcomers, s.store, s.rng, true);
    ASSERT_GE(a.recommendations.size(), 1);
    EXPECT_EQ(0, a.recommendations[0].good);
    EXPECT_TRUE(a.recommendations[0].consumed);
    EXPECT_TRUE(newcomers.hasReview(0, 0));
    // The established store is untouched
    EXPECT_EQ(4, s.store.totalReviews());
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
