#include <recsim/UserAgent.hpp>
#include <recsim/algorithms.hpp>
#include <recsim/debug.hpp>

namespace recsim {

size_t TickActivity::consumed() const {
    size_t c = 0;
    for (const auto &r : recommendations) if (r.consumed) c++;
    return c;
}

namespace {
const Strategies& checked(const Strategies &s) {
    s.check();
    return s;
}
}

UserAgent::UserAgent(const Config &config, const Strategies &strategies)
    : search_price_{config.search_price}, consume_price_{config.consume_price},
    strategies_{checked(strategies)},
    similarity_{strategies_.similarity, config.neighbourhood},
    policy_{strategies_.review->neutral()}
{}

void UserAgent::consume(User &user, MatrixStore &own, good_t g, double score) {
    own.recordReview(user.id(), g, score);
    user.consumed(g, own.trueUtility(user.id(), g));
    user.optimalUtility(best_sum(own.utility().true_utility.row(user.id()), user.consumedGoods().size()));
}

TickActivity UserAgent::runTick(User &user, MatrixStore &own, const MatrixStore &peers, random::rng_t &rng,
        bool population_fallback) const {
    TickActivity activity;
    boost::optional<user_t> exclude;
    if (&own == &peers) exclude = user.id();

    while (user.canAfford(search_price_)) {
        user.pay(search_price_);
        activity.searches++;

        Eigen::RowVectorXd row = own.reviewRow(user.id());
        auto neighbours = similarity_.neighbours(row, peers.reviews(), exclude, population_fallback);
        auto g = policy_.recommend(row, neighbours, peers.reviews(), user.recommendedThisTick());
        if (not g) {
            activity.exhausted = true;
            break;
        }

        user.recommended(*g);
        bool wants = strategies_.consumption->consume(own.expectedUtility(user.id(), *g));
        bool affordable = user.canAfford(consume_price_);
        if (wants and affordable) {
            user.pay(consume_price_);
            consume(user, own, *g, strategies_.review->score(own.trueUtility(user.id(), *g), rng));
        }
        activity.recommendations.push_back({*g, affordable, wants and affordable});
    }

    RECSIM_DBG("user " << user.id() << ": " << activity.searches << " searches, " << activity.consumed() <<
            " consumed, budget left " << user.budget());
    return activity;
}

}
