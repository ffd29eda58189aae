#include <recsim/Simulation.hpp>
#include <recsim/random/util.hpp>
#include <recsim/debug.hpp>

namespace recsim {

namespace {
const Config& validated(const Config &c) {
    c.validate();
    return c;
}
}

Simulation::Simulation(const Config &config, const Strategies &strategies, random::rng_t::result_type seed)
    : config_{validated(config)}, strategies_{strategies}, seed_{seed}, rng_{seed},
    store_{MatrixStore::generateUtilityMatrix(config_.matrix_size, config_.matrix_size, config_.utility, rng_)},
    agent_{config_, strategies_}
{
    users_.reserve(config_.matrix_size);
    for (user_t u = 0; u < config_.matrix_size; u++) users_.emplace_back(u, config_.starting_budget);

    if (config_.initial_reviews > 0) {
        for (user_t u = 0; u < config_.matrix_size; u++) {
            for (auto g : random::sample(rng_, config_.matrix_size, config_.initial_reviews))
                seedReview(u, g);
        }
    }
    RECSIM_DBG("simulation created with seed " << seed_ << ", " << store_.totalReviews() << " initial reviews");
}

Simulation::Simulation(const Config &config, random::rng_t::result_type seed)
    : Simulation(config, Strategies::defaults(validated(config)), seed)
{}

void Simulation::seedReview(user_t u, good_t g) {
    seedReview(u, g, strategies_.review->score(store_.trueUtility(u, g), rng_));
}

void Simulation::seedReview(user_t u, good_t g, double score) {
    UserAgent::consume(users_.at(u), store_, g, score);
}

void Simulation::onTick(std::function<void(const TickProgress&)> callback) {
    tick_callbacks_.push_back(std::move(callback));
}

void Simulation::run() {
    for (auto &user : users_) user.resetForTick(config_.starting_budget);

    TickProgress progress{t_, 0, 0, 0};
    for (auto &user : users_) {
        auto activity = agent_.runTick(user, store_, store_, rng_);
        progress.users_processed++;
        progress.reviews_written += activity.consumed();
        progress.recommendations += activity.recommendations.size();
    }

    RECSIM_DBG("tick " << t_ << ": " << progress.reviews_written << " reviews, " << progress.recommendations <<
            " recommendations, " << store_.totalReviews() << " reviews in total");
    t_++;

    for (auto &cb : tick_callbacks_) cb(progress);
}

void Simulation::runAll() {
    while (t_ < config_.ticks) run();
}

std::vector<state::UserState> Simulation::userStates() const {
    std::vector<state::UserState> states;
    states.reserve(users_.size());
    for (const auto &user : users_) states.emplace_back(user, store_);
    return states;
}

}
