#pragma once
#include <recsim/types.hpp>
#include <recsim/Config.hpp>
#include <recsim/Strategies.hpp>
#include <recsim/MatrixStore.hpp>
#include <recsim/User.hpp>
#include <recsim/UserAgent.hpp>
#include <recsim/noncopyable.hpp>
#include <recsim/random/rng.hpp>
#include <recsim/state/UserState.hpp>
#include <functional>
#include <vector>

/// Base namespace containing all recsim classes.
namespace recsim {

/// Progress information passed to onTick() callbacks after each tick.
struct TickProgress {
    /// The tick that just finished (0 for the first tick)
    tick_t tick;
    /// The number of users processed during the tick
    size_t users_processed;
    /// The number of reviews written during the tick
    size_t reviews_written;
    /// The number of recommendations made during the tick
    size_t recommendations;
};

/** One run of the recommender over a population of established users.  The simulation owns the
 * run's random number generator, the MatrixStore with the users' utility tables and reviews, and
 * the users themselves; everything random in the run is drawn from the generator, so two
 * simulations constructed with the same configuration and seed evolve identically.
 *
 * Construction draws the utility tables, then gives every user `initial_reviews` distinct,
 * uniformly chosen goods as consumed and reviewed (no budget is charged for these).  Each call to
 * run() then advances the simulation by one tick:
 *
 * - every user's budget is reset to the starting budget and their per-tick recommendations are
 *   cleared;
 * - users act strictly in ascending index order, each running a UserAgent tick against the live
 *   review matrix, so reviews written by earlier users during a tick are visible to later users in
 *   the same tick.
 */
class Simulation final : private noncopyable {
    public:
        /** Creates a simulation.
         *
         * \param config the simulation parameters
         * \param strategies the similarity, consumption and review strategies
         * \param seed the seed for the run's random number generator
         *
         * \throws ConfigurationError if `config` is invalid
         * \throws std::invalid_argument if a strategy is null
         */
        Simulation(const Config &config, const Strategies &strategies, random::rng_t::result_type seed);

        /// Creates a simulation using Strategies::defaults(config).
        Simulation(const Config &config, random::rng_t::result_type seed);

        /// Runs one tick.
        void run();

        /// Runs ticks until `config().ticks` ticks have been run.  There is no early stop.
        void runAll();

        /// Returns the number of ticks run so far.
        tick_t t() const { return t_; }

        /** Records that user `u` has consumed good `g`, with the review score given by the review
         * rule.  No budget is charged.  Used to bootstrap the review matrix.
         *
         * \throws MatrixStore::already_reviewed_error if `u` already reviewed `g`
         * \throws std::out_of_range if `u` or `g` is invalid
         */
        void seedReview(user_t u, good_t g);

        /// Like seedReview(u, g), but with an explicit review score.
        void seedReview(user_t u, good_t g, double score);

        /** Adds a callback to be invoked after each tick with the tick's progress.  Callbacks are
         * purely observational.
         */
        void onTick(std::function<void(const TickProgress&)> callback);

        /// The simulation parameters
        const Config& config() const { return config_; }
        /// The strategies in use
        const Strategies& strategies() const { return strategies_; }
        /// The review matrix and utility tables of the established users
        const MatrixStore& store() const { return store_; }
        /// The established users, indexed by user id
        const std::vector<User>& users() const { return users_; }
        /// Access a single user.  \throws std::out_of_range for an invalid user.
        const User& user(user_t u) const { return users_.at(u); }
        /// The agent running every user's decisions
        const UserAgent& agent() const { return agent_; }
        /// The seed the run's generator was created with
        random::rng_t::result_type seed() const { return seed_; }
        /// The run's random number generator
        random::rng_t& rng() { return rng_; }

        /// Returns a read-only snapshot of every user.
        std::vector<state::UserState> userStates() const;

    private:
        const Config config_;
        const Strategies strategies_;
        const random::rng_t::result_type seed_;
        random::rng_t rng_;
        MatrixStore store_;
        std::vector<User> users_;
        UserAgent agent_;
        tick_t t_ = 0;
        std::vector<std::function<void(const TickProgress&)>> tick_callbacks_;
};

}
