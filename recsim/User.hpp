#pragma once
#include <recsim/types.hpp>
#include <set>
#include <stdexcept>

namespace recsim {

/** The mutable state of one simulated user: their per-tick budget, the goods recommended to them
 * during the current tick, and everything they have consumed so far.
 *
 * A User is a row of a MatrixStore: `id()` is the row index of the user in the store that owns
 * their reviews.  Every good in consumedGoods() has a review in that row, and vice versa.
 */
class User {
    public:
        /// Constructs a user with the given row index and initial budget.
        User(user_t id, double budget) : id_{id}, budget_{budget} {}

        /// The user's row index in the store holding their reviews
        user_t id() const { return id_; }

        /// The budget remaining in the current tick
        double budget() const { return budget_; }

        /** Starts a new tick: restores the budget to `budget` and clears the set of goods
         * recommended this tick.  Consumed goods and accumulated utility are kept.
         */
        void resetForTick(double budget);

        /// Returns true if paying `price` would not drive the budget negative.
        bool canAfford(double price) const { return price <= budget_; }

        /** Deducts `price` from the budget.
         *
         * \throws std::logic_error if the user cannot afford `price`.
         */
        void pay(double price);

        /// Goods recommended to this user during the current tick
        const std::set<good_t>& recommendedThisTick() const { return recommended_; }

        /// Every good this user has consumed
        const std::set<good_t>& consumedGoods() const { return consumed_; }

        /// Sum of the true utility of every consumed good
        double actualUtility() const { return actual_; }

        /** The best utility achievable with as many goods as the user has consumed: the sum of the
         * user's largest true utilities, one per consumed good.
         */
        double optimalUtility() const { return optimal_; }

        /// Notes that `g` was recommended during the current tick.
        void recommended(good_t g) { recommended_.insert(g); }

        /** Notes that `g` was consumed, yielding `true_utility`.
         *
         * \throws std::logic_error if `g` was already consumed.
         */
        void consumed(good_t g, double true_utility);

        /// Sets the optimal utility, recomputed by the caller after consumption.
        void optimalUtility(double optimal) { optimal_ = optimal; }

    private:
        user_t id_;
        double budget_;
        std::set<good_t> recommended_;
        std::set<good_t> consumed_;
        double actual_ = 0;
        double optimal_ = 0;
};

}
