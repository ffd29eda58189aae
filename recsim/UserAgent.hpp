#pragma once
#include <recsim/types.hpp>
#include <recsim/Config.hpp>
#include <recsim/Strategies.hpp>
#include <recsim/MatrixStore.hpp>
#include <recsim/SimilarityEngine.hpp>
#include <recsim/RecommendationPolicy.hpp>
#include <recsim/User.hpp>
#include <recsim/random/rng.hpp>
#include <vector>

namespace recsim {

/// One recommendation a user received during a tick.
struct Recommendation {
    /// The recommended good
    good_t good;
    /// Whether the user could afford to consume the good when it was recommended
    bool affordable;
    /// Whether the user consumed it
    bool consumed;
};

/// What one user did during one tick.
struct TickActivity {
    /// The number of recommendations requested (and paid for)
    size_t searches = 0;
    /// The recommendations received, in order
    std::vector<Recommendation> recommendations;
    /// True if the tick ended because no candidate was left, false if it ended on budget
    bool exhausted = false;

    /// The number of goods consumed (and thus reviews written)
    size_t consumed() const;
};

/** Runs the per-tick decision loop of a single user.
 *
 * While the user can afford a search, they pay the search price and ask for a recommendation;
 * the search price stays paid even if no candidate is found, which ends their tick.  A
 * recommended good is consumed if the ConsumptionRule accepts its expected utility and the user
 * can still afford the consumption price; otherwise it is rejected (and will not be recommended
 * again during this tick).  Consuming a good pays the consumption price, records the user's
 * review (scored by the ReviewRule from the good's true utility) and adds the true utility to the
 * user's actual utility.
 */
class UserAgent {
    public:
        /// Constructs an agent using the given prices, neighbourhood size and strategies.
        UserAgent(const Config &config, const Strategies &strategies);

        /** Runs one tick for `user`, whose reviews live in `own`, getting recommendations from the
         * reviews in `peers`.  `own` and `peers` may be the same store (established users), in
         * which case the user is excluded from their own neighbours.  The caller is expected to
         * have called `user.resetForTick()` first.
         *
         * \param population_fallback passed through to SimilarityEngine::neighbours()
         */
        TickActivity runTick(User &user, MatrixStore &own, const MatrixStore &peers, random::rng_t &rng,
                bool population_fallback = false) const;

        /** Records that `user` consumed `g` and reviewed it with `score`: writes the review into
         * `own`, adds the good's true utility to the user and recomputes their optimal utility.
         * No budget is charged.
         *
         * \throws MatrixStore::already_reviewed_error if the user already reviewed `g`.
         */
        static void consume(User &user, MatrixStore &own, good_t g, double score);

        /// The similarity engine used to find neighbours
        const SimilarityEngine& similarityEngine() const { return similarity_; }
        /// The policy used to pick recommendations
        const RecommendationPolicy& policy() const { return policy_; }

    private:
        const double search_price_, consume_price_;
        Strategies strategies_;
        SimilarityEngine similarity_;
        RecommendationPolicy policy_;
};

}
