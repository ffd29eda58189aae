#pragma once
#include <recsim/types.hpp>
#include <recsim/SimilarityEngine.hpp>
#include <Eigen/Core>
#include <boost/optional.hpp>
#include <set>
#include <vector>

namespace recsim {

/** Chooses the single good to recommend to a user from the reviews of their neighbours.
 *
 * Candidates are the goods that at least one neighbour reviewed above the neutral midpoint of the
 * review scale, minus the goods already recommended to the user during the current tick and the
 * goods the user has already reviewed.  Each candidate is scored as
 *
 * \f[ \sum_{j} \frac{r_{jg} - neutral}{1 + rank_j} \f]
 *
 * over the neighbours \f$j\f$ reviewing it positively, and the highest-scoring candidate is
 * recommended, ties going to the lowest good index.  No randomness is involved: the same inputs
 * always produce the same recommendation.
 *
 * A good rejected in an earlier tick can be recommended again: only the current tick's
 * recommendations are excluded.
 */
class RecommendationPolicy {
    public:
        /// Constructs a policy for a review scale with the given neutral midpoint.
        explicit RecommendationPolicy(double neutral = 0.0) : neutral_{neutral} {}

        /** Returns the good to recommend, or an empty optional if there is no candidate (including
         * when `neighbours` is empty).
         *
         * \param target the target user's review row
         * \param neighbours the target's ranked neighbours, as returned by SimilarityEngine
         * \param peer_reviews the review matrix the neighbours index into
         * \param already_recommended goods already recommended to the target this tick
         */
        boost::optional<good_t> recommend(const Eigen::RowVectorXd &target,
                const std::vector<Neighbour> &neighbours,
                const Eigen::MatrixXd &peer_reviews,
                const std::set<good_t> &already_recommended) const;

        /// The neutral midpoint of the review scale
        double neutral() const { return neutral_; }

    private:
        const double neutral_;
};

}
