#pragma once
#include <recsim/types.hpp>
#include <recsim/Similarity.hpp>
#include <Eigen/Core>
#include <boost/optional.hpp>
#include <memory>
#include <vector>

namespace recsim {

/// A peer of a target user, as ranked by SimilarityEngine::neighbours().
struct Neighbour {
    /// The peer's row in the peer review matrix
    user_t user;
    /// The similarity value of the peer to the target
    double similarity;
    /** The dense rank of `similarity` among all neighbours: 0 for the highest value, with equal
     * similarities sharing a rank.
     */
    size_t rank;
};

/** Finds and ranks the neighbours of a target user.  Similarity is evaluated, by the configured
 * Similarity strategy, over only the goods both the target and the peer have reviewed; peers
 * sharing no reviewed good with the target are excluded rather than scored zero.
 */
class SimilarityEngine {
    public:
        /** Constructs an engine using the given strategy.
         *
         * \param similarity the similarity strategy; must not be null
         * \param neighbourhood the maximum number of neighbours to return, or 0 (the default) to
         * return every overlapping peer
         *
         * \throws std::invalid_argument if `similarity` is null
         */
        explicit SimilarityEngine(std::shared_ptr<const Similarity> similarity, size_t neighbourhood = 0);

        /** Returns the neighbours of the user whose review row is `target`, drawn from the rows of
         * `peers`, ordered by similarity descending with ties broken by ascending peer index.
         *
         * \param target the target's review row (NaN where absent)
         * \param peers the peer review matrix; must have as many columns as `target`
         * \param exclude a row of `peers` to skip; used when the target itself is one of the peers
         * \param population_fallback if true and no peer shares a reviewed good with the target,
         * every peer (except `exclude`) is returned with similarity 0 and rank 0
         *
         * \throws std::invalid_argument if `target` and `peers` disagree on the number of goods.
         */
        std::vector<Neighbour> neighbours(const Eigen::RowVectorXd &target, const Eigen::MatrixXd &peers,
                boost::optional<user_t> exclude = boost::none, bool population_fallback = false) const;

        /// The similarity strategy in use
        const Similarity& similarity() const { return *similarity_; }

    private:
        std::shared_ptr<const Similarity> similarity_;
        size_t neighbourhood_;
};

}
