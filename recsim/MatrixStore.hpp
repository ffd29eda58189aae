#pragma once
#include <recsim/types.hpp>
#include <recsim/Config.hpp>
#include <recsim/noncopyable.hpp>
#include <recsim/random/rng.hpp>
#include <Eigen/Core>
#include <map>
#include <stdexcept>
#include <vector>

namespace recsim {

/** The true and expected utility tables of a set of users over the goods.  Both matrices have one
 * row per user and one column per good.  Agents only ever act on `expected_utility`;
 * `true_utility` is what they actually receive, and what reviews are scored from.
 */
struct UtilityMatrix {
    /// Utility actually received by the user when consuming the good
    Eigen::MatrixXd true_utility;
    /// Utility the user expects from the good when deciding whether to consume it
    Eigen::MatrixXd expected_utility;
};

/** Owns the review matrix and utility tables of one population of users.  This is the single
 * source of truth for "who reviewed what": reviews are write-once per (user, good) pair and are
 * never overwritten or removed during a run.
 *
 * Absent reviews are stored as quiet NaN values in the review matrix.
 *
 * The store is not internally synchronized: the tick scheduler processes users sequentially, and a
 * store is never shared between runs.
 */
class MatrixStore : private noncopyable {
    public:
        /// Exception class thrown when attempting to review a good a second time.
        class already_reviewed_error : public std::logic_error {
            public:
                /// Constructs the exception, naming the user and good.
                already_reviewed_error(user_t u, good_t g);
        };

        /** Constructs a store over the given utility tables with an empty review matrix of the same
         * shape.
         *
         * \throws std::invalid_argument if the true and expected tables differ in shape.
         */
        explicit MatrixStore(UtilityMatrix utility);

        /** Generates `rows` by `goods` utility tables.  Cells are drawn row by row, left to right:
         * first the true utility from \f$N(mean, sd)\f$, then the expected utility error from
         * \f$N(noise\_mean, noise\_sd)\f$.  The same generator state always yields the same tables.
         */
        static UtilityMatrix generateUtilityMatrix(size_t rows, size_t goods,
                const UtilityDistribution &dist, random::rng_t &rng);

        /// Returns a `rows` by `goods` review matrix with every review absent.
        static Eigen::MatrixXd generateEmptyReviewMatrix(size_t rows, size_t goods);

        /// The number of users (rows)
        size_t users() const { return reviews_.rows(); }
        /// The number of goods (columns)
        size_t goods() const { return reviews_.cols(); }

        /** Records user `u`'s review of good `g`.
         *
         * \throws already_reviewed_error if `u` has already reviewed `g`.
         * \throws std::out_of_range if `u` or `g` is not in this store.
         * \throws std::invalid_argument if `score` is NaN.
         */
        void recordReview(user_t u, good_t g, double score);

        /// Returns true if user `u` has reviewed good `g`.
        bool hasReview(user_t u, good_t g) const;

        /// Returns the review user `u` gave good `g`, or NaN if there is none.
        double review(user_t u, good_t g) const;

        /// Returns the existing reviews of user `u`, keyed by good.
        std::map<good_t, double> reviewsFor(user_t u) const;

        /// Returns a copy of user `u`'s row of the review matrix (NaN where absent).
        Eigen::RowVectorXd reviewRow(user_t u) const;

        /// Read-only access to the whole review matrix.
        const Eigen::MatrixXd& reviews() const { return reviews_; }

        /// Returns the number of reviews good `g` has received.
        size_t reviewCount(good_t g) const;

        /// Returns the number of reviews of every good, indexed by good.
        std::vector<size_t> popularity() const;

        /// Returns the total number of reviews in the store.
        size_t totalReviews() const;

        /// Read-only access to the utility tables.
        const UtilityMatrix& utility() const { return utility_; }

        /// Shortcut for `utility().true_utility(u, g)`, with bounds checking.
        double trueUtility(user_t u, good_t g) const;

        /// Shortcut for `utility().expected_utility(u, g)`, with bounds checking.
        double expectedUtility(user_t u, good_t g) const;

    private:
        void checkIndex(user_t u, good_t g) const;

        const UtilityMatrix utility_;
        Eigen::MatrixXd reviews_;
};

}
