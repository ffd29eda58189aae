#pragma once
#include <recsim/types.hpp>
#include <recsim/Config.hpp>
#include <recsim/Strategies.hpp>
#include <recsim/MatrixStore.hpp>
#include <recsim/User.hpp>
#include <recsim/UserAgent.hpp>
#include <recsim/random/rng.hpp>
#include <boost/optional.hpp>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace recsim {

class Simulation;

/** A flat record of named metrics.  An empty value means the metric is undefined for the run
 * (typically a ratio whose denominator is zero); it is never silently reported as 0.
 */
using Metrics = std::map<std::string, boost::optional<double>>;

/** Computes the metrics of a finished run.
 *
 * Three sets of metrics are produced, each with its own key prefix:
 *
 * - the established population (`utility.`, `users.`, `reviews.`, `popular.`, `optimal_users.`):
 *   how much of their achievable utility users received, how many were well served, and how
 *   strongly their consumption concentrated on the most reviewed goods;
 * - an oracle population (`oracle.`), in which every user consumes the goods they value most, as
 *   many as a tick budget allows over the run; its popularity metrics are the baseline that the
 *   recommender's concentration is compared to;
 * - a cold-start pass (`new_users.`, `control.`): synthetic newcomers with fresh utilities and no
 *   history run the same number of ticks against the frozen review matrix, alongside a control
 *   group consuming as many goods chosen at random.
 *
 * For popularity metrics, the "top N" goods are those with the most reviews (ties to the lower
 * index) and popularity is reported for N of 1, ceil(top_n/4), ceil(top_n/2) and top_n:
 *
 * - `topN.any`: the fraction of users who consumed at least one top-N good;
 * - `topN.any_positive` and `topN.any_mixed`: of those, the fraction for whom every consumed top-N
 *   good had positive true utility, and the fraction for whom at least one did not;
 * - `topN.all`: the fraction of users who consumed every top-N good.
 */
class Analysis {
    public:
        /// Constructs an analysis for runs with the given configuration and strategies.
        Analysis(const Config &config, const Strategies &strategies);

        /** Computes every metric of a finished simulation.  `rng` is used for the cold-start pass;
         * the simulation itself is not modified.
         */
        Metrics analyze(const Simulation &sim, random::rng_t &rng) const;

        /** Metrics of the established population.  Users who consumed nothing are counted in
         * `users.idle` and excluded from the well-served and optimal-user ratios.
         */
        Metrics population(const MatrixStore &store, const std::vector<User> &users) const;

        /** Metrics of the oracle population built from the true utilities in `store`: each user
         * consumes their oracleGoods() most valued goods.
         */
        Metrics oracle(const MatrixStore &store) const;

        /** Runs the cold-start pass against `frozen`, which is only read, and returns its metrics.
         * Newcomer utilities, review noise and the control group's picks are drawn from `rng`.
         */
        Metrics coldStart(const MatrixStore &frozen, random::rng_t &rng) const;

        /// The distinct N values popularity metrics are reported for, ascending.
        std::vector<size_t> popularityLevels() const;

        /** The number of goods each oracle user consumes: the number of (search, consume) pairs a
         * tick budget pays for, times the number of ticks, capped at the number of goods.
         */
        size_t oracleGoods() const;

        /// Returns num/den, or an empty optional if `den` is 0.
        static boost::optional<double> ratio(double num, double den);

        /// Writes each metric on its own line as `name: value`, with `undefined` for empty values.
        static void print(std::ostream &os, const Metrics &metrics);

    private:
        using Consumption = std::vector<std::pair<user_t, std::set<good_t>>>;

        void popularityMetrics(Metrics &m, const std::string &prefix, const std::vector<good_t> &ranking,
                const Consumption &members, const Eigen::MatrixXd &true_utility) const;

        const Config config_;
        const Strategies strategies_;
        const UserAgent agent_;
};

}
