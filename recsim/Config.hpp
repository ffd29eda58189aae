#pragma once
#include <recsim/types.hpp>
#include <cstdint>
#include <stdexcept>

namespace recsim {

/** Exception class thrown by Config::validate() when a parameter is out of range.  The message
 * names the offending parameter.
 */
class ConfigurationError : public std::domain_error {
    public:
        /// Inherited constructors
        using std::domain_error::domain_error;
};

/** Parameters of the normal distribution that utility matrices are drawn from.  The true utility
 * of each (user, good) cell is drawn from \f$N(mean, sd)\f$; the expected utility a user acts
 * upon is the true utility plus an independent \f$N(noise\_mean, noise\_sd)\f$ error.
 */
struct UtilityDistribution {
    /// Mean of true utility values
    double mean = 4.0;
    /// Standard deviation of true utility values
    double sd = 2.0;
    /// Mean of the error between true and expected utility
    double noise_mean = 0.0;
    /// Standard deviation of the error between true and expected utility
    double noise_sd = 2.0;
};

/** Settings for a set of recommender simulation runs.  The defaults reproduce the baseline
 * popularity-bias experiment.
 *
 * A Config is plain data: nothing is checked until validate() is called, which happens before
 * any simulation work begins (in the Simulation and Experiment constructors).
 */
struct Config {
    /// The number of established users, which is also the number of goods.
    size_t matrix_size = 20;

    /// The number of ticks each run lasts.
    tick_t ticks = 10;

    /// The number of independent runs an Experiment performs.
    size_t experiments = 10;

    /// The cost of asking for one recommendation.
    double search_price = 1.0;

    /// The cost of consuming a recommended good.
    double consume_price = 5.0;

    /// The budget every user receives at the beginning of every tick.
    double starting_budget = 10.0;

    /** A consuming user is "well served" if their actual utility is at least this fraction of their
     * optimal utility.
     */
    double well_served_threshold = 0.8;

    /** Users whose actual utility is at least this fraction of their optimal utility are
     * considered "optimal users" when computing the popularity metrics of that subset.
     */
    double optimal_ratio_cutoff = 0.95;

    /** The size of the most popular ("top") and least popular ("bottom") good sets.  Popularity
     * metrics are reported for 1, ceil(top_n/4), ceil(top_n/2) and top_n goods.  Must not exceed
     * matrix_size.
     */
    size_t top_n = 10;

    /// The number of synthetic users in the cold-start pass.
    size_t new_users = 10;

    /** The number of goods (chosen uniformly at random, without replacement) every established
     * user has reviewed before the first tick.  Must not exceed matrix_size.
     */
    size_t initial_reviews = 2;

    /// The distribution utility matrices are drawn from.
    UtilityDistribution utility;

    /** Users consume a recommended good only if its expected utility exceeds this value (and they
     * can afford it).
     */
    double consumption_cutoff = 0.0;

    /** The review scale: 0 means the ternary -1/0/+1 scale; a value k of 2 or more means integer
     * scores from 1 to k.
     */
    unsigned int rating_scale = 0;

    /// Standard deviation of the noise added to the true utility before it is turned into a score.
    double review_noise_sd = 0.0;

    /// The maximum number of neighbours used per recommendation, or 0 for all overlapping users.
    size_t neighbourhood = 0;

    /** If true, a newcomer who shares no reviewed good with any established user treats the whole
     * established population as neighbours of similarity 0, and so still gets recommendations.
     * This overrides the usual rule that a user without any similar neighbour gets no
     * recommendation; set it to false to apply that rule to newcomers too.  Established users
     * never use this fallback.
     */
    bool cold_start_fallback = true;

    /** The base random seed; run r of an experiment uses `seed + r`.  0 means the seed is taken from
     * the RECSIM_RNG_SEED environment variable or, if unset, from std::random_device.
     */
    std::uint64_t seed = 20;

    /// The maximum number of runs to execute concurrently; 0 runs everything in the calling thread.
    unsigned long threads = 0;

    /** Checks every parameter.
     *
     * \throws ConfigurationError naming the first parameter found out of range.
     */
    void validate() const;
};

}
