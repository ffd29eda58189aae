#pragma once
#include <recsim/random/rng.hpp>
#include <recsim/types.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <numeric>
#include <utility>
#include <vector>

namespace recsim { namespace random {

/** Generates a random draw from a normal distribution with the given mean and standard deviation.
 * A standard deviation of 0 returns the mean without consuming any randomness.
 */
inline double rnormal(rng_t &rng, double mean, double sd) {
    if (sd == 0) return mean;
    boost::random::normal_distribution<double> rnorm(mean, sd);
    return rnorm(rng);
}

/// Generates a random draw from a U[a,b) distribution.
inline double runiform(rng_t &rng, double a, double b) {
    boost::random::uniform_real_distribution<double> runif(a, b);
    return runif(rng);
}

/** Draws `k` distinct indices uniformly from `0` through `n-1` (a partial Fisher-Yates shuffle).
 * The returned indices are in draw order.  If `k >= n` every index is returned (shuffled).
 */
inline std::vector<good_t> sample(rng_t &rng, size_t n, size_t k) {
    std::vector<good_t> pool(n);
    std::iota(pool.begin(), pool.end(), good_t{0});
    if (k > n) k = n;
    for (size_t i = 0; i < k; i++) {
        boost::random::uniform_int_distribution<size_t> pick(i, n - 1);
        std::swap(pool[i], pool[pick(rng)]);
    }
    pool.resize(k);
    return pool;
}

}}
