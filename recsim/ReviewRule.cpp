#include <recsim/ReviewRule.hpp>
#include <recsim/random/util.hpp>
#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <stdexcept>

namespace recsim { namespace review {

Ternary::Ternary(double mean, double sd, double noise_sd) : mean_{mean}, sd_{sd}, noise_sd_{noise_sd} {}

double Ternary::score(double true_utility, random::rng_t &rng) const {
    double u = true_utility + random::rnormal(rng, 0.0, noise_sd_);
    if (u > mean_ + sd_) return 1;
    if (u < mean_ - sd_) return -1;
    return 0;
}

Scaled::Scaled(unsigned int k, double mean, double sd, double noise_sd)
    : k_{k}, mean_{mean}, sd_{sd}, noise_sd_{noise_sd}
{
    if (k_ < 2) throw std::domain_error("Scaled review rule requires a scale of at least 2");
    if (not (sd_ > 0)) throw std::domain_error("Scaled review rule requires a positive utility standard deviation");
}

double Scaled::score(double true_utility, random::rng_t &rng) const {
    double u = true_utility + random::rnormal(rng, 0.0, noise_sd_);
    boost::math::normal_distribution<double> dist(mean_, sd_);
    double q = boost::math::cdf(dist, u);
    double bucket = std::floor(q * k_) + 1;
    return bucket > k_ ? k_ : bucket;
}

}}
