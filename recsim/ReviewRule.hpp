#pragma once
#include <recsim/random/rng.hpp>
#include <functional>

namespace recsim {

/** Namespace for all specific recsim::ReviewRule implementations. */
namespace review {}

/** Base class for review rules, which turn the true utility a user received from a good into the
 * review score they record for it.
 */
class ReviewRule {
    public:
        /// Virtual destructor
        virtual ~ReviewRule() = default;

        /** Returns the score for a good that gave the reviewing user `true_utility`.  `rng` is the
         * run's random number generator, for rules that add noise.
         */
        virtual double score(double true_utility, random::rng_t &rng) const = 0;

        /** Returns the neutral midpoint of the scale: scores above it are positive reviews, scores
         * below it negative reviews.
         */
        virtual double neutral() const = 0;

        class Simple;
};

/** Very simple review rule that takes a function (or lambda) of the true utility and returns the
 * score, together with the neutral midpoint of its scale.
 */
class ReviewRule::Simple : public ReviewRule {
    public:
        /// Constructs a ReviewRule::Simple from a scoring function and the neutral score.
        Simple(std::function<double(double)> f, double neutral = 0.0) : f_(std::move(f)), neutral_(neutral) {}
        /// Dispatches to the function passed to the constructor.
        double score(double true_utility, random::rng_t&) const override { return f_(true_utility); }
        /// Returns the neutral score passed to the constructor.
        double neutral() const override { return neutral_; }
    private:
        std::function<double(double)> f_;
        double neutral_;
};

namespace review {

/** The ternary -1/0/+1 scale.  A good whose (optionally noisy) utility is more than one standard
 * deviation above the utility mean scores +1; more than one standard deviation below scores -1;
 * anything in between scores 0.  The neutral midpoint is 0.
 */
class Ternary : public ReviewRule {
    public:
        /** Constructs a ternary rule.
         *
         * \param mean the utility distribution mean
         * \param sd the utility distribution standard deviation
         * \param noise_sd standard deviation of normal noise added to the utility before scoring
         */
        Ternary(double mean, double sd, double noise_sd = 0.0);
        double score(double true_utility, random::rng_t &rng) const override;
        double neutral() const override { return 0.0; }
    private:
        const double mean_, sd_, noise_sd_;
};

/** An integer 1 to k scale.  The (optionally noisy) utility's quantile under the utility
 * distribution is split into k equal-probability buckets, so that under the population
 * distribution every score is equally likely.  The neutral midpoint is \f$(k+1)/2\f$.
 */
class Scaled : public ReviewRule {
    public:
        /** Constructs a scaled rule.
         *
         * \throws std::domain_error if `k < 2` or `sd` is not positive.
         */
        Scaled(unsigned int k, double mean, double sd, double noise_sd = 0.0);
        double score(double true_utility, random::rng_t &rng) const override;
        double neutral() const override { return (k_ + 1) / 2.0; }
        /// The top of the scale
        unsigned int k() const { return k_; }
    private:
        const unsigned int k_;
        const double mean_, sd_, noise_sd_;
};

}

}
