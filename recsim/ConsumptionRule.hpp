#pragma once
#include <functional>

namespace recsim {

/** Namespace for all specific recsim::ConsumptionRule implementations. */
namespace consumption {}

/** Base class for consumption rules, which decide from a recommended good's expected utility
 * whether the user wants to consume it.  Affordability is checked separately by the UserAgent.
 */
class ConsumptionRule {
    public:
        /// Virtual destructor
        virtual ~ConsumptionRule() = default;
        /// Returns true if a good with the given expected utility should be consumed.
        virtual bool consume(double expected_utility) const = 0;

        class Simple;
};

/** Very simple consumption rule that takes a function (or lambda) of the expected utility. */
class ConsumptionRule::Simple : public ConsumptionRule {
    public:
        /// Constructs a ConsumptionRule::Simple from a decision function.
        Simple(std::function<bool(double)> f) : f_(std::move(f)) {}
        /// Dispatches to the function passed to the constructor.
        bool consume(double expected_utility) const override { return f_(expected_utility); }
    private:
        std::function<bool(double)> f_;
};

namespace consumption {

/// Consumes any good whose expected utility is strictly above a fixed cutoff.
class Cutoff : public ConsumptionRule {
    public:
        /// Constructs a rule with the given cutoff
        explicit Cutoff(double cutoff = 0.0) : cutoff_{cutoff} {}
        bool consume(double expected_utility) const override { return expected_utility > cutoff_; }
        /// The cutoff value
        double cutoff() const { return cutoff_; }
    private:
        const double cutoff_;
};

}

}
