#pragma once
#include <recsim/Config.hpp>
#include <recsim/Similarity.hpp>
#include <recsim/ConsumptionRule.hpp>
#include <recsim/ReviewRule.hpp>
#include <memory>

namespace recsim {

/** The pluggable pieces of a simulation, injected at construction.  Strategies are immutable and
 * held through shared pointers, so a single Strategies object can be shared by every run of an
 * Experiment, including runs executing concurrently: implementations must therefore not modify
 * shared state from their const methods.
 */
struct Strategies {
    /// How alike two users are
    std::shared_ptr<const Similarity> similarity;
    /// Whether a user consumes a recommended good
    std::shared_ptr<const ConsumptionRule> consumption;
    /// How a consumed good is scored
    std::shared_ptr<const ReviewRule> review;

    /** Returns the default strategies for the given configuration: a review::Ternary rule (or
     * review::Scaled if `rating_scale` is set), similarity::Agreement around that rule's neutral
     * score, and consumption::Cutoff at `consumption_cutoff`.
     */
    static Strategies defaults(const Config &config);

    /// \throws std::invalid_argument if any strategy is null.
    void check() const;
};

}
