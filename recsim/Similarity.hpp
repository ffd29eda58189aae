#pragma once
#include <functional>
#include <vector>

namespace recsim {

/** Namespace for all specific recsim::Similarity implementations. */
namespace similarity {}

/** Base class for similarity strategies.  A strategy scores how alike two users are from their
 * reviews of the goods both of them have reviewed; higher values mean more similar.
 *
 * Implementations must be symmetric (swapping the arguments gives the same value) and must be
 * defined when only a single good is shared.  They are never called with zero shared goods: users
 * with no overlap are not neighbours at all.
 */
class Similarity {
    public:
        /// Virtual destructor
        virtual ~Similarity() = default;

        /** Returns the similarity of two users given their scores for the goods they have both
         * reviewed.  `a[i]` and `b[i]` are the two users' scores of the same good; both vectors have
         * the same, non-zero, length.
         */
        virtual double operator()(const std::vector<double> &a, const std::vector<double> &b) const = 0;

        class Simple;
};

/** Very simple similarity class that takes a function (or lambda) of the two shared score vectors
 * and returns the similarity.
 */
class Similarity::Simple : public Similarity {
    public:
        /** Constructs a Similarity::Simple object given a function (or lambda expression).  The
         * caller is responsible for the function being symmetric.
         */
        Simple(std::function<double(const std::vector<double>&, const std::vector<double>&)> f) : f_(std::move(f)) {}
        /// Dispatches to the function passed to the constructor.
        double operator()(const std::vector<double> &a, const std::vector<double> &b) const override { return f_(a, b); }
    private:
        std::function<double(const std::vector<double>&, const std::vector<double>&)> f_;
};

namespace similarity {

/** Agreement similarity: the number of shared goods that both users rated on the same side of the
 * review scale's neutral midpoint, i.e. shared likes plus shared dislikes.  Goods where either
 * user gave exactly the neutral score count for nothing.
 */
class Agreement : public Similarity {
    public:
        /// Constructs an Agreement similarity around the given neutral score.
        explicit Agreement(double neutral = 0.0) : neutral_{neutral} {}
        double operator()(const std::vector<double> &a, const std::vector<double> &b) const override;
        /// The neutral midpoint scores are compared against
        double neutral() const { return neutral_; }
    private:
        const double neutral_;
};

/// Distance similarity: minus the mean absolute difference between the users' shared scores.
class Distance : public Similarity {
    public:
        double operator()(const std::vector<double> &a, const std::vector<double> &b) const override;
};

}

}
