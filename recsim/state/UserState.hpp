#pragma once
#include <recsim/types.hpp>
#include <ostream>
#include <vector>

namespace recsim {

class User;
class MatrixStore;

/// Namespace for read-only snapshots of simulation state.
namespace state {

/** Class storing the state of a user at the end of a run, independent of the Simulation that
 * produced it.
 */
class UserState {
    public:
        /// Constructs a snapshot of `user`, whose reviews are in `store`.
        UserState(const User &user, const MatrixStore &store);

        /// The user's row index
        user_t id;

        /// The user's review row: one entry per good, NaN where the good was not reviewed
        std::vector<double> reviews;

        /// The number of goods reviewed (and consumed)
        size_t reviewed;

        /// The sum of the user's review scores
        double review_sum;

        /// The user's actual utility
        double actual_utility;

        /// The user's optimal utility
        double optimal_utility;
};

/** Writes the state as a single line, for example
 *
 *     User 3 reviews: [ 1 . -1 0 . ] = 0 -> 7.25 (9.5)
 *
 * where `.` marks an unreviewed good, `= 0` is the sum of the scores, and the last two values are
 * the actual and (parenthesized) optimal utility.
 */
std::ostream& operator<<(std::ostream &os, const UserState &s);

}}
