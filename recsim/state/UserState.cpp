#include <recsim/state/UserState.hpp>
#include <recsim/User.hpp>
#include <recsim/MatrixStore.hpp>
#include <cmath>

namespace recsim { namespace state {

UserState::UserState(const User &user, const MatrixStore &store)
    : id{user.id()}, reviewed{0}, review_sum{0},
    actual_utility{user.actualUtility()}, optimal_utility{user.optimalUtility()}
{
    reviews.reserve(store.goods());
    for (good_t g = 0; g < store.goods(); g++) {
        double r = store.review(id, g);
        reviews.push_back(r);
        if (not std::isnan(r)) {
            reviewed++;
            review_sum += r;
        }
    }
}

std::ostream& operator<<(std::ostream &os, const UserState &s) {
    os << "User " << s.id << " reviews: [";
    for (double r : s.reviews) {
        if (std::isnan(r)) os << " .";
        else os << " " << r;
    }
    return os << " ] = " << s.review_sum << " -> " << s.actual_utility << " (" << s.optimal_utility << ")";
}

}}
