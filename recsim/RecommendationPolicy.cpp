#include <recsim/RecommendationPolicy.hpp>
#include <cmath>
#include <map>
#include <stdexcept>

namespace recsim {

boost::optional<good_t> RecommendationPolicy::recommend(const Eigen::RowVectorXd &target,
        const std::vector<Neighbour> &neighbours,
        const Eigen::MatrixXd &peer_reviews,
        const std::set<good_t> &already_recommended) const {
    if (target.size() != peer_reviews.cols())
        throw std::invalid_argument("RecommendationPolicy: target and peer reviews cover different goods");

    // Ordered by good, so that iteration below resolves ties toward the lowest index
    std::map<good_t, double> scores;
    for (const auto &n : neighbours) {
        double weight = 1.0 / (1.0 + n.rank);
        for (good_t g = 0; g < peer_reviews.cols(); g++) {
            double r = peer_reviews(n.user, g);
            if (std::isnan(r) or r <= neutral_) continue;
            if (not std::isnan(target[g]) or already_recommended.count(g)) continue;
            scores[g] += weight * (r - neutral_);
        }
    }

    boost::optional<good_t> best;
    double best_score = 0;
    for (const auto &s : scores) {
        if (not best or s.second > best_score) {
            best = s.first;
            best_score = s.second;
        }
    }
    return best;
}

}
