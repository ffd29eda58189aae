#include <recsim/SimilarityEngine.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace recsim {

SimilarityEngine::SimilarityEngine(std::shared_ptr<const Similarity> similarity, size_t neighbourhood)
    : similarity_{std::move(similarity)}, neighbourhood_{neighbourhood}
{
    if (not similarity_) throw std::invalid_argument("SimilarityEngine: similarity strategy cannot be null");
}

std::vector<Neighbour> SimilarityEngine::neighbours(const Eigen::RowVectorXd &target, const Eigen::MatrixXd &peers,
        boost::optional<user_t> exclude, bool population_fallback) const {
    if (target.size() != peers.cols())
        throw std::invalid_argument("SimilarityEngine: target and peer reviews cover different goods");

    std::vector<Neighbour> found;
    std::vector<double> a, b;
    for (user_t p = 0; p < peers.rows(); p++) {
        if (exclude and *exclude == p) continue;
        a.clear(); b.clear();
        for (Eigen::Index g = 0; g < target.size(); g++) {
            if (not std::isnan(target[g]) and not std::isnan(peers(p, g))) {
                a.push_back(target[g]);
                b.push_back(peers(p, g));
            }
        }
        if (a.empty()) continue;
        found.push_back({p, (*similarity_)(a, b), 0});
    }

    if (found.empty()) {
        if (population_fallback) {
            for (user_t p = 0; p < peers.rows(); p++) {
                if (not (exclude and *exclude == p)) found.push_back({p, 0.0, 0});
            }
        }
        return found;
    }

    std::stable_sort(found.begin(), found.end(), [](const Neighbour &x, const Neighbour &y) {
            return x.similarity > y.similarity; });

    if (neighbourhood_ > 0 and found.size() > neighbourhood_) found.resize(neighbourhood_);

    size_t rank = 0;
    for (size_t i = 1; i < found.size(); i++) {
        if (found[i].similarity != found[i-1].similarity) rank++;
        found[i].rank = rank;
    }

    return found;
}

}
