#include <recsim/MatrixStore.hpp>
#include <recsim/random/util.hpp>
#include <cmath>
#include <limits>
#include <string>

namespace recsim {

MatrixStore::already_reviewed_error::already_reviewed_error(user_t u, good_t g)
    : std::logic_error("User " + std::to_string(u) + " has already reviewed good " + std::to_string(g))
{}

MatrixStore::MatrixStore(UtilityMatrix utility)
    : utility_{std::move(utility)},
    reviews_{generateEmptyReviewMatrix(utility_.true_utility.rows(), utility_.true_utility.cols())}
{
    if (utility_.true_utility.rows() != utility_.expected_utility.rows() or
            utility_.true_utility.cols() != utility_.expected_utility.cols())
        throw std::invalid_argument("MatrixStore: true and expected utility tables must have the same shape");
}

UtilityMatrix MatrixStore::generateUtilityMatrix(size_t rows, size_t goods,
        const UtilityDistribution &dist, random::rng_t &rng) {
    UtilityMatrix u;
    u.true_utility.resize(rows, goods);
    u.expected_utility.resize(rows, goods);
    for (size_t i = 0; i < rows; i++) {
        for (size_t j = 0; j < goods; j++) {
            double t = random::rnormal(rng, dist.mean, dist.sd);
            u.true_utility(i, j) = t;
            u.expected_utility(i, j) = t + random::rnormal(rng, dist.noise_mean, dist.noise_sd);
        }
    }
    return u;
}

Eigen::MatrixXd MatrixStore::generateEmptyReviewMatrix(size_t rows, size_t goods) {
    return Eigen::MatrixXd::Constant(rows, goods, std::numeric_limits<double>::quiet_NaN());
}

void MatrixStore::checkIndex(user_t u, good_t g) const {
    if (u >= users()) throw std::out_of_range("MatrixStore: invalid user " + std::to_string(u));
    if (g >= goods()) throw std::out_of_range("MatrixStore: invalid good " + std::to_string(g));
}

void MatrixStore::recordReview(user_t u, good_t g, double score) {
    checkIndex(u, g);
    if (std::isnan(score)) throw std::invalid_argument("MatrixStore: review score cannot be NaN");
    if (not std::isnan(reviews_(u, g))) throw already_reviewed_error(u, g);
    reviews_(u, g) = score;
}

bool MatrixStore::hasReview(user_t u, good_t g) const {
    checkIndex(u, g);
    return not std::isnan(reviews_(u, g));
}

double MatrixStore::review(user_t u, good_t g) const {
    checkIndex(u, g);
    return reviews_(u, g);
}

std::map<good_t, double> MatrixStore::reviewsFor(user_t u) const {
    checkIndex(u, 0);
    std::map<good_t, double> r;
    for (good_t g = 0; g < goods(); g++) {
        if (not std::isnan(reviews_(u, g))) r.emplace(g, reviews_(u, g));
    }
    return r;
}

Eigen::RowVectorXd MatrixStore::reviewRow(user_t u) const {
    checkIndex(u, 0);
    return reviews_.row(u);
}

size_t MatrixStore::reviewCount(good_t g) const {
    checkIndex(0, g);
    size_t count = 0;
    for (size_t u = 0; u < users(); u++) {
        if (not std::isnan(reviews_(u, g))) count++;
    }
    return count;
}

std::vector<size_t> MatrixStore::popularity() const {
    std::vector<size_t> counts(goods(), 0);
    for (size_t g = 0; g < goods(); g++) {
        for (size_t u = 0; u < users(); u++) {
            if (not std::isnan(reviews_(u, g))) counts[g]++;
        }
    }
    return counts;
}

size_t MatrixStore::totalReviews() const {
    size_t total = 0;
    for (auto c : popularity()) total += c;
    return total;
}

double MatrixStore::trueUtility(user_t u, good_t g) const {
    checkIndex(u, g);
    return utility_.true_utility(u, g);
}

double MatrixStore::expectedUtility(user_t u, good_t g) const {
    checkIndex(u, g);
    return utility_.expected_utility(u, g);
}

}
