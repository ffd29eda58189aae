#include <recsim/algorithms.hpp>
#include <algorithm>
#include <numeric>

namespace recsim {

std::vector<good_t> popularity_ranking(const std::vector<size_t> &counts) {
    std::vector<good_t> order(counts.size());
    std::iota(order.begin(), order.end(), good_t{0});
    std::stable_sort(order.begin(), order.end(), [&counts](good_t a, good_t b) {
            return counts[a] > counts[b]; });
    return order;
}

std::vector<good_t> top_goods(const std::vector<size_t> &counts, size_t n) {
    auto order = popularity_ranking(counts);
    if (order.size() > n) order.resize(n);
    return order;
}

std::vector<good_t> bottom_goods(const std::vector<size_t> &counts, size_t n) {
    std::vector<good_t> order(counts.size());
    std::iota(order.begin(), order.end(), good_t{0});
    std::stable_sort(order.begin(), order.end(), [&counts](good_t a, good_t b) {
            return counts[a] < counts[b]; });
    if (order.size() > n) order.resize(n);
    return order;
}

std::vector<good_t> best_goods(const Eigen::RowVectorXd &values, size_t k) {
    std::vector<good_t> order(values.size());
    std::iota(order.begin(), order.end(), good_t{0});
    std::stable_sort(order.begin(), order.end(), [&values](good_t a, good_t b) {
            return values[a] > values[b]; });
    if (order.size() > k) order.resize(k);
    return order;
}

double best_sum(const Eigen::RowVectorXd &values, size_t k) {
    double sum = 0;
    for (auto g : best_goods(values, k)) sum += values[g];
    return sum;
}

}
