#pragma once
#include <recsim/types.hpp>
#include <Eigen/Core>
#include <vector>

/** \file recsim/algorithms.hpp ranking helpers
 *
 * Small ranking algorithms shared by the agents and the analysis.  All of them break ties toward
 * the lower good index, so results are fully deterministic.
 */

namespace recsim {

/** Returns every good index ordered by decreasing `counts`, ties going to the lower index.  The
 * first N elements are the "top N" goods.
 */
std::vector<good_t> popularity_ranking(const std::vector<size_t> &counts);

/** Returns the `n` goods with the most reviews according to `counts` (fewer if there are not `n`
 * goods), most popular first.
 */
std::vector<good_t> top_goods(const std::vector<size_t> &counts, size_t n);

/** Returns the `n` goods with the fewest reviews according to `counts`, least popular first; ties
 * go to the lower index.
 */
std::vector<good_t> bottom_goods(const std::vector<size_t> &counts, size_t n);

/** Returns the indices of the `k` largest values in `values`, largest first, ties going to the
 * lower index.  If `k` exceeds the number of values, every index is returned.
 */
std::vector<good_t> best_goods(const Eigen::RowVectorXd &values, size_t k);

/// Returns the sum of the `k` largest values in `values` (0 if `k` is 0).
double best_sum(const Eigen::RowVectorXd &values, size_t k);

}
