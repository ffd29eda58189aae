#include <recsim/Config.hpp>
#include <cmath>
#include <string>

namespace recsim {

namespace {
void require(bool ok, const std::string &what) {
    if (not ok) throw ConfigurationError("Invalid configuration: " + what);
}
bool positive(double v) { return std::isfinite(v) and v > 0; }
bool nonnegative(double v) { return std::isfinite(v) and v >= 0; }
bool fraction(double v) { return v >= 0 and v <= 1; }
}

void Config::validate() const {
    require(matrix_size >= 1, "matrix_size must be at least 1");
    require(ticks >= 1, "ticks must be at least 1");
    require(experiments >= 1, "experiments must be at least 1");
    require(positive(search_price), "search_price must be positive");
    require(positive(consume_price), "consume_price must be positive");
    require(positive(starting_budget), "starting_budget must be positive");
    require(fraction(well_served_threshold), "well_served_threshold must be in [0,1]");
    require(fraction(optimal_ratio_cutoff), "optimal_ratio_cutoff must be in [0,1]");
    require(top_n >= 1 and top_n <= matrix_size, "top_n must be between 1 and matrix_size");
    require(new_users >= 1, "new_users must be at least 1");
    require(initial_reviews <= matrix_size, "initial_reviews cannot exceed matrix_size");
    require(std::isfinite(utility.mean), "utility.mean must be finite");
    require(nonnegative(utility.sd), "utility.sd must be non-negative");
    require(std::isfinite(utility.noise_mean), "utility.noise_mean must be finite");
    require(nonnegative(utility.noise_sd), "utility.noise_sd must be non-negative");
    require(std::isfinite(consumption_cutoff), "consumption_cutoff must be finite");
    require(rating_scale == 0 or rating_scale >= 2, "rating_scale must be 0 (ternary) or at least 2");
    require(rating_scale == 0 or utility.sd > 0, "a scaled rating_scale requires a positive utility.sd");
    require(nonnegative(review_noise_sd), "review_noise_sd must be non-negative");
}

}
