#include <recsim/Strategies.hpp>
#include <stdexcept>

namespace recsim {

Strategies Strategies::defaults(const Config &config) {
    Strategies s;
    if (config.rating_scale == 0)
        s.review = std::make_shared<review::Ternary>(config.utility.mean, config.utility.sd, config.review_noise_sd);
    else
        s.review = std::make_shared<review::Scaled>(config.rating_scale, config.utility.mean, config.utility.sd, config.review_noise_sd);
    s.similarity = std::make_shared<similarity::Agreement>(s.review->neutral());
    s.consumption = std::make_shared<consumption::Cutoff>(config.consumption_cutoff);
    return s;
}

void Strategies::check() const {
    if (not similarity) throw std::invalid_argument("Strategies: similarity cannot be null");
    if (not consumption) throw std::invalid_argument("Strategies: consumption rule cannot be null");
    if (not review) throw std::invalid_argument("Strategies: review rule cannot be null");
}

}
