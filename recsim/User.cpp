#include <recsim/User.hpp>
#include <string>

namespace recsim {

void User::resetForTick(double budget) {
    budget_ = budget;
    recommended_.clear();
}

void User::pay(double price) {
    if (not canAfford(price))
        throw std::logic_error("User " + std::to_string(id_) + " cannot afford " + std::to_string(price) +
                " with budget " + std::to_string(budget_));
    budget_ -= price;
}

void User::consumed(good_t g, double true_utility) {
    if (not consumed_.insert(g).second)
        throw std::logic_error("User " + std::to_string(id_) + " has already consumed good " + std::to_string(g));
    actual_ += true_utility;
}

}
