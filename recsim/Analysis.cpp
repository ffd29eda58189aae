#include <recsim/Analysis.hpp>
#include <recsim/Simulation.hpp>
#include <recsim/algorithms.hpp>
#include <recsim/random/util.hpp>
#include <recsim/debug.hpp>
#include <algorithm>
#include <cmath>

namespace recsim {

Analysis::Analysis(const Config &config, const Strategies &strategies)
    : config_{config}, strategies_{strategies}, agent_{config_, strategies_}
{}

boost::optional<double> Analysis::ratio(double num, double den) {
    if (den == 0) return boost::none;
    return num / den;
}

std::vector<size_t> Analysis::popularityLevels() const {
    std::set<size_t> levels{1, (config_.top_n + 3) / 4, (config_.top_n + 1) / 2, config_.top_n};
    return std::vector<size_t>(levels.begin(), levels.end());
}

size_t Analysis::oracleGoods() const {
    auto per_tick = static_cast<size_t>(std::floor(config_.starting_budget / (config_.search_price + config_.consume_price)));
    return std::min(config_.matrix_size, per_tick * config_.ticks);
}

void Analysis::popularityMetrics(Metrics &m, const std::string &prefix, const std::vector<good_t> &ranking,
        const Consumption &members, const Eigen::MatrixXd &true_utility) const {
    for (auto n : popularityLevels()) {
        std::vector<good_t> top(ranking.begin(), ranking.begin() + std::min(n, ranking.size()));
        size_t any = 0, positive = 0, all = 0;
        for (const auto &member : members) {
            size_t hits = 0;
            bool all_positive = true;
            for (auto g : top) {
                if (member.second.count(g)) {
                    hits++;
                    if (not (true_utility(member.first, g) > 0)) all_positive = false;
                }
            }
            if (hits > 0) {
                any++;
                if (all_positive) positive++;
            }
            if (hits == top.size()) all++;
        }
        std::string key = prefix + "top" + std::to_string(n) + ".";
        m[key + "any"] = ratio(any, members.size());
        m[key + "any_positive"] = ratio(positive, any);
        m[key + "any_mixed"] = ratio(any - positive, any);
        m[key + "all"] = ratio(all, members.size());
    }
}

Metrics Analysis::population(const MatrixStore &store, const std::vector<User> &users) const {
    Metrics m;
    double max = 0, actual = 0;
    size_t consuming = 0, well_served = 0;
    Consumption everyone, optimal;
    for (const auto &u : users) {
        max += u.optimalUtility();
        actual += u.actualUtility();
        everyone.emplace_back(u.id(), u.consumedGoods());
        if (u.consumedGoods().empty()) continue;
        consuming++;
        if (u.actualUtility() >= config_.well_served_threshold * u.optimalUtility()) well_served++;
        if (u.actualUtility() >= config_.optimal_ratio_cutoff * u.optimalUtility())
            optimal.emplace_back(u.id(), u.consumedGoods());
    }

    m["utility.max"] = max;
    m["utility.actual"] = actual;
    m["utility.received"] = ratio(actual, max);
    m["users.count"] = double(users.size());
    m["users.consuming"] = double(consuming);
    m["users.idle"] = double(users.size() - consuming);
    m["users.well_served"] = ratio(well_served, consuming);
    m["reviews.total"] = double(store.totalReviews());

    auto ranking = popularity_ranking(store.popularity());
    popularityMetrics(m, "popular.", ranking, everyone, store.utility().true_utility);
    m["optimal_users.count"] = double(optimal.size());
    popularityMetrics(m, "optimal_users.popular.", ranking, optimal, store.utility().true_utility);
    return m;
}

Metrics Analysis::oracle(const MatrixStore &store) const {
    Metrics m;
    const auto &utility = store.utility().true_utility;
    size_t k = oracleGoods();
    Consumption members;
    std::vector<size_t> counts(store.goods(), 0);
    double total = 0;
    for (user_t u = 0; u < store.users(); u++) {
        auto best = best_goods(utility.row(u), k);
        for (auto g : best) {
            counts[g]++;
            total += utility(u, g);
        }
        members.emplace_back(u, std::set<good_t>(best.begin(), best.end()));
    }
    m["oracle.goods_per_user"] = double(k);
    m["oracle.utility"] = total;
    popularityMetrics(m, "oracle.popular.", popularity_ranking(counts), members, utility);
    return m;
}

Metrics Analysis::coldStart(const MatrixStore &frozen, random::rng_t &rng) const {
    MatrixStore newcomers(MatrixStore::generateUtilityMatrix(config_.new_users, frozen.goods(), config_.utility, rng));
    std::vector<User> users;
    users.reserve(config_.new_users);
    for (user_t u = 0; u < config_.new_users; u++) users.emplace_back(u, config_.starting_budget);

    auto counts = frozen.popularity();
    auto top = top_goods(counts, config_.top_n);
    auto bottom = bottom_goods(counts, config_.top_n);
    std::set<good_t> top_set(top.begin(), top.end()), bottom_set(bottom.begin(), bottom.end());

    size_t recommended_top = 0, recommended_bottom = 0;
    for (tick_t t = 0; t < config_.ticks; t++) {
        for (auto &user : users) {
            user.resetForTick(config_.starting_budget);
            auto activity = agent_.runTick(user, newcomers, frozen, rng, config_.cold_start_fallback);
            for (const auto &r : activity.recommendations) {
                if (not r.affordable) continue;
                if (top_set.count(r.good)) recommended_top++;
                if (bottom_set.count(r.good)) recommended_bottom++;
            }
        }
    }

    const auto &utility = newcomers.utility().true_utility;
    auto ranking = popularity_ranking(counts);
    double top_consumed = 0, optimal = 0, actual = 0, top_utility = 0, popular_utility = 0, control = 0;
    for (const auto &user : users) {
        size_t k = user.consumedGoods().size();
        size_t hits = 0;
        for (auto g : top) {
            top_utility += utility(user.id(), g);
            if (user.consumedGoods().count(g)) hits++;
        }
        top_consumed += double(hits) / top.size();
        optimal += user.optimalUtility();
        actual += user.actualUtility();
        for (size_t i = 0; i < k; i++) popular_utility += utility(user.id(), ranking[i]);
        for (auto g : random::sample(rng, frozen.goods(), k)) control += utility(user.id(), g);
    }

    double count = users.size();
    Metrics m;
    m["new_users.top_consumed"] = top_consumed / count;
    m["new_users.recommended_top"] = double(recommended_top);
    m["new_users.recommended_bottom"] = double(recommended_bottom);
    m["new_users.top_vs_bottom"] = ratio(recommended_top, recommended_bottom);
    m["new_users.optimal_utility"] = optimal / count;
    m["new_users.top_utility"] = top_utility / count;
    m["new_users.popular_utility"] = popular_utility / count;
    m["new_users.actual_utility"] = actual / count;
    m["new_users.received"] = ratio(actual, optimal);
    m["new_users.reviews"] = double(newcomers.totalReviews());
    m["control.actual_utility"] = control / count;
    m["control.advantage"] = (actual - control) / count;

    RECSIM_DBG("cold start: " << newcomers.totalReviews() << " newcomer reviews, " << recommended_top <<
            " top and " << recommended_bottom << " bottom recommendations");
    return m;
}

Metrics Analysis::analyze(const Simulation &sim, random::rng_t &rng) const {
    Metrics m = population(sim.store(), sim.users());
    for (auto &kv : oracle(sim.store())) m.insert(kv);
    for (auto &kv : coldStart(sim.store(), rng)) m.insert(kv);
    return m;
}

void Analysis::print(std::ostream &os, const Metrics &metrics) {
    for (const auto &kv : metrics) {
        os << kv.first << ": ";
        if (kv.second) os << *kv.second;
        else os << "undefined";
        os << "\n";
    }
}

}
