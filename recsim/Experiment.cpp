#include <recsim/Experiment.hpp>
#include <recsim/debug.hpp>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>

namespace recsim {

namespace {
const Config& validated(const Config &c) {
    c.validate();
    return c;
}
}

Experiment::Experiment(const Config &config, const Strategies &strategies)
    : config_{validated(config)}, strategies_{strategies}, max_threads_{config.threads}
{
    strategies_.check();
}

Experiment::Experiment(const Config &config)
    : Experiment(config, Strategies::defaults(validated(config)))
{}

void Experiment::maxThreads(unsigned long max_threads) {
    if (running_) throw std::runtime_error("Cannot change the number of threads during Experiment::run()");
    max_threads_ = max_threads;
}

void Experiment::onRunFinished(std::function<void(const RunResult&)> callback) {
    run_callbacks_.push_back(std::move(callback));
}

void Experiment::onTick(std::function<void(size_t, const TickProgress&)> callback) {
    tick_callbacks_.push_back(std::move(callback));
}

RunResult Experiment::runOne(size_t r, random::rng_t::result_type seed) {
    RunResult result;
    result.run = r;
    result.seed = seed;
    RECSIM_TDBG("run " << r << " starting with seed " << seed);
    try {
        Simulation sim(config_, strategies_, seed);
        if (not tick_callbacks_.empty()) {
            sim.onTick([this, r](const TickProgress &p) {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                for (auto &cb : tick_callbacks_) cb(r, p);
            });
        }
        sim.runAll();

        Analysis analysis(config_, strategies_);
        result.metrics = analysis.analyze(sim, sim.rng());
        result.reviews = sim.store().reviews();
        result.true_utility = sim.store().utility().true_utility;
        result.expected_utility = sim.store().utility().expected_utility;
        result.users = sim.userStates();
    }
    catch (const std::exception &e) {
        RECSIM_DBG("run " << r << " failed: " << e.what());
        result = RunResult();
        result.run = r;
        result.seed = seed;
        result.failed = true;
        result.error = e.what();
    }
    RECSIM_TDBG("run " << r << (result.failed ? " failed" : " finished"));

    std::lock_guard<std::mutex> lock(callback_mutex_);
    for (auto &cb : run_callbacks_) cb(result);
    return result;
}

std::vector<RunResult> Experiment::run() {
    if (running_.exchange(true)) throw std::runtime_error("Experiment::run() is already running");

    auto base = random::initial_seed(config_.seed);
    RECSIM_DBGVAR(base);
    std::vector<RunResult> results(config_.experiments);

    try {
        if (max_threads_ == 0) {
            for (size_t r = 0; r < config_.experiments; r++) results[r] = runOne(r, base + r);
        }
        else {
            std::atomic<size_t> next{0};
            // First exception escaping a worker (from a run callback); rethrown after the join
            std::exception_ptr error;
            std::mutex error_mutex;
            auto worker = [&]() {
                try {
                    for (size_t r = next++; r < config_.experiments; r = next++)
                        results[r] = runOne(r, base + r);
                }
                catch (...) {
                    next = config_.experiments;
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (not error) error = std::current_exception();
                }
            };
            size_t n = std::min<size_t>(max_threads_, config_.experiments);
            std::vector<std::thread> pool;
            pool.reserve(n);
            for (size_t i = 0; i < n; i++) pool.emplace_back(worker);
            for (auto &t : pool) t.join();
            if (error) std::rethrow_exception(error);
        }
    }
    catch (...) {
        running_ = false;
        throw;
    }

    running_ = false;
    return results;
}

Metrics Experiment::summarize(const std::vector<RunResult> &results) {
    std::map<std::string, std::pair<double, size_t>> sums;
    size_t failed = 0, succeeded = 0;
    for (const auto &r : results) {
        if (r.failed) { failed++; continue; }
        succeeded++;
        for (const auto &kv : r.metrics) {
            auto &s = sums[kv.first];
            if (kv.second) {
                s.first += *kv.second;
                s.second++;
            }
        }
    }

    Metrics m;
    for (const auto &kv : sums) {
        if (kv.second.second > 0) m[kv.first] = kv.second.first / kv.second.second;
        else m[kv.first] = boost::none;
    }
    m["runs.succeeded"] = double(succeeded);
    m["runs.failed"] = double(failed);
    return m;
}

}
