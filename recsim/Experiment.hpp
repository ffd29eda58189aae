#pragma once
#include <recsim/types.hpp>
#include <recsim/Config.hpp>
#include <recsim/Strategies.hpp>
#include <recsim/Simulation.hpp>
#include <recsim/Analysis.hpp>
#include <recsim/noncopyable.hpp>
#include <recsim/random/rng.hpp>
#include <recsim/state/UserState.hpp>
#include <Eigen/Core>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace recsim {

/// The outcome of one run of an Experiment.
struct RunResult {
    /// The run index, from 0
    size_t run = 0;
    /// The seed the run's generator was created with
    random::rng_t::result_type seed = 0;
    /// True if the run was aborted by an exception; the fields below are then empty
    bool failed = false;
    /// The exception message of a failed run
    std::string error;
    /// The final review matrix (NaN where absent)
    Eigen::MatrixXd reviews;
    /// The run's true utility table
    Eigen::MatrixXd true_utility;
    /// The run's expected utility table
    Eigen::MatrixXd expected_utility;
    /// The run's metrics
    Metrics metrics;
    /// The final state of every established user
    std::vector<state::UserState> users;
};

/** Runs a number of independent simulation runs with the same configuration and summarizes them.
 *
 * Every run has its own Simulation, MatrixStore and random number generator; run `r` is seeded with
 * `random::initial_seed(config.seed) + r`.  Runs share nothing mutable, so they may be executed
 * concurrently (see maxThreads()), and the results are identical whatever the number of threads.
 *
 * An exception escaping a run marks that run as failed (and is logged); the remaining runs are
 * unaffected.
 */
class Experiment final : private noncopyable {
    public:
        /** Creates an experiment.
         *
         * \throws ConfigurationError if `config` is invalid
         * \throws std::invalid_argument if a strategy is null
         */
        Experiment(const Config &config, const Strategies &strategies);

        /// Creates an experiment using Strategies::defaults(config).
        explicit Experiment(const Config &config);

        /** Sets the maximum number of threads to use for subsequent calls to run().  The default
         * is `config.threads`.  0 runs every simulation sequentially in the calling thread; any
         * other value starts up to that many worker threads (but never more than there are runs).
         *
         * \throws std::runtime_error if called during run()
         */
        void maxThreads(unsigned long max_threads);

        /// Returns the maximum number of threads run() will use.
        unsigned long maxThreads() const { return max_threads_; }

        /** Performs every run and returns the results, ordered by run index.  Per-run failures are
         * reported in the results rather than thrown.
         *
         * \throws std::runtime_error if run() is already running
         * \throws anything thrown by an onRunFinished() callback.  With threads, no new runs are
         * started once one throws, and the first such exception is rethrown after every worker has
         * finished.  An exception from an onTick() callback fails only its run.
         */
        std::vector<RunResult> run();

        /** Adds a callback invoked with each result as soon as its run finishes.  With threads,
         * callbacks may be invoked from worker threads, in any run order, but never concurrently.
         */
        void onRunFinished(std::function<void(const RunResult&)> callback);

        /** Adds a callback invoked after every tick of every run with the run index and the tick's
         * progress.  Subject to the same threading rules as onRunFinished().
         */
        void onTick(std::function<void(size_t, const TickProgress&)> callback);

        /// The experiment configuration
        const Config& config() const { return config_; }

        /** Averages every metric over the successful runs in which it is defined.  A metric defined
         * in none of them is undefined.  Adds `runs.succeeded` and `runs.failed`.
         */
        static Metrics summarize(const std::vector<RunResult> &results);

    private:
        RunResult runOne(size_t r, random::rng_t::result_type seed);

        const Config config_;
        const Strategies strategies_;
        unsigned long max_threads_;
        std::atomic<bool> running_{false};
        std::mutex callback_mutex_;
        std::vector<std::function<void(const RunResult&)>> run_callbacks_;
        std::vector<std::function<void(size_t, const TickProgress&)>> tick_callbacks_;
};

}
