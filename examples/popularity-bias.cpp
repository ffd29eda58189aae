/// Runs the baseline popularity-bias experiment and prints the metrics of every run, followed by
/// their averages.

#include <recsim/Experiment.hpp>
#include <iostream>
#include <thread>

using namespace recsim;

int main() {

    Config config;
    // Use the hardware threads, if there are several
    unsigned long cores = std::thread::hardware_concurrency();
    config.threads = cores > 1 ? cores : 0;

    Experiment experiment(config);

    experiment.onRunFinished([](const RunResult &r) {
        std::cerr << "Run " << r.run << " (seed " << r.seed << ") " << (r.failed ? "failed: " + r.error : "done") << "\n";
    });

    auto results = experiment.run();

    for (const auto &r : results) {
        std::cout << "=== Run " << r.run << " ===\n";
        if (r.failed) {
            std::cout << "failed: " << r.error << "\n";
            continue;
        }
        for (const auto &u : r.users) std::cout << u << "\n";
        Analysis::print(std::cout, r.metrics);
    }

    std::cout << "=== Average over " << results.size() << " runs ===\n";
    Analysis::print(std::cout, Experiment::summarize(results));
}
