#include <recsim/random/rng.hpp>
#include <recsim/debug.hpp>
#include <cstdlib>
#include <random>
#include <string>

namespace recsim { namespace random {

rng_t::result_type initial_seed(rng_t::result_type configured) {
    if (configured != 0) return configured;

    // No configured seed: check to see if the RECSIM_RNG_SEED environment variable is given
    const char *envseed = std::getenv("RECSIM_RNG_SEED");
    if (envseed) {
        std::string seedstr(envseed);
        if (seedstr != "") {
            rng_t::result_type env_seed = std::stoull(seedstr); // Could throw (don't catch it)
            RECSIM_DBG("using RECSIM_RNG_SEED=" << env_seed);
            return env_seed;
        }
    }

    // No (or empty) RECSIM_RNG_SEED: get a random seed from the OS
    rng_t::result_type device_seed = std::random_device{}();
    RECSIM_DBG("using random_device seed " << device_seed);
    return device_seed;
}

}}
