#pragma once
#include <boost/random/mersenne_twister.hpp>
#include <recsim/noncopyable.hpp>

namespace recsim {
/// Namespace for random number generation and the random draws used by a simulation run
namespace random {

/** The recsim RNG class, currently boost::random::mt19937_64.  The wrapper class is non-copyable,
 * thus ensuring that a run's RNG isn't accidentally copied (which would silently duplicate its
 * random stream).
 *
 * There is no global generator: each simulation run owns its own rng_t, seeded explicitly, so that
 * runs executing in parallel remain reproducible.
 */
class rng_t : public boost::random::mt19937_64, private recsim::noncopyable {
    public:
        /// Constructs a generator with the mt19937_64 default seed
        rng_t() = default;
        /// Constructs a generator seeded with the given value
        explicit rng_t(result_type seed) : boost::random::mt19937_64(seed) {}
};

/** Resolves the base seed for a set of runs.  If `configured` is non-zero it is returned as is.
 * Otherwise the environment variable RECSIM_RNG_SEED is checked; if set and non-empty, its value
 * is used.  Otherwise a random seed is obtained from the operating system via std::random_device.
 *
 * \throws std::invalid_argument or std::out_of_range if RECSIM_RNG_SEED is set but is not a valid
 * unsigned integer.
 */
rng_t::result_type initial_seed(rng_t::result_type configured = 0);

}}
