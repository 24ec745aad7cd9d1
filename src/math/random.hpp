#pragma once

#include <cstdint>

#include <random>

/**
 * @brief Seedable random number generator using Mersenne Twister
 *
 * Every sampling operation of the tracer takes a Random& so that each ray of
 * a batch can be traced from its own reproducible stream.
 */
class Random
{
public:
	/**
	 * @brief Initialize random generator with seed
	 * @param seed Initial seed value (default: 0)
	 */
	explicit Random(long seed = 0) : rng_(static_cast<uint32_t>(seed)), distribution_(0.0, 1.0) {}

	/**
	 * @brief Re-seed the generator with new seed
	 * @param new_seed New seed value
	 */
	void seed(long new_seed) {
		rng_.seed(static_cast<uint32_t>(new_seed));
		distribution_.reset();
	}

	/**
	 * @brief Generate random number in [0,1) interval
	 * @return Random double in [0,1)
	 */
	double next() { return distribution_(rng_); }

	/**
	 * @brief Generate random number in [lo,hi) interval
	 */
	double uniform(double lo, double hi) { return lo + (hi - lo) * next(); }

private:
	std::mt19937 rng_;                                    // Mersenne Twister PRNG
	std::uniform_real_distribution<double> distribution_; // Uniform distribution [0,1)
};
