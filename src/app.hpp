/**
 * @file app.hpp
 * @brief Command line driver that traces a configured batch of rays
 *
 * The App class parses the command line, loads the TOML configuration, builds
 * the fiber, and traces each ray of the batch through the TrajectorySimulator
 * before printing a termination summary.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include "simulator/trajectory.hpp"

class Fiber;
class Random;
class RayState;
struct LaunchSettings;

/**
 * @brief Tally of a traced batch
 */
struct BatchSummary
{
	uint64_t rays {0};                      ///< Rays launched
	uint64_t failed {0};                    ///< Rays aborted with a SimulationError
	std::map<TraceState, uint64_t> reasons; ///< Completed rays per termination reason
	std::size_t recorded_points {0};        ///< Sum of Trajectory::count() over completed rays
	double path_length {0.0};               ///< Sum of Trajectory::path_length() over completed rays (meters)

	[[nodiscard]] uint64_t completed() const noexcept { return rays - failed; }
};

/**
 * @class App
 * @brief Headless batch controller for Fibertrace
 */
class App
{
public:
	App() = default;
	~App();

	/**
	 * @brief Initialize the application with command line arguments
	 *
	 * Parses command line options and loads the configuration file.
	 *
	 * @param argc Number of command line arguments
	 * @param argv Array of command line argument strings
	 * @return true if initialization succeeded, false otherwise
	 */
	bool initialize(int argc, char* argv[]);

	/**
	 * @brief Trace the configured batch and print its summary
	 * @return true if the fiber could be built and the batch ran
	 */
	bool run();

	void shutdown();

	[[nodiscard]] const BatchSummary& summary() const noexcept { return summary_; }

private:
	/// Set start point and angles of one ray from the [launch] settings
	static void launch_ray(RayState& ray, const LaunchSettings& launch, const Fiber& fiber, Random& rng);

	void print_summary() const;

	std::string config_file_;
	bool should_close_ {false};
	BatchSummary summary_;
};
