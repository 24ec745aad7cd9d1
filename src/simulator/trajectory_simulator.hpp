/**
 * @file trajectory_simulator.hpp
 * @brief Stepwise total-internal-reflection tracing of a single ray
 *
 * The TrajectorySimulator repeats intersect, reflect and termination tests
 * until the ray leaves the far end of the fiber, loses confinement at the
 * critical angle, or uses up its reflection budget.
 */

#pragma once

#include <cstdint>

#include "common/error_types.hpp"
#include "common/result.hpp"
#include "simulator/ray_state.hpp"
#include "simulator/trajectory.hpp"

class Fiber;
class Random;

/**
 * @brief Per-trace configuration
 */
struct TraceOptions
{
	uint32_t max_reflections {1000}; ///< Trajectory capacity, launch point included
	bool angle_elimination {true};   ///< Stop rays that violate the critical angle
	bool verbose {false};            ///< Print a termination explanation to stdout
	uint64_t ray_id {0};             ///< Identifier used in log records
};

/**
 * @class TrajectorySimulator
 * @brief Re-entrant tracer of independent rays through a read-only fiber
 *
 * The simulator holds only its options. `trace()` reads the fiber through a
 * const reference, works on its own copy of the ray, and draws diffusion
 * offsets from the caller's generator, so rays of a batch may be traced from
 * separate threads with separate generators. Failures are returned to the
 * caller and only mirrored into the debug log, so a batch driver reports
 * each aborted ray once.
 *
 * Per step:
 * 1. Intersect the ray with the fiber's core radius
 * 2. Beyond z_max (or axial ray): clip to z_max, stop with ReachedMaxLength
 * 3. Reflect about the wall normal, apply diffusion, record the point
 * 4. With angle elimination, stop with ExceededCriticalAngle when
 *    π/2 - |v·n| < asin(clad_n / core_n)
 * 5. Continue from the hit point with the reflected angles
 */
class TrajectorySimulator
{
public:
	explicit TrajectorySimulator(TraceOptions options = {}) : options_(options) {}

	/**
	 * @brief Trace one ray until it terminates
	 *
	 * @param fiber Fiber geometry and indices
	 * @param ray Launch state (copied; the caller's ray is left unchanged)
	 * @param rng Generator for diffusion offsets
	 * @return Result<Trajectory, SimulationError> Trajectory, or InvalidConfiguration
	 *         (zero budget, clad_n > core_n), InvalidRayState (non-finite ray), or
	 *         DegenerateIntersection (ray cannot reach the wall)
	 */
	[[nodiscard]] Result<Trajectory, SimulationError> trace(const Fiber& fiber, RayState ray, Random& rng) const;

	[[nodiscard]] const TraceOptions& options() const noexcept { return options_; }

private:
	TraceOptions options_;
};
