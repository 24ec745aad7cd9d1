/**
 * @file intersector.hpp
 * @brief Analytic ray / core-boundary intersection
 */

#pragma once

#include <glm/glm.hpp>

#include "common/error_types.hpp"
#include "common/result.hpp"

class RayState;

/**
 * @class Intersector
 * @brief Forward exit point of a ray from a cylinder of radius R about the z axis
 *
 * The transverse problem is a circle-line intersection in the xy plane along
 * (cos az, sin az); the transverse distance t of the larger root is then
 * lifted to 3D with the zenith cotangent:
 *
 *   gamma = cos(az) x0 + sin(az) y0
 *   t     = -gamma + sqrt(gamma² - x0² - y0² + R²)
 *   hit   = (x0 + cos(az) t, y0 + sin(az) t, z0 + cot(zenith) t)
 *
 * The same constant-radius solver serves cones, whose core_radius() is their
 * base radius.
 */
class Intersector
{
public:
	/// z returned for axis-parallel rays, which never reach the wall
	static constexpr double AXIAL_SENTINEL_Z = -1.0;

	/**
	 * @brief Next boundary point of the ray
	 *
	 * @param ray Current ray state
	 * @param core_radius Radius of the boundary cylinder (meters)
	 * @return Result<glm::dvec3, SimulationError> The intersection, (x0, y0, -1) for a
	 *         zero zenith, or DegenerateIntersection when the discriminant is negative
	 */
	[[nodiscard]] static Result<glm::dvec3, SimulationError> intersect(const RayState& ray, double core_radius);
};
