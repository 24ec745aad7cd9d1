/**
 * @file reflection.hpp
 * @brief Mirror reflection at the core boundary with optional diffuse spread
 */

#pragma once

#include <glm/glm.hpp>

#include "simulator/ray_state.hpp"

class Random;

/**
 * @brief Outcome of one boundary reflection
 */
struct Reflection
{
	Angles angles;          ///< Reflected propagation angles (radians)
	double incidence {0.0}; ///< Signed incidence cosine v·n of the incoming direction
};

/**
 * @class ReflectionLaw
 * @brief Specular reflection v' = v - 2(v·n)n re-expressed as angles
 */
class ReflectionLaw
{
public:
	/**
	 * @brief Reflect the ray direction about the boundary normal
	 *
	 * @param ray Incoming ray (its derived direction is reflected)
	 * @param normal Unit boundary normal at the hit point
	 * @return Reflection Reflected angles and the signed incidence v·n
	 */
	[[nodiscard]] static Reflection reflect(const RayState& ray, const glm::dvec3& normal);

	/**
	 * @brief Perturb reflected angles to model a scattering wall
	 *
	 * Azimuth, then zenith, each receive an independent offset drawn
	 * uniformly from [-diffusion, +diffusion].
	 */
	static void diffuse(Reflection& reflection, double diffusion, Random& rng);
};
