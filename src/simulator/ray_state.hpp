/**
 * @file ray_state.hpp
 * @brief Position and propagation direction of a ray inside the fiber
 *
 * The direction is parameterized by an azimuth around the fiber axis and a
 * zenith measured from +z. The two angles are the source of truth: every
 * setter re-derives the unit direction vector from them.
 */

#pragma once

#include <glm/glm.hpp>

class Random;

/**
 * @brief Propagation angles in radians
 */
struct Angles
{
	double azimuth {0.0}; ///< Rotation around the fiber axis, in (-π, π]
	double zenith {0.0};  ///< Angle to the +z axis, [0, π/2) for forward rays
};

class RayState
{
public:
	RayState() = default;
	RayState(double azimuth, double zenith, const glm::dvec3& position);

	/**
	 * @brief Replace angles and position at once
	 */
	void set_values(double azimuth, double zenith, const glm::dvec3& position);

	/**
	 * @brief Explicit start position
	 * @return The new position
	 */
	const glm::dvec3& set_start_point(double x = 0.0, double y = 0.0, double z = 0.0);

	/**
	 * @brief Explicit propagation angles (radians)
	 */
	void set_angles(double azimuth, double zenith);

	/**
	 * @brief Random start point at z = 0
	 *
	 * The polar angle is drawn from [0, π) and the radius from [0, radius),
	 * so only the upper half disk (y >= 0) is covered.
	 *
	 * @param radius Upper bound of the sampled radius (meters)
	 * @param rng Caller-owned generator
	 * @return The new position
	 */
	const glm::dvec3& generate_start_point(double radius, Random& rng);

	/**
	 * @brief Random propagation angles
	 *
	 * Zenith is drawn from [0, max_zenith_degrees], azimuth from [0, 360)
	 * degrees; both are stored in radians.
	 *
	 * @param max_zenith_degrees Half-angle of the launch cone (degrees)
	 * @param rng Caller-owned generator
	 * @return The new angles (radians)
	 */
	Angles generate_angles(double max_zenith_degrees, Random& rng);

	/**
	 * @brief Inverse of the angle-to-direction mapping
	 *
	 * zenith = acos(v.z). A zero zenith (axis-aligned ray) has azimuth 0 by
	 * definition; otherwise the azimuth sign follows the transverse y sign.
	 */
	[[nodiscard]] static Angles angles_from_direction(const glm::dvec3& v);

	[[nodiscard]] double azimuth() const noexcept { return azimuth_; }
	[[nodiscard]] double zenith() const noexcept { return zenith_; }
	[[nodiscard]] Angles angles() const noexcept { return {azimuth_, zenith_}; }
	[[nodiscard]] const glm::dvec3& position() const noexcept { return position_; }
	[[nodiscard]] const glm::dvec3& direction() const noexcept { return direction_; }

	/// Ray parallel to the fiber axis (never reaches the wall)
	[[nodiscard]] bool is_axial() const noexcept { return zenith_ == 0.0; }

	/// All angles and coordinates are finite numbers
	[[nodiscard]] bool is_finite() const noexcept;

private:
	void update_direction();

	double azimuth_ {0.0};
	double zenith_ {0.0};
	glm::dvec3 position_ {0.0};
	glm::dvec3 direction_ {0.0, 0.0, 1.0};
};
