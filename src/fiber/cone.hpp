#pragma once

#include <optional>
#include <string>
#include <utility>

#include "fiber/fiber.hpp"

/**
 * @class Cone
 * @brief Tapered fiber whose radius changes linearly from base to top
 *
 * The taper half-angle is `asin((base_r - top_r) / z_max)` and `c` caches its
 * tangent for the normal computation. A negative angle describes a fiber
 * that widens along +z.
 */
class Cone final : public Fiber
{
public:
	/// Default indices of a silica taper
	static constexpr double DEFAULT_CORE_N = 1.445;
	static constexpr double DEFAULT_CLAD_N = 1.44;

	/**
	 * @brief Build a validated conical fiber
	 *
	 * @param z_max Fiber length (meters)
	 * @param base_r Radius at z = 0 (meters)
	 * @param top_r Radius at z = z_max (meters)
	 * @param core_n Core refractive index
	 * @param clad_n Cladding refractive index
	 * @param diffusion Diffuse reflection half-width (radians), none for a perfect mirror
	 * @return Result<Cone, ConfigError> Fiber, InvalidValue for non-positive parameters, or
	 *         GeometryError when |base_r - top_r| > z_max or the radii are equal
	 */
	static Result<Cone, ConfigError> create(double z_max,
											double base_r,
											double top_r,
											double core_n = DEFAULT_CORE_N,
											double clad_n = DEFAULT_CLAD_N,
											std::optional<double> diffusion = std::nullopt);

	/// New fiber with replaced length and radii; the taper angle is recomputed
	[[nodiscard]] Result<Cone, ConfigError> with_geometry(double z_max, double base_r, double top_r) const;

	/// New fiber with replaced refractive indices
	[[nodiscard]] Result<Cone, ConfigError> with_refractive_indices(double core_n, double clad_n) const;

	/**
	 * @brief Slanted-wall normal -(x, y, z') / |(x, y, z')| with z' = -c²(z - base_r / c)
	 */
	[[nodiscard]] glm::dvec3 normal_at(const glm::dvec3& point) const override;

	/**
	 * @brief Wall radius base_r - z sin(angle)
	 */
	[[nodiscard]] double radius_at(double z) const override;

	/**
	 * @brief Base radius; tracing intersects the base cross-section only
	 */
	[[nodiscard]] double core_radius() const override { return base_r_; }
	[[nodiscard]] std::string kind() const override { return "cone"; }

	[[nodiscard]] double base_radius() const noexcept { return base_r_; }
	[[nodiscard]] double top_radius() const noexcept { return top_r_; }
	[[nodiscard]] double angle() const noexcept { return angle_; }
	[[nodiscard]] double c() const noexcept { return c_; }

	/// Base and top radii, in that order
	[[nodiscard]] std::pair<double, double> radii() const noexcept { return {base_r_, top_r_}; }

private:
	Cone(double z_max, double base_r, double top_r, double angle, double core_n, double clad_n,
		 std::optional<double> diffusion) noexcept;

	double base_r_ {0.0}; ///< Radius at z = 0 (meters)
	double top_r_ {0.0};  ///< Radius at z = z_max (meters)
	double angle_ {0.0};  ///< Taper half-angle (radians)
	double c_ {0.0};      ///< tan(angle_)
};
