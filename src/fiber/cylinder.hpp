#pragma once

#include <optional>
#include <string>
#include <utility>

#include "fiber/fiber.hpp"

/**
 * @class Cylinder
 * @brief Straight step-index fiber with a constant core radius
 *
 * The cladding radius is carried for the visualization side; the core radius
 * is assumed not to exceed it but this is not enforced.
 */
class Cylinder final : public Fiber
{
public:
	/**
	 * @brief Build a validated cylindrical fiber
	 *
	 * @param core_r Core radius (meters)
	 * @param clad_r Cladding radius (meters)
	 * @param core_n Core refractive index
	 * @param clad_n Cladding refractive index
	 * @param z_max Fiber length (meters)
	 * @param diffusion Diffuse reflection half-width (radians), none for a perfect mirror
	 * @return Result<Cylinder, ConfigError> Fiber, or InvalidValue for non-positive parameters
	 */
	static Result<Cylinder, ConfigError> create(double core_r,
												double clad_r,
												double core_n,
												double clad_n,
												double z_max,
												std::optional<double> diffusion = std::nullopt);

	/// New fiber with replaced radii and length; indices and diffusion are kept
	[[nodiscard]] Result<Cylinder, ConfigError> with_geometry(double core_r, double clad_r, double z_max) const;

	/// New fiber with replaced refractive indices
	[[nodiscard]] Result<Cylinder, ConfigError> with_refractive_indices(double core_n, double clad_n) const;

	/**
	 * @brief Radial normal -(x, y, 0) / sqrt(x² + y²), independent of z
	 */
	[[nodiscard]] glm::dvec3 normal_at(const glm::dvec3& point) const override;

	[[nodiscard]] double radius_at(double) const override { return core_r_; }
	[[nodiscard]] double core_radius() const override { return core_r_; }
	[[nodiscard]] std::string kind() const override { return "cylinder"; }

	[[nodiscard]] double clad_radius() const noexcept { return clad_r_; }

	/// Core and cladding radii, in that order
	[[nodiscard]] std::pair<double, double> radii() const noexcept { return {core_r_, clad_r_}; }

private:
	Cylinder(double core_r, double clad_r, double core_n, double clad_n, double z_max, std::optional<double> diffusion) noexcept :
		Fiber(core_n, clad_n, z_max, diffusion), core_r_(core_r), clad_r_(clad_r) {}

	double core_r_ {0.0}; ///< Core radius (meters)
	double clad_r_ {0.0}; ///< Cladding radius (meters)
};
