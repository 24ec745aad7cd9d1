/**
 * @file fiber.hpp
 * @brief Waveguide boundary abstraction shared by the cylinder and the cone
 *
 * The trajectory simulator only sees this interface: the surface normal, the
 * radius handed to the intersector, the refractive indices, the axial limit
 * and the optional diffusion angle. Cylinder and Cone are its only
 * implementers.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

#include <glm/glm.hpp>

#include "common/error_types.hpp"
#include "common/result.hpp"

/**
 * @class Fiber
 * @brief Immutable description of a fiber core boundary and its indices
 *
 * Values are built through the validating factories of the concrete classes
 * and never change afterwards. Reconfiguring a fiber means building a new
 * value with `with_geometry()` or `with_refractive_indices()`.
 */
class Fiber
{
public:
	virtual ~Fiber() = default;

	/**
	 * @brief Unit surface normal at a boundary point, pointing toward the axis
	 * @param point Point assumed to lie on the core boundary (meters)
	 */
	[[nodiscard]] virtual glm::dvec3 normal_at(const glm::dvec3& point) const = 0;

	/**
	 * @brief Boundary radius at axial height z (meters)
	 */
	[[nodiscard]] virtual double radius_at(double z) const = 0;

	/**
	 * @brief Radius of the constant cross-section used for intersection
	 */
	[[nodiscard]] virtual double core_radius() const = 0;

	/// Short lowercase name of the shape ("cylinder", "cone")
	[[nodiscard]] virtual std::string kind() const = 0;

	[[nodiscard]] double core_n() const noexcept { return core_n_; }
	[[nodiscard]] double clad_n() const noexcept { return clad_n_; }
	[[nodiscard]] double z_max() const noexcept { return z_max_; }
	[[nodiscard]] const std::optional<double>& diffusion() const noexcept { return diffusion_; }

	/**
	 * @brief Core and cladding refractive indices, in that order
	 */
	[[nodiscard]] std::pair<double, double> refractive_indices() const noexcept { return {core_n_, clad_n_}; }

	/**
	 * @brief True when reflected directions are perturbed by a diffusion angle
	 */
	[[nodiscard]] bool is_diffuse() const noexcept { return diffusion_.has_value() && *diffusion_ != 0.0; }

	/**
	 * @brief Critical angle asin(clad_n / core_n) in radians
	 *
	 * Fails with ConfigError::InvalidValue when clad_n > core_n, since the
	 * core can then not confine any ray.
	 */
	[[nodiscard]] Result<double, ConfigError> critical_angle() const;

protected:
	Fiber(double core_n, double clad_n, double z_max, std::optional<double> diffusion) noexcept :
		core_n_(core_n), clad_n_(clad_n), z_max_(z_max), diffusion_(diffusion) {}

	Fiber(const Fiber&) = default;
	Fiber(Fiber&&) noexcept = default;
	Fiber& operator=(const Fiber&) = default;
	Fiber& operator=(Fiber&&) noexcept = default;

	// Shared factory validation; reports the offending parameter and returns false
	static bool validate_positive(double value, const std::string& param_name, const std::string& component);
	static bool validate_indices(double core_n, double clad_n, const std::string& component);
	static bool validate_diffusion(const std::optional<double>& diffusion, const std::string& component);

private:
	double core_n_ {0.0};                ///< Core refractive index
	double clad_n_ {0.0};                ///< Cladding refractive index
	double z_max_ {0.0};                 ///< Axial length of the fiber (meters)
	std::optional<double> diffusion_;    ///< Diffuse reflection half-width (radians)
};
