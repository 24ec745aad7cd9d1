#include "cylinder.hpp"

#include <cmath>

Result<Cylinder, ConfigError> Cylinder::create(double core_r,
											   double clad_r,
											   double core_n,
											   double clad_n,
											   double z_max,
											   std::optional<double> diffusion) {
	if (!validate_positive(core_r, "core radius", "Cylinder")
		|| !validate_positive(clad_r, "clad radius", "Cylinder")
		|| !validate_positive(z_max, "fiber length", "Cylinder")
		|| !validate_indices(core_n, clad_n, "Cylinder")
		|| !validate_diffusion(diffusion, "Cylinder")) {
		return Result<Cylinder, ConfigError>::error(ConfigError::InvalidValue);
	}

	return Result<Cylinder, ConfigError>::ok(Cylinder(core_r, clad_r, core_n, clad_n, z_max, diffusion));
}

Result<Cylinder, ConfigError> Cylinder::with_geometry(double core_r, double clad_r, double z_max) const {
	return create(core_r, clad_r, core_n(), clad_n(), z_max, diffusion());
}

Result<Cylinder, ConfigError> Cylinder::with_refractive_indices(double core_n, double clad_n) const {
	return create(core_r_, clad_r_, core_n, clad_n, z_max(), diffusion());
}

glm::dvec3 Cylinder::normal_at(const glm::dvec3& point) const {
	const double rho = std::sqrt(point.x * point.x + point.y * point.y);
	return -glm::dvec3(point.x, point.y, 0.0) / rho;
}
