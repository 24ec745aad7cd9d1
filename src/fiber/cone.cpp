#include "cone.hpp"

#include <cmath>
#include <sstream>

#include "common/error_handler.hpp"
#include "math/math.hpp"

Cone::Cone(double z_max, double base_r, double top_r, double angle, double core_n, double clad_n,
		   std::optional<double> diffusion) noexcept :
	Fiber(core_n, clad_n, z_max, diffusion), base_r_(base_r), top_r_(top_r), angle_(angle), c_(std::tan(angle)) {
}

Result<Cone, ConfigError> Cone::create(double z_max,
									   double base_r,
									   double top_r,
									   double core_n,
									   double clad_n,
									   std::optional<double> diffusion) {
	if (!validate_positive(z_max, "fiber length", "Cone")
		|| !validate_positive(base_r, "base radius", "Cone")
		|| !validate_indices(core_n, clad_n, "Cone")
		|| !validate_diffusion(diffusion, "Cone")) {
		return Result<Cone, ConfigError>::error(ConfigError::InvalidValue);
	}

	if (!std::isfinite(top_r) || top_r < 0.0) {
		std::ostringstream oss;
		oss << "Invalid top radius=" << top_r << ". Must be >= 0";
		REPORT_COMPONENT_ERROR("Cone", "create", ErrorMessage::format(ConfigError::InvalidValue, oss.str()));
		return Result<Cone, ConfigError>::error(ConfigError::InvalidValue);
	}

	const double sin_angle = (base_r - top_r) / z_max;
	if (sin_angle < -1.0 || sin_angle > 1.0) {
		std::ostringstream oss;
		oss << "radius difference " << (base_r - top_r) << " exceeds fiber length " << z_max;
		REPORT_COMPONENT_ERROR("Cone", "create", ErrorMessage::format(ConfigError::GeometryError, oss.str()));
		return Result<Cone, ConfigError>::error(ConfigError::GeometryError);
	}

	// The normal divides by tan(angle); an untapered cone is a Cylinder
	if (GeometricUtils::approximately_zero(sin_angle)) {
		REPORT_COMPONENT_ERROR("Cone", "create",
							   ErrorMessage::format(ConfigError::GeometryError, "base and top radii are equal"));
		return Result<Cone, ConfigError>::error(ConfigError::GeometryError);
	}

	return Result<Cone, ConfigError>::ok(Cone(z_max, base_r, top_r, std::asin(sin_angle), core_n, clad_n, diffusion));
}

Result<Cone, ConfigError> Cone::with_geometry(double z_max, double base_r, double top_r) const {
	return create(z_max, base_r, top_r, core_n(), clad_n(), diffusion());
}

Result<Cone, ConfigError> Cone::with_refractive_indices(double core_n, double clad_n) const {
	return create(z_max(), base_r_, top_r_, core_n, clad_n, diffusion());
}

glm::dvec3 Cone::normal_at(const glm::dvec3& point) const {
	const double z = -c_ * c_ * (point.z - base_r_ / c_);
	const glm::dvec3 n(point.x, point.y, z);
	return -n / glm::length(n);
}

double Cone::radius_at(double z) const {
	return base_r_ - z * std::sin(angle_);
}
