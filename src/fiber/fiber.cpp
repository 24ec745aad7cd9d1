#include "fiber.hpp"

#include <cmath>
#include <sstream>

#include "common/error_handler.hpp"

Result<double, ConfigError> Fiber::critical_angle() const {
	if (clad_n_ > core_n_) {
		std::ostringstream oss;
		oss << "clad index " << clad_n_ << " exceeds core index " << core_n_;
		REPORT_COMPONENT_ERROR(kind(), "critical_angle", ErrorMessage::format(ConfigError::InvalidValue, oss.str()));
		return Result<double, ConfigError>::error(ConfigError::InvalidValue);
	}
	return Result<double, ConfigError>::ok(std::asin(clad_n_ / core_n_));
}

bool Fiber::validate_positive(double value, const std::string& param_name, const std::string& component) {
	if (!std::isfinite(value) || value <= 0.0) {
		std::ostringstream oss;
		oss << "Invalid " << param_name << "=" << value << ". Must be > 0";
		REPORT_COMPONENT_ERROR(component, "create", ErrorMessage::format(ConfigError::InvalidValue, oss.str()));
		return false;
	}
	return true;
}

bool Fiber::validate_indices(double core_n, double clad_n, const std::string& component) {
	return validate_positive(core_n, "core refractive index", component)
		&& validate_positive(clad_n, "clad refractive index", component);
}

bool Fiber::validate_diffusion(const std::optional<double>& diffusion, const std::string& component) {
	if (diffusion && (!std::isfinite(*diffusion) || *diffusion < 0.0)) {
		std::ostringstream oss;
		oss << "Invalid diffusion angle=" << *diffusion << ". Must be >= 0";
		REPORT_COMPONENT_ERROR(component, "create", ErrorMessage::format(ConfigError::InvalidValue, oss.str()));
		return false;
	}
	return true;
}
