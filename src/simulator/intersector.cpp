#include "intersector.hpp"

#include <cmath>
#include <sstream>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "math/math.hpp"
#include "simulator/ray_state.hpp"

Result<glm::dvec3, SimulationError> Intersector::intersect(const RayState& ray, double core_radius) {
	const glm::dvec3& start = ray.position();

	if (ray.is_axial()) {
		return Result<glm::dvec3, SimulationError>::ok(glm::dvec3(start.x, start.y, AXIAL_SENTINEL_Z));
	}

	const double cos_az = std::cos(ray.azimuth());
	const double sin_az = std::sin(ray.azimuth());
	const double radius_sq = core_radius * core_radius;

	const double gamma = cos_az * start.x + sin_az * start.y;
	double discriminant = gamma * gamma - start.x * start.x - start.y * start.y + radius_sq;

	// Grazing hits from a point on the wall round to a tiny negative value
	if (discriminant < 0.0 && discriminant > -MathConstants::DISCRIMINANT_EPSILON * radius_sq) {
		discriminant = 0.0;
	}

	if (!(discriminant >= 0.0)) {
		std::ostringstream oss;
		oss << "Discriminant " << discriminant << " at (" << start.x << ", " << start.y << ", " << start.z
			<< ") for radius " << core_radius;
		FAST_LOG_WARNING(ErrorMessage::format(SimulationError::DegenerateIntersection, oss.str()));
		return Result<glm::dvec3, SimulationError>::error(SimulationError::DegenerateIntersection);
	}

	const double t = -gamma + std::sqrt(discriminant);
	const double cot_zenith = std::cos(ray.zenith()) / std::sin(ray.zenith());

	return Result<glm::dvec3, SimulationError>::ok(
		glm::dvec3(start.x + cos_az * t, start.y + sin_az * t, start.z + cot_zenith * t));
}
