/**
 * @file trajectory_simulator.cpp
 * @brief Implementation of the single-ray stepping loop
 */

#include "trajectory_simulator.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

#include "common/config.hpp"
#include "common/error_types.hpp"
#include "common/logger.hpp"
#include "fiber/fiber.hpp"
#include "math/math.hpp"
#include "math/random.hpp"
#include "simulator/intersector.hpp"
#include "simulator/reflection.hpp"

Result<Trajectory, SimulationError> TrajectorySimulator::trace(const Fiber& fiber, RayState ray, Random& rng) const {
	using TraceResult = Result<Trajectory, SimulationError>;

	if (options_.max_reflections == 0) {
		FAST_LOG_ERROR(ErrorMessage::format(SimulationError::InvalidConfiguration, "max_reflections must be >= 1"));
		return TraceResult::error(SimulationError::InvalidConfiguration);
	}

	if (!ray.is_finite()) {
		FAST_LOG_ERROR(ErrorMessage::format(SimulationError::InvalidRayState,
											"ray " + std::to_string(options_.ray_id) + " has non-finite launch state"));
		return TraceResult::error(SimulationError::InvalidRayState);
	}

	auto critical = fiber.critical_angle();
	if (critical.is_error()) {
		return TraceResult::error(SimulationError::InvalidConfiguration);
	}
	const double termination_angle = critical.value();
	const double z_max = fiber.z_max();
	const uint32_t max_reflections = options_.max_reflections;

	Trajectory trajectory(max_reflections);
	trajectory.record(0, ray.position(), ray.azimuth(), ray.zenith(), 0.0);
	FAST_LOG_RAY_EVENT(options_.ray_id, "launch", ray.position(), ray.azimuth(), ray.zenith(), 0.0, fiber.kind());

	// Recorded at the exit point; before the first reflection it holds the launch zenith
	double incidence = ray.zenith();

	for (uint32_t i = 1; i < max_reflections; ++i) {
		auto hit = Intersector::intersect(ray, fiber.core_radius());
		if (hit.is_error()) {
			FAST_LOG_ERROR("Ray " + std::to_string(options_.ray_id) + " aborted at step " + std::to_string(i));
			return TraceResult::error(hit.error());
		}
		glm::dvec3 point = hit.value();

		// Axial rays carry the sentinel z; clipping along +z puts them at (x0, y0, z_max)
		if (ray.is_axial() || point.z > z_max) {
			const glm::dvec3& direction = ray.direction();
			point -= direction / direction.z * (point.z - z_max);

			trajectory.record(i, point, ray.azimuth(), ray.zenith(), std::abs(incidence));
			trajectory.finish(i + 1, TraceState::ReachedMaxLength);
			FAST_LOG_RAY_EVENT(options_.ray_id, "z_max", point, ray.azimuth(), ray.zenith(), std::abs(incidence), "");

			if (options_.verbose) {
				std::cout << "Ray reached z_max." << std::endl;
			}
			return TraceResult::ok(std::move(trajectory));
		}

		Reflection reflection = ReflectionLaw::reflect(ray, fiber.normal_at(point));
		if (fiber.is_diffuse()) {
			ReflectionLaw::diffuse(reflection, *fiber.diffusion(), rng);
		}

		if (!std::isfinite(reflection.angles.azimuth) || !std::isfinite(reflection.angles.zenith)
			|| !std::isfinite(reflection.incidence)) {
			std::ostringstream oss;
			oss << "ray " << options_.ray_id << " reflected to non-finite angles at (" << point.x << ", " << point.y
				<< ", " << point.z << ")";
			FAST_LOG_ERROR(ErrorMessage::format(SimulationError::InvalidRayState, oss.str()));
			return TraceResult::error(SimulationError::InvalidRayState);
		}

		incidence = reflection.incidence;
		trajectory.record(i, point, reflection.angles.azimuth, reflection.angles.zenith, std::abs(incidence));
		FAST_LOG_RAY_EVENT(options_.ray_id, "reflect", point, reflection.angles.azimuth, reflection.angles.zenith,
						   incidence, "");

		const double reflection_angle = MathConstants::HALF_PI - std::abs(incidence);
		if (options_.angle_elimination && reflection_angle < termination_angle) {
			trajectory.finish(i + 1, TraceState::ExceededCriticalAngle);
			FAST_LOG_RAY_EVENT(options_.ray_id, "critical_angle", point, reflection.angles.azimuth,
							   reflection.angles.zenith, incidence, "");

			if (options_.verbose) {
				std::cout << "Ray terminated, termination angle: " << GeometricUtils::rad_to_deg(termination_angle)
						  << " reflection angle: " << GeometricUtils::rad_to_deg(reflection_angle) << std::endl;
			}
			return TraceResult::ok(std::move(trajectory));
		}

		ray.set_values(reflection.angles.azimuth, reflection.angles.zenith, point);
	}

	trajectory.finish(max_reflections, TraceState::ExceededReflectionBudget);
	FAST_LOG_RAY_EVENT(options_.ray_id, "max_reflections", ray.position(), ray.azimuth(), ray.zenith(), incidence, "");

	if (options_.verbose) {
		std::cout << "Reflections exceeded " << max_reflections << std::endl;
	}
	return TraceResult::ok(std::move(trajectory));
}
