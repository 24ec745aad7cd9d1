#include "trajectory.hpp"

#include "math/math.hpp"

std::string to_string(TraceState state) {
	switch (state) {
		case TraceState::Propagating: return "propagating";
		case TraceState::ReachedMaxLength: return "z_max";
		case TraceState::ExceededCriticalAngle: return "critical_angle";
		case TraceState::ExceededReflectionBudget: return "max_reflections";
	}
	return "unknown";
}

double Trajectory::path_length() const {
	double total_length = 0.0;
	for (std::size_t i = 1; i < count_; ++i) {
		total_length += glm::length(points_[i] - points_[i - 1]);
	}
	return total_length;
}

void Trajectory::record(std::size_t index, const glm::dvec3& point, double azimuth, double zenith, double incidence) {
	points_[index] = point;
	angles_[index] = AngleRecord {GeometricUtils::rad_to_deg(azimuth),
								  GeometricUtils::rad_to_deg(zenith),
								  GeometricUtils::rad_to_deg(incidence)};
}
