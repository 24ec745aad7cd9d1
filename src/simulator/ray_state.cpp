#include "ray_state.hpp"

#include <algorithm>
#include <cmath>

#include "math/math.hpp"
#include "math/random.hpp"

RayState::RayState(double azimuth, double zenith, const glm::dvec3& position) :
	azimuth_(azimuth), zenith_(zenith), position_(position) {
	update_direction();
}

void RayState::set_values(double azimuth, double zenith, const glm::dvec3& position) {
	azimuth_ = azimuth;
	zenith_ = zenith;
	position_ = position;
	update_direction();
}

const glm::dvec3& RayState::set_start_point(double x, double y, double z) {
	position_ = glm::dvec3(x, y, z);
	return position_;
}

void RayState::set_angles(double azimuth, double zenith) {
	azimuth_ = azimuth;
	zenith_ = zenith;
	update_direction();
}

const glm::dvec3& RayState::generate_start_point(double radius, Random& rng) {
	const double phi = rng.next() * MathConstants::PI;
	const double r = rng.next() * radius;
	position_ = glm::dvec3(r * std::cos(phi), r * std::sin(phi), 0.0);
	return position_;
}

Angles RayState::generate_angles(double max_zenith_degrees, Random& rng) {
	// Draw order (zenith, then azimuth) fixes the meaning of a seeded stream
	const double zenith = GeometricUtils::deg_to_rad(rng.next() * max_zenith_degrees);
	const double azimuth = GeometricUtils::deg_to_rad(rng.next() * 360.0);
	set_angles(azimuth, zenith);
	return {azimuth_, zenith_};
}

Angles RayState::angles_from_direction(const glm::dvec3& v) {
	const double zenith = std::acos(std::clamp(v.z, -1.0, 1.0));
	const double transverse = std::sqrt(v.x * v.x + v.y * v.y);
	if (zenith == 0.0 || transverse == 0.0) {
		return {0.0, zenith};
	}

	const double cos_az = std::clamp(v.x / transverse, -1.0, 1.0);
	const double sin_az = v.y / transverse;
	const double azimuth = sin_az > 0.0 ? std::acos(cos_az) : -std::acos(cos_az);
	return {azimuth, zenith};
}

bool RayState::is_finite() const noexcept {
	return std::isfinite(azimuth_) && std::isfinite(zenith_)
		&& std::isfinite(position_.x) && std::isfinite(position_.y) && std::isfinite(position_.z);
}

void RayState::update_direction() {
	direction_ = GeometricUtils::direction_from_angles(azimuth_, zenith_);
}
