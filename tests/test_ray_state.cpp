#include <cmath>
#include <iostream>

#include "math/math.hpp"
#include "math/random.hpp"
#include "simulator/ray_state.hpp"

int main() {
	// Direction is a unit vector for any angle pair
	{
		const double azimuths[] = {0.0, 0.4, 1.9, -2.7, 3.1};
		const double zeniths[] = {0.0, 0.05, 0.6, 1.2, 1.5};
		for (double az : azimuths) {
			for (double zen : zeniths) {
				RayState ray(az, zen, glm::dvec3(0.0));
				const double norm = glm::length(ray.direction());
				if (std::abs(norm - 1.0) > 1e-12) {
					std::cerr << "Direction not unit (az=" << az << ", zen=" << zen << ", |v|=" << norm << ")\n";
					return 1;
				}
			}
		}
	}

	// Angles recovered from a direction match the angles that built it
	{
		const double pairs[][2] = {{0.7, 0.3}, {-2.0, 1.1}, {3.0, 0.5}, {-0.25, 0.01}};
		for (const auto& p : pairs) {
			RayState ray(p[0], p[1], glm::dvec3(0.0));
			Angles back = RayState::angles_from_direction(ray.direction());
			if (!GeometricUtils::approximately_equal(back.azimuth, p[0], 1e-9)
				|| !GeometricUtils::approximately_equal(back.zenith, p[1], 1e-9)) {
				std::cerr << "Angle round trip failed: (" << p[0] << ", " << p[1] << ") -> (" << back.azimuth
						  << ", " << back.zenith << ")\n";
				return 1;
			}
		}
	}

	// Axial direction reports azimuth 0
	{
		Angles axial = RayState::angles_from_direction(glm::dvec3(0.0, 0.0, 1.0));
		if (axial.azimuth != 0.0 || axial.zenith != 0.0) {
			std::cerr << "Axial direction should give (0, 0), got (" << axial.azimuth << ", " << axial.zenith << ")\n";
			return 1;
		}
		RayState ray(1.3, 0.0, glm::dvec3(0.0));
		if (!ray.is_axial()) {
			std::cerr << "Zero zenith ray not reported as axial\n";
			return 1;
		}
	}

	// Start points cover the upper half of the core disk at z = 0
	{
		const double radius = 1e-4;
		Random rng(3);
		RayState ray;
		for (int i = 0; i < 2000; ++i) {
			const glm::dvec3& p = ray.generate_start_point(radius, rng);
			const double rho = std::sqrt(p.x * p.x + p.y * p.y);
			if (p.z != 0.0 || p.y < 0.0 || rho >= radius) {
				std::cerr << "Start point outside half disk: (" << p.x << ", " << p.y << ", " << p.z << ")\n";
				return 1;
			}
		}
	}

	// Random angles stay inside the launch cone
	{
		const double max_zenith_deg = 12.0;
		Random rng(5);
		RayState ray;
		for (int i = 0; i < 2000; ++i) {
			Angles a = ray.generate_angles(max_zenith_deg, rng);
			if (a.zenith < 0.0 || a.zenith > GeometricUtils::deg_to_rad(max_zenith_deg)
				|| a.azimuth < 0.0 || a.azimuth >= MathConstants::TWO_PI) {
				std::cerr << "Generated angles out of range (az=" << a.azimuth << ", zen=" << a.zenith << ")\n";
				return 1;
			}
			if (ray.azimuth() != a.azimuth || ray.zenith() != a.zenith) {
				std::cerr << "Generated angles not stored on the ray\n";
				return 1;
			}
		}
	}

	// Same seed, same launch
	{
		Random rng_a(99);
		Random rng_b(99);
		RayState a;
		RayState b;
		for (int i = 0; i < 50; ++i) {
			a.generate_start_point(2e-4, rng_a);
			a.generate_angles(30.0, rng_a);
			b.generate_start_point(2e-4, rng_b);
			b.generate_angles(30.0, rng_b);
			if (a.position() != b.position() || a.azimuth() != b.azimuth() || a.zenith() != b.zenith()) {
				std::cerr << "Seeded launches diverged at draw " << i << "\n";
				return 1;
			}
		}

		rng_a.seed(99);
		RayState c;
		c.generate_start_point(2e-4, rng_a);
		Random rng_c(99);
		RayState d;
		d.generate_start_point(2e-4, rng_c);
		if (c.position() != d.position()) {
			std::cerr << "Reseeding did not restart the stream\n";
			return 1;
		}
	}

	// set_start_point leaves the angles alone
	{
		RayState ray(0.5, 0.2, glm::dvec3(0.0));
		const glm::dvec3& p = ray.set_start_point(1e-5, 2e-5);
		if (p != glm::dvec3(1e-5, 2e-5, 0.0) || ray.azimuth() != 0.5 || ray.zenith() != 0.2) {
			std::cerr << "set_start_point changed more than the position\n";
			return 1;
		}
	}

	std::cout << "ray state OK\n";
	return 0;
}
