#include <cmath>
#include <iostream>

#include "fiber/cylinder.hpp"
#include "math/math.hpp"
#include "math/random.hpp"
#include "simulator/ray_state.hpp"
#include "simulator/reflection.hpp"

static bool near(const glm::dvec3& a, const glm::dvec3& b, double tol) {
	return glm::length(a - b) < tol;
}

int main() {
	auto cylinder_result = Cylinder::create(1e-4, 1.2e-4, 1.48, 1.46, 1.0);
	if (!cylinder_result.is_ok()) {
		std::cerr << "Cylinder creation failed\n";
		return 1;
	}
	const Cylinder& fiber = cylinder_result.value();

	// Mirror law about the wall normal, norm preserved, zenith unchanged on a cylinder
	{
		const double pairs[][2] = {{0.3, 0.4}, {-1.2, 0.15}, {2.5, 1.0}};
		for (const auto& p : pairs) {
			RayState ray(p[0], p[1], glm::dvec3(0.0));
			const glm::dvec3 wall(1e-4 * std::cos(p[0]), 1e-4 * std::sin(p[0]), 0.0);
			const glm::dvec3 normal = fiber.normal_at(wall);

			Reflection r = ReflectionLaw::reflect(ray, normal);
			const glm::dvec3 reflected = GeometricUtils::direction_from_angles(r.angles.azimuth, r.angles.zenith);
			const glm::dvec3 expected = ray.direction() - 2.0 * glm::dot(ray.direction(), normal) * normal;

			if (std::abs(glm::length(expected) - 1.0) > 1e-12) {
				std::cerr << "Reflection changed the vector norm\n";
				return 1;
			}
			if (!near(reflected, expected, 1e-9)) {
				std::cerr << "Reflected angles do not match the mirror direction (az=" << p[0] << ")\n";
				return 1;
			}
			if (std::abs(r.angles.zenith - p[1]) > 1e-9) {
				std::cerr << "Cylinder reflection changed zenith: " << p[1] << " -> " << r.angles.zenith << "\n";
				return 1;
			}
			// Outgoing ray against an inward normal
			if (!(r.incidence < 0.0) || std::abs(r.incidence + std::sin(p[1])) > 1e-12) {
				std::cerr << "Incidence should be -sin(zenith), got " << r.incidence << "\n";
				return 1;
			}
		}
	}

	// Diffusion offsets both angles by at most the half-width
	{
		Random rng(17);
		const double diffusion = 0.02;
		RayState ray(0.8, 0.3, glm::dvec3(0.0));
		const glm::dvec3 wall(1e-4 * std::cos(0.8), 1e-4 * std::sin(0.8), 0.0);
		const Reflection base = ReflectionLaw::reflect(ray, fiber.normal_at(wall));

		bool moved = false;
		for (int i = 0; i < 500; ++i) {
			Reflection r = base;
			ReflectionLaw::diffuse(r, diffusion, rng);
			const double d_az = r.angles.azimuth - base.angles.azimuth;
			const double d_zen = r.angles.zenith - base.angles.zenith;
			if (std::abs(d_az) > diffusion || std::abs(d_zen) > diffusion) {
				std::cerr << "Diffusion offset exceeds half-width (" << d_az << ", " << d_zen << ")\n";
				return 1;
			}
			if (r.incidence != base.incidence) {
				std::cerr << "Diffusion changed the recorded incidence\n";
				return 1;
			}
			moved = moved || d_az != 0.0 || d_zen != 0.0;
		}
		if (!moved) {
			std::cerr << "Diffusion never perturbed the angles\n";
			return 1;
		}
	}

	std::cout << "reflection OK\n";
	return 0;
}
