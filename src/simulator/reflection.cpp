#include "reflection.hpp"

#include "math/math.hpp"
#include "math/random.hpp"

Reflection ReflectionLaw::reflect(const RayState& ray, const glm::dvec3& normal) {
	const glm::dvec3& incident = ray.direction();
	const glm::dvec3 reflected = GeometricUtils::reflect(incident, normal);

	return {RayState::angles_from_direction(reflected), glm::dot(normal, incident)};
}

void ReflectionLaw::diffuse(Reflection& reflection, double diffusion, Random& rng) {
	reflection.angles.azimuth += rng.uniform(-diffusion, diffusion);
	reflection.angles.zenith += rng.uniform(-diffusion, diffusion);
}
