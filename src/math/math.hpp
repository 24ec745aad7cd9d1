/**
 * @file math.hpp
 * @brief Shared numerical constants and geometric helpers for ray tracing
 *
 * Provides the constants and small vector operations used by the fiber
 * geometry, ray state and trajectory code, built on GLM double precision
 * vectors and C++20 concepts.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <numbers>
#include <type_traits>

#include <glm/glm.hpp>

// C++20 concepts for type safety
template<typename T>
concept FloatingPoint = std::floating_point<T>;

/**
 * @namespace MathConstants
 * @brief Centralized mathematical and numerical constants
 *
 * All constants are `constexpr` for compile-time evaluation.
 */
namespace MathConstants
{
/// Mathematical constant π (3.14159...)
constexpr double PI = std::numbers::pi;

/// Mathematical constant 2π for full rotations
constexpr double TWO_PI = 2.0 * PI;

/// Mathematical constant π/2 for right angles
constexpr double HALF_PI = PI / 2.0;

/// Conversion factor from radians to degrees (180/π)
constexpr double RAD_TO_DEG = 180.0 / PI;

/// Conversion factor from degrees to radians (π/180)
constexpr double DEG_TO_RAD = PI / 180.0;

/// Numerical epsilon for geometric calculations and comparisons
constexpr double GEOMETRIC_EPSILON = 1e-12;

/// Relative tolerance on the intersection discriminant (scaled by R²)
constexpr double DISCRIMINANT_EPSILON = 1e-12;
} // namespace MathConstants

/**
 * @namespace GeometricUtils
 * @brief Geometric utility functions with C++20 concepts
 */
namespace GeometricUtils
{
/**
 * @brief Safe floating-point equality comparison with configurable tolerance
 *
 * @tparam T Floating-point type (enforced by FloatingPoint concept)
 * @param a First value to compare
 * @param b Second value to compare
 * @param epsilon Tolerance for equality comparison
 * @return true if values are approximately equal within tolerance
 */
template<FloatingPoint T>
constexpr bool approximately_equal(T a, T b, T epsilon = static_cast<T>(MathConstants::GEOMETRIC_EPSILON)) noexcept {
	return std::abs(a - b) <= epsilon;
}

/**
 * @brief Safe floating-point zero comparison with configurable tolerance
 */
template<FloatingPoint T>
constexpr bool approximately_zero(T value, T epsilon = static_cast<T>(MathConstants::GEOMETRIC_EPSILON)) noexcept {
	return std::abs(value) <= epsilon;
}

/**
 * @brief Mirror reflection of an incident vector about a unit normal
 */
inline glm::dvec3 reflect(const glm::dvec3& incident, const glm::dvec3& normal) {
	return incident - 2.0 * glm::dot(incident, normal) * normal;
}

constexpr double deg_to_rad(double degrees) noexcept {
	return degrees * MathConstants::DEG_TO_RAD;
}

constexpr double rad_to_deg(double radians) noexcept {
	return radians * MathConstants::RAD_TO_DEG;
}

/**
 * @brief Unit direction from spherical (azimuth, zenith) angles in radians
 *
 * The zenith is measured from the +z (fiber) axis.
 */
inline glm::dvec3 direction_from_angles(double azimuth, double zenith) {
	return glm::dvec3(std::sin(zenith) * std::cos(azimuth),
					  std::sin(zenith) * std::sin(azimuth),
					  std::cos(zenith));
}

} // namespace GeometricUtils
