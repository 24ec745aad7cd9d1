/**
 * @file trajectory.hpp
 * @brief Recorded path of one ray: reflection points, angles and termination
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <glm/glm.hpp>

/**
 * @enum TraceState
 * @brief Stepping state of a ray; every finished trace holds a terminal state
 */
enum class TraceState
{
	Propagating,             ///< Still bouncing inside the core
	ReachedMaxLength,        ///< Crossed the far end of the fiber at z_max
	ExceededCriticalAngle,   ///< Incidence no longer allows total internal reflection
	ExceededReflectionBudget ///< Step budget used up before any other termination
};

/**
 * @brief Short label of a trace state ("z_max", "critical_angle", ...)
 */
std::string to_string(TraceState state);

/**
 * @brief Angles recorded at one trajectory point, in degrees
 */
struct AngleRecord
{
	double azimuth {0.0};
	double zenith {0.0};
	double incidence {0.0};
};

/**
 * @class Trajectory
 * @brief Fixed-capacity record of one traced ray
 *
 * Points and angle records hold `capacity()` entries; entries from `count()`
 * onwards stay zero. Entry 0 is the launch point with the launch angles and
 * an incidence of 0. Only TrajectorySimulator fills a trajectory.
 */
class Trajectory
{
	friend class TrajectorySimulator;

public:
	[[nodiscard]] const std::vector<glm::dvec3>& points() const noexcept { return points_; }
	[[nodiscard]] const std::vector<AngleRecord>& angles() const noexcept { return angles_; }

	/// Populated prefix of points(), launch point included
	[[nodiscard]] std::span<const glm::dvec3> recorded_points() const noexcept {
		return std::span<const glm::dvec3>(points_).first(count_);
	}

	/// Populated prefix of angles()
	[[nodiscard]] std::span<const AngleRecord> recorded_angles() const noexcept {
		return std::span<const AngleRecord>(angles_).first(count_);
	}

	[[nodiscard]] std::size_t count() const noexcept { return count_; }
	[[nodiscard]] std::size_t capacity() const noexcept { return points_.size(); }
	[[nodiscard]] TraceState termination() const noexcept { return termination_; }

	/// Position where the ray stopped
	[[nodiscard]] const glm::dvec3& end_point() const { return points_.at(count_ - 1); }

	/// Sum of segment lengths between recorded points (meters)
	[[nodiscard]] double path_length() const;

private:
	explicit Trajectory(std::size_t capacity) : points_(capacity, glm::dvec3(0.0)), angles_(capacity) {}

	void record(std::size_t index, const glm::dvec3& point, double azimuth, double zenith, double incidence);
	void finish(std::size_t count, TraceState state) noexcept {
		count_ = count;
		termination_ = state;
	}

	std::vector<glm::dvec3> points_;
	std::vector<AngleRecord> angles_;
	std::size_t count_ {0};
	TraceState termination_ {TraceState::Propagating};
};
