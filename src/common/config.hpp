/**
 * @file config.hpp
 * @brief Global configuration management system
 *
 * The Config class provides centralized configuration for Fibertrace using
 * TOML files: the fiber geometry, trace options, launch settings of the ray
 * batch, and runtime flags.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <glm/glm.hpp>
#include <toml++/toml.h>

#include "simulator/trajectory_simulator.hpp"

// Forward declarations
class Fiber;
template<typename T, typename E> class Result;
enum class ConfigError;

/**
 * @brief Fiber parameters as read from the [fiber] table
 *
 * Only the fields of the selected shape are used: core/clad radius for a
 * cylinder, base/top radius for a cone.
 */
struct FiberSettings
{
	std::string type {"cylinder"};   ///< "cylinder" or "cone"
	double core_radius {0.0};        ///< Cylinder core radius (meters)
	double clad_radius {0.0};        ///< Cylinder cladding radius (meters)
	double base_radius {0.0};        ///< Cone radius at z = 0 (meters)
	double top_radius {0.0};         ///< Cone radius at z = length (meters)
	double length {0.0};             ///< Fiber length (meters)
	double core_index {0.0};         ///< Core refractive index
	double clad_index {0.0};         ///< Cladding refractive index
	std::optional<double> diffusion; ///< Diffuse reflection half-width (radians)
};

/**
 * @brief Launch parameters of the ray batch from the [launch] table
 */
struct LaunchSettings
{
	uint64_t rays {1};                ///< Number of rays to trace
	std::optional<double> max_zenith; ///< Random launch cone half-angle (degrees)
	bool random_start {true};         ///< Sample start points over the core cross-section
	glm::dvec3 position {0.0};        ///< Fixed start point when random_start is false (meters)
	double azimuth {0.0};             ///< Fixed azimuth when max_zenith is absent (degrees)
	double zenith {0.0};              ///< Fixed zenith when max_zenith is absent (degrees)
};

/**
 * @class Config
 * @brief Singleton configuration management system with TOML support
 *
 * **Configuration File Structure:**
 * ```toml
 * [general]
 * log = false
 * seed = 42
 *
 * [fiber]
 * type = "cylinder"
 * core_radius = 1e-4
 * clad_radius = 1.2e-4
 * length = 1.0
 * core_index = 1.48
 * clad_index = 1.46
 *
 * [trace]
 * max_reflections = 1000
 * angle_elimination = true
 *
 * [launch]
 * rays = 100
 * max_zenith = 8.0
 * ```
 */
class Config
{
private:
	/// Singleton instance pointer (managed automatically)
	static std::unique_ptr<Config> instance_;
	/// Initialization state flag to prevent double-initialization
	static bool initialized_;

	// Runtime control flags
	bool log_ {false};          ///< Enable logging and progress messages
	std::optional<long> seed_;  ///< Fixed random seed for reproducible batches

	std::string config_filename_; ///< Path to loaded configuration file (for reference)

	FiberSettings fiber_;
	TraceOptions trace_;
	LaunchSettings launch_;

	// TOML parsing helper methods
	glm::dvec3 parse_vec3(const toml::array& arr) const;

	// Validation helper methods
	template<typename T>
	bool validate_range(T value, T min, T max, const std::string& param_name) const;
	bool validate_array_size(const toml::array& arr, size_t expected_size, const std::string& param_name) const;

	Result<void, ConfigError> parse_table(const toml::table& config);

public:
	Config(const Config&) = delete;
	Config& operator=(const Config&) = delete;

	/**
	 * @brief Initialize the global Config instance with defaults
	 */
	static void initialize();

	/**
	 * @brief Initialize the global Config instance with a config file
	 * @param config_file Path to the configuration file
	 * @return true if initialization and parsing succeeded, false otherwise
	 */
	static bool initialize(const std::string& config_file);

	static bool is_initialized();

	/**
	 * @brief Get the current config instance
	 *
	 * Before initialization a default-valued fallback instance is returned.
	 */
	static Config& get();

	/**
	 * @brief Reset the config service (for testing or shutdown)
	 */
	static void shutdown();

	[[nodiscard]] constexpr bool log() const noexcept { return log_; }
	[[nodiscard]] const std::optional<long>& seed() const noexcept { return seed_; }
	[[nodiscard]] const std::string& config_filename() const noexcept { return config_filename_; }
	[[nodiscard]] const FiberSettings& fiber() const noexcept { return fiber_; }
	[[nodiscard]] const TraceOptions& trace() const noexcept { return trace_; }
	[[nodiscard]] const LaunchSettings& launch() const noexcept { return launch_; }

	void set_log(bool log) noexcept { log_ = log; }

	/**
	 * @brief Build the configured fiber
	 * @return Result<std::unique_ptr<Fiber>, ConfigError> Cylinder or Cone, or the
	 *         factory's validation error
	 */
	[[nodiscard]] Result<std::unique_ptr<Fiber>, ConfigError> make_fiber() const;

	// Configuration parsing with structured error handling
	Result<void, ConfigError> parse_config_file(const std::string& filename);
	Result<void, ConfigError> parse_config_string(std::string_view document);

	// TOML parsing methods
	bool parse_general_config(const toml::table& config);
	Result<void, ConfigError> parse_fiber_config(const toml::table& config);
	bool parse_trace_config(const toml::table& config);
	bool parse_launch_config(const toml::table& config);

private:
	// Private constructor for singleton
	Config() = default;
};
