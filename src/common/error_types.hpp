/**
 * @file error_types.hpp
 * @brief Centralized error type definitions and message formatting utilities
 *
 * Provides structured error types for fiber configuration and ray tracing,
 * together with a formatter that renders them consistently for the console
 * and the log.
 */

#pragma once

#include <sstream>
#include <string>

/**
 * @enum ConfigError
 * @brief Configuration and fiber geometry error types
 *
 * Covers TOML parsing, validation, and inconsistent fiber geometry.
 */
enum class ConfigError
{
	FileNotFound,         ///< Configuration file not found at specified path
	ParseError,           ///< TOML syntax or structure parsing error
	ValidationError,      ///< Configuration values failed validation rules
	MissingRequiredField, ///< Required configuration field is missing
	InvalidValue,         ///< Value is outside its valid range (radius, length, index)
	GeometryError         ///< Fiber parameters are inconsistent (e.g. taper outside asin domain)
};

/**
 * @enum SimulationError
 * @brief Trajectory simulation error types
 *
 * A simulation error aborts the trace of one ray only.
 */
enum class SimulationError
{
	InvalidConfiguration,  ///< Trace options or refractive indices cannot define a critical angle
	InvalidRayState,       ///< Ray position or angles are not finite
	DegenerateIntersection ///< Ray line does not reach the core boundary from its position
};

/**
 * @class ErrorMessage
 * @brief Utility class for consistent error message formatting
 */
class ErrorMessage
{
public:
	static std::string format(ConfigError err, const std::string& context = "") {
		std::ostringstream oss;
		oss << "Config Error: ";

		switch (err) {
			case ConfigError::FileNotFound: oss << "Configuration file not found."; break;
			case ConfigError::ParseError: oss << "Failed to parse configuration file."; break;
			case ConfigError::ValidationError: oss << "Configuration validation failed."; break;
			case ConfigError::MissingRequiredField: oss << "Missing required configuration field."; break;
			case ConfigError::InvalidValue: oss << "Invalid configuration value."; break;
			case ConfigError::GeometryError: oss << "Fiber geometry error."; break;
		}

		if (!context.empty()) {
			oss << " - " << context;
		}

		return oss.str();
	}

	static std::string format(SimulationError err, const std::string& context = "") {
		std::ostringstream oss;
		oss << "Simulation Error: ";

		switch (err) {
			case SimulationError::InvalidConfiguration: oss << "Invalid trace configuration"; break;
			case SimulationError::InvalidRayState: oss << "Invalid ray state detected"; break;
			case SimulationError::DegenerateIntersection:
				oss << "Ray does not reach the core boundary";
				break;
		}

		if (!context.empty()) {
			oss << " - " << context;
		}

		return oss.str();
	}
};
