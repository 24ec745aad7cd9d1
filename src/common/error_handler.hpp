/**
 * @file error_handler.hpp
 * @brief Centralized error reporting for configuration and tracing
 *
 * Routes messages by severity: informational messages go to the log only,
 * warnings and errors go to stderr and to the log when logging is enabled.
 */

#pragma once

#include <string>

/**
 * @class ErrorHandler
 * @brief Singleton error reporting and logging system
 *
 * Usage examples:
 * @code
 * ErrorHandler::instance().report_error("Failed to load configuration");
 * ErrorHandler::instance().report_warning("Cone", "create", "taper half-angle exceeds 45 degrees");
 * @endcode
 */
class ErrorHandler
{
public:
	/**
	 * @enum Level
	 * @brief Error severity levels for message routing
	 */
	enum class Level
	{
		Info,    ///< Informational messages (log only, no console output)
		Warning, ///< Warnings (both console and log output)
		Error,   ///< Errors (both console and log output)
		Critical ///< Critical errors (immediate console + log output)
	};

	static ErrorHandler& instance();

	void report_info(const std::string& message);
	void report_warning(const std::string& message);
	void report_error(const std::string& message);
	void report_critical(const std::string& message);

	/**
	 * @brief Report error with structured context information
	 *
	 * @param component Component where the error occurred ("Cylinder", "Config", ...)
	 * @param operation Operation that failed
	 * @param details Detailed error description
	 */
	void report_error(const std::string& component, const std::string& operation, const std::string& details);
	void report_warning(const std::string& component, const std::string& operation, const std::string& details);

	/**
	 * @brief Report configuration-related errors (always to console)
	 *
	 * Configuration errors are shown even before logging is set up.
	 */
	void report_config_error(const std::string& message);

	void set_logging_enabled(bool enabled) { logging_enabled_ = enabled; }

private:
	ErrorHandler() = default;

	/// Console for warnings and above, log file for every level when enabled
	void dispatch(Level level, const std::string& message, bool to_log);

	static const char* level_name(Level level) noexcept;

	bool logging_enabled_ {false}; // Set by App during initialization
};

// Convenience macros for common patterns
#define REPORT_INFO(msg)     ErrorHandler::instance().report_info(msg)
#define REPORT_WARNING(msg)  ErrorHandler::instance().report_warning(msg)
#define REPORT_ERROR(msg)    ErrorHandler::instance().report_error(msg)
#define REPORT_CRITICAL(msg) ErrorHandler::instance().report_critical(msg)

// Formatted reporting macros
#define REPORT_COMPONENT_ERROR(comp, op, details)   ErrorHandler::instance().report_error(comp, op, details)
#define REPORT_COMPONENT_WARNING(comp, op, details) ErrorHandler::instance().report_warning(comp, op, details)

#define REPORT_CONFIG_ERROR(msg) ErrorHandler::instance().report_config_error(msg)
