/**
 * @file logger.hpp
 * @brief Debug logging system for fiber ray tracing
 *
 * Writes a human-readable text log and a CSV file of per-ray events
 * (launch, reflection, termination). Logging is compiled in for debug builds
 * only; in release builds every call is a no-op. Writes from concurrent
 * traces are serialized, one line at a time.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

#include <glm/glm.hpp>

// Forward declarations
class Config;

/**
 * @class Logger
 * @brief Singleton logging system for trace debugging and analysis
 *
 * **Output Formats:**
 * - **CSV Files**: one row per ray event for spreadsheet analysis
 * - **Debug Logs**: timestamped text messages
 *
 * **Usage Pattern:**
 * ```cpp
 * FAST_LOG_RAY_EVENT(ray_id, "reflect", point, azimuth, zenith, incidence, "");
 * FAST_LOG_WARNING("Ray " + std::to_string(ray_id) + " missed the wall");
 * ```
 */
class Logger
{
public:
	static Logger& instance();

	/**
	 * @brief Initialize logging system with output file paths
	 *
	 * @param csv_filepath Path for CSV ray event data
	 * @param log_filepath Path for human-readable debug log file
	 * @param enable_logging True to enable file output
	 * @return true if both files are open for writing; false when logging is
	 *         disabled, compiled out, or a file could not be opened
	 */
	bool initialize(const std::string& csv_filepath, const std::string& log_filepath, bool enable_logging = true);

	/**
	 * @brief Log one ray event
	 *
	 * @param ray_id Identifier of the ray within its batch
	 * @param event Event type ("launch", "reflect", "z_max", "critical_angle", "budget")
	 * @param position Event position in fiber coordinates (meters)
	 * @param azimuth Azimuth after the event (radians)
	 * @param zenith Zenith after the event (radians)
	 * @param incidence Incidence value of the event
	 * @param description Free-form description (optional)
	 */
	void log_ray_event(uint64_t ray_id,
					   const std::string& event,
					   const glm::dvec3& position,
					   double azimuth,
					   double zenith,
					   double incidence,
					   const std::string& description = "");

	void log_info(const std::string& message);
	void log_warning(const std::string& message);
	void log_error(const std::string& message);

	~Logger();

#ifdef _DEBUG
	#define FAST_LOG_WARNING(msg) do { if (Config::get().log()) { Logger::instance().log_warning(msg); } } while(0)
	#define FAST_LOG_ERROR(msg) do { if (Config::get().log()) { Logger::instance().log_error(msg); } } while(0)
	#define FAST_LOG_RAY_EVENT(id, event, pos, az, zen, inc, desc) \
		do { if (Config::get().log()) { Logger::instance().log_ray_event(id, event, pos, az, zen, inc, desc); } } while(0)
#else
	// Complete no-ops in release build
	#define FAST_LOG_WARNING(msg) ((void)0)
	#define FAST_LOG_ERROR(msg) ((void)0)
	#define FAST_LOG_RAY_EVENT(id, event, pos, az, zen, inc, desc) ((void)0)
#endif

private:
	std::ofstream csv_file_;        ///< CSV format output stream for ray events
	std::ofstream log_file_;        ///< Text format output stream for log messages
	bool logging_enabled_ {false};  ///< Global logging enable/disable flag
	std::mutex mutex_;              ///< Guards both streams

	Logger() = default;

	void write_message(const char* level, const std::string& message);
	std::string get_timestamp() const;
};
