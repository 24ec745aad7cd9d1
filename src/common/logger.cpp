/**
 * @file logger.cpp
 * @brief Implementation of debug logging system with compile-time optimization
 *
 * Implements the Logger singleton. All output is compiled in for `_DEBUG`
 * builds only, so release batch runs pay nothing for logging.
 */

#include "logger.hpp"

#include <ctime>

Logger& Logger::instance() {
	static Logger logger;
	return logger;
}

bool Logger::initialize(const std::string& csv_filepath, const std::string& log_filepath, bool enable_logging) {
#ifdef _DEBUG
	std::lock_guard<std::mutex> lock(mutex_);
	logging_enabled_ = enable_logging;

	if (!enable_logging) {
		return false;
	}

	if (csv_file_.is_open()) {
		csv_file_.close();
	}

	csv_file_.open(csv_filepath);
	if (csv_file_.is_open()) {
		csv_file_ << "RayID,Event,PosX,PosY,PosZ,Azimuth,Zenith,Incidence,Description\n";
		csv_file_.flush();
	}

	if (log_file_.is_open()) {
		log_file_.close();
	}

	log_file_.open(log_filepath);
	if (log_file_.is_open()) {
		log_file_ << "=== Fibertrace Debug Log ===\n";
		log_file_ << "Started at: " << get_timestamp() << "\n\n";
		log_file_.flush();
	}

	return csv_file_.is_open() && log_file_.is_open();
#else
	(void)csv_filepath;
	(void)log_filepath;
	(void)enable_logging;
	return false;
#endif
}

void Logger::log_ray_event(uint64_t ray_id,
						   const std::string& event,
						   const glm::dvec3& position,
						   double azimuth,
						   double zenith,
						   double incidence,
						   const std::string& description) {
#ifdef _DEBUG
	std::ostringstream row;
	row << ray_id << "," << event << ","
		<< position.x << "," << position.y << "," << position.z << ","
		<< azimuth << "," << zenith << "," << incidence << ","
		<< description << "\n";

	std::lock_guard<std::mutex> lock(mutex_);
	if (logging_enabled_ && csv_file_.is_open()) {
		csv_file_ << row.str();
		csv_file_.flush();
	}
#else
	(void)ray_id;
	(void)event;
	(void)position;
	(void)azimuth;
	(void)zenith;
	(void)incidence;
	(void)description;
#endif
}

void Logger::log_info(const std::string& message) {
	write_message("INFO", message);
}

void Logger::log_warning(const std::string& message) {
	write_message("WARN", message);
}

void Logger::log_error(const std::string& message) {
	write_message("ERROR", message);
}

void Logger::write_message(const char* level, const std::string& message) {
#ifdef _DEBUG
	std::lock_guard<std::mutex> lock(mutex_);
	if (logging_enabled_ && log_file_.is_open()) {
		log_file_ << "[" << get_timestamp() << "] " << level << ": " << message << "\n";
		log_file_.flush();
	}
#else
	(void)level;
	(void)message;
#endif
}

Logger::~Logger() {
#ifdef _DEBUG
	if (csv_file_.is_open()) {
		csv_file_.close();
	}
	if (log_file_.is_open()) {
		log_file_ << "\n=== Log ended at: " << get_timestamp() << " ===\n";
		log_file_.close();
	}
#endif
}

std::string Logger::get_timestamp() const {
	auto now = std::chrono::system_clock::now();
	auto time_t = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_time {};
#ifdef _WIN32
	localtime_s(&local_time, &time_t);
#else
	localtime_r(&time_t, &local_time);
#endif

	std::ostringstream oss;
	oss << std::put_time(&local_time, "%H:%M:%S");
	oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
	return oss.str();
}
