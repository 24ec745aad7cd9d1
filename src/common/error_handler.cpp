/**
 * @file error_handler.cpp
 * @brief Centralized error handling and logging system implementation
 *
 * Console output goes to stderr for warnings and errors; every level is
 * mirrored into the Logger text file when logging is enabled.
 */

#include "error_handler.hpp"

#include <iostream>

#include "common/logger.hpp"

ErrorHandler& ErrorHandler::instance() {
	static ErrorHandler handler;
	return handler;
}

void ErrorHandler::report_info(const std::string& message) {
	dispatch(Level::Info, message, logging_enabled_);
}

void ErrorHandler::report_warning(const std::string& message) {
	dispatch(Level::Warning, message, logging_enabled_);
}

void ErrorHandler::report_error(const std::string& message) {
	dispatch(Level::Error, message, logging_enabled_);
}

void ErrorHandler::report_critical(const std::string& message) {
	dispatch(Level::Critical, message, logging_enabled_);
}

void ErrorHandler::report_error(const std::string& component,
								const std::string& operation,
								const std::string& details) {
	report_error(component + ": " + operation + " - " + details);
}

void ErrorHandler::report_warning(const std::string& component,
								  const std::string& operation,
								  const std::string& details) {
	report_warning(component + ": " + operation + " - " + details);
}

void ErrorHandler::report_config_error(const std::string& message) {
	// The logger is not initialized while the config is being read
	dispatch(Level::Error, message, false);
}

void ErrorHandler::dispatch(Level level, const std::string& message, bool to_log) {
	if (level != Level::Info) {
		std::cerr << level_name(level) << ": " << message << std::endl;
	}

	if (!to_log) {
		return;
	}

	switch (level) {
		case Level::Info: Logger::instance().log_info(message); break;
		case Level::Warning: Logger::instance().log_warning(message); break;
		case Level::Error:
		case Level::Critical: Logger::instance().log_error(message); break;
	}
}

const char* ErrorHandler::level_name(Level level) noexcept {
	switch (level) {
		case Level::Info: return "Info";
		case Level::Warning: return "Warning";
		case Level::Error: return "Error";
		case Level::Critical: return "CRITICAL";
	}
	return "Unknown";
}
