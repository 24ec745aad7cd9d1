#include <iostream>
#include <sstream>
#include <string>

#include "common/error_handler.hpp"

// Runs fn with std::cerr redirected and returns what it wrote
template<typename Fn>
static std::string capture_stderr(Fn fn) {
	std::ostringstream captured;
	std::streambuf* previous = std::cerr.rdbuf(captured.rdbuf());
	fn();
	std::cerr.rdbuf(previous);
	return captured.str();
}

int main() {
	ErrorHandler& handler = ErrorHandler::instance();
	handler.set_logging_enabled(false);

	// Info stays off the console
	{
		std::string out = capture_stderr([] { REPORT_INFO("Tracing 10 rays"); });
		if (!out.empty()) {
			std::cerr << "Info message reached stderr: " << out << "\n";
			return 1;
		}
	}

	// Warnings and errors carry their level prefix
	{
		std::string warning = capture_stderr([] { REPORT_WARNING("no log files are written"); });
		if (warning != "Warning: no log files are written\n") {
			std::cerr << "Unexpected warning text: " << warning << "\n";
			return 1;
		}

		std::string error = capture_stderr([] { REPORT_ERROR("bad fiber"); });
		if (error != "Error: bad fiber\n") {
			std::cerr << "Unexpected error text: " << error << "\n";
			return 1;
		}

		std::string critical = capture_stderr([] { REPORT_CRITICAL("cannot build fiber"); });
		if (critical != "CRITICAL: cannot build fiber\n") {
			std::cerr << "Unexpected critical text: " << critical << "\n";
			return 1;
		}
	}

	// Component form names where the problem came from
	{
		std::string out = capture_stderr([] { REPORT_COMPONENT_WARNING("App", "run", "ray 7: degenerate"); });
		if (out != "Warning: App: run - ray 7: degenerate\n") {
			std::cerr << "Unexpected component warning: " << out << "\n";
			return 1;
		}

		std::string config = capture_stderr([] { REPORT_CONFIG_ERROR("Invalid rays=0"); });
		if (config != "Error: Invalid rays=0\n") {
			std::cerr << "Unexpected config error: " << config << "\n";
			return 1;
		}
	}

	std::cout << "error handler OK\n";
	return 0;
}
