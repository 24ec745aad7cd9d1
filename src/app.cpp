#include "app.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <utility>

#include <cxxopts.hpp>

#include "common/config.hpp"
#include "common/error_handler.hpp"
#include "common/error_types.hpp"
#include "common/logger.hpp"
#include "common/result.hpp"
#include "fiber/fiber.hpp"
#include "math/math.hpp"
#include "math/random.hpp"
#include "simulator/ray_state.hpp"
#include "simulator/trajectory_simulator.hpp"

App::~App() {
	shutdown();
}

bool App::initialize(int argc, char* argv[]) {
	cxxopts::Options options("fibertrace", "Fibertrace - Ray tracing of total internal reflection in optical fibers");

	options.add_options()
		("c,config", "Configuration file path", cxxopts::value<std::string>())
		("l,log", "Enable logging of ray events and messages")
		("h,help", "Show help message");

	options.parse_positional({"config"});
	options.positional_help("[config_file]");

	try {
		auto result = options.parse(argc, argv);

		if (result.count("help")) {
			std::cout << options.help() << std::endl;
			should_close_ = true;
			return true;
		}

		if (!result.count("config")) {
			std::cerr << "Error: A configuration file is required" << std::endl;
			std::cerr << std::endl << options.help() << std::endl;
			return false;
		}
		config_file_ = result["config"].as<std::string>();

		if (!Config::initialize(config_file_)) {
			std::cerr << "Error: Failed to initialize configuration. Exiting." << std::endl;
			return false;
		}

		if (result.count("log")) {
			Config::get().set_log(true);
		}

		const bool log = Config::get().log();
		ErrorHandler::instance().set_logging_enabled(log);
		if (!Logger::instance().initialize("fibertrace_rays.csv", "fibertrace.log", log) && log) {
			REPORT_WARNING("Logging requested but no log files are written (logging is compiled into Debug builds only)");
		}

		return true;
	}
	catch (const cxxopts::exceptions::exception& e) {
		std::cerr << "Error parsing command line: " << e.what() << std::endl;
		std::cerr << std::endl << options.help() << std::endl;
		return false;
	}
}

bool App::run() {
	if (should_close_) {
		return true;
	}

	const Config& config = Config::get();

	auto fiber_result = config.make_fiber();
	if (fiber_result.is_error()) {
		REPORT_CRITICAL(ErrorMessage::format(fiber_result.error(), "Cannot build fiber"));
		return false;
	}
	std::unique_ptr<Fiber> fiber = std::move(fiber_result).value();

	long seed = config.seed().value_or(
		static_cast<long>(std::chrono::system_clock::now().time_since_epoch().count()));
	Random rng(seed);

	if (config.log()) {
		std::ostringstream oss;
		oss << "Tracing " << config.launch().rays << " rays through " << fiber->kind() << " fiber (seed " << seed
			<< ")";
		REPORT_INFO(oss.str());
	}

	summary_ = BatchSummary {};
	TraceOptions trace_options = config.trace();

	for (uint64_t ray_id = 0; ray_id < config.launch().rays; ++ray_id) {
		RayState ray;
		launch_ray(ray, config.launch(), *fiber, rng);

		trace_options.ray_id = ray_id;
		TrajectorySimulator simulator(trace_options);

		++summary_.rays;
		auto trace = simulator.trace(*fiber, ray, rng);
		if (trace.is_error()) {
			++summary_.failed;
			REPORT_COMPONENT_WARNING("App", "run",
									 "ray " + std::to_string(ray_id) + ": " + ErrorMessage::format(trace.error()));
			continue;
		}

		const Trajectory& trajectory = trace.value();
		++summary_.reasons[trajectory.termination()];
		summary_.recorded_points += trajectory.count();
		summary_.path_length += trajectory.path_length();
	}

	print_summary();
	return true;
}

void App::shutdown() {
	Config::shutdown();
}

void App::launch_ray(RayState& ray, const LaunchSettings& launch, const Fiber& fiber, Random& rng) {
	if (launch.random_start) {
		ray.generate_start_point(fiber.core_radius(), rng);
	}
	else {
		ray.set_start_point(launch.position.x, launch.position.y, launch.position.z);
	}

	if (launch.max_zenith) {
		ray.generate_angles(*launch.max_zenith, rng);
	}
	else {
		ray.set_angles(GeometricUtils::deg_to_rad(launch.azimuth), GeometricUtils::deg_to_rad(launch.zenith));
	}
}

void App::print_summary() const {
	std::cout << "Fiber:      " << Config::get().fiber().type << " (" << Config::get().config_filename() << ")"
			  << std::endl;
	std::cout << "Rays:       " << summary_.rays << std::endl;

	for (TraceState state : {TraceState::ReachedMaxLength, TraceState::ExceededCriticalAngle,
							 TraceState::ExceededReflectionBudget}) {
		auto it = summary_.reasons.find(state);
		uint64_t count = it == summary_.reasons.end() ? 0 : it->second;
		std::cout << "  " << std::left << std::setw(16) << to_string(state) << count << std::endl;
	}
	std::cout << "  " << std::left << std::setw(16) << "failed" << summary_.failed << std::endl;

	if (summary_.completed() > 0) {
		double completed = static_cast<double>(summary_.completed());
		std::cout << "Mean points:      " << static_cast<double>(summary_.recorded_points) / completed << std::endl;
		std::cout << "Mean path length: " << summary_.path_length / completed << " m" << std::endl;
	}
}
