#include "config.hpp"

#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

#include "common/error_handler.hpp"
#include "common/error_types.hpp"
#include "common/logger.hpp"
#include "common/result.hpp"
#include "fiber/cone.hpp"
#include "fiber/cylinder.hpp"

// Static member definitions
std::unique_ptr<Config> Config::instance_ = nullptr;
bool Config::initialized_ = false;

void Config::initialize() {
	if (!initialized_) {
		instance_ = std::unique_ptr<Config>(new Config());
		initialized_ = true;
	}
}

bool Config::initialize(const std::string& config_file) {
	if (!initialized_) {
		instance_ = std::unique_ptr<Config>(new Config());
		auto result = instance_->parse_config_file(config_file);
		if (!result.is_ok()) {
			REPORT_ERROR(ErrorMessage::format(result.error(), "Config initialization failed"));
			instance_.reset();
			return false;
		}
		initialized_ = true;
	}
	return true;
}

bool Config::is_initialized() {
	return initialized_;
}

Config& Config::get() {
	if (!initialized_ || !instance_) {
		// Default-valued fallback so that logging macros work before initialization.
		// Initialized once, also when first reached from several threads.
		static Config fallback;
		return fallback;
	}
	return *instance_;
}

void Config::shutdown() {
	instance_.reset();
	initialized_ = false;
}

Result<void, ConfigError> Config::parse_config_file(const std::string& filename) {
	if (!std::filesystem::exists(filename)) {
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::FileNotFound, filename));
		return Result<void, ConfigError>::error(ConfigError::FileNotFound);
	}

	try {
		config_filename_ = filename;
		toml::table config = toml::parse_file(filename);
		return parse_table(config);
	}
	catch (const toml::parse_error& err) {
		std::ostringstream oss;
		oss << err.description() << " at line " << err.source().begin.line;
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::ParseError, oss.str()));
		return Result<void, ConfigError>::error(ConfigError::ParseError);
	}
	catch (const std::exception& err) {
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::ParseError, err.what()));
		return Result<void, ConfigError>::error(ConfigError::ParseError);
	}
}

Result<void, ConfigError> Config::parse_config_string(std::string_view document) {
	try {
		toml::table config = toml::parse(document);
		return parse_table(config);
	}
	catch (const toml::parse_error& err) {
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::ParseError, std::string(err.description())));
		return Result<void, ConfigError>::error(ConfigError::ParseError);
	}
	catch (const std::exception& err) {
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::ParseError, err.what()));
		return Result<void, ConfigError>::error(ConfigError::ParseError);
	}
}

Result<void, ConfigError> Config::parse_table(const toml::table& config) {
	if (!parse_general_config(config)) {
		return Result<void, ConfigError>::error(ConfigError::ValidationError);
	}

	auto fiber_result = parse_fiber_config(config);
	if (fiber_result.is_error()) {
		return Result<void, ConfigError>::error(fiber_result.error());
	}

	if (!parse_trace_config(config)) {
		return Result<void, ConfigError>::error(ConfigError::ValidationError);
	}
	if (!parse_launch_config(config)) {
		return Result<void, ConfigError>::error(ConfigError::ValidationError);
	}

	return Result<void, ConfigError>::ok();
}

bool Config::parse_general_config(const toml::table& config) {
	// [general] is optional; every field has a default
	auto general = config["general"];

	if (auto log = general["log"].value<bool>()) {
		log_ = *log;
	}

	if (auto seed = general["seed"].value<int64_t>()) {
		seed_ = static_cast<long>(*seed);
	}

	return true;
}

Result<void, ConfigError> Config::parse_fiber_config(const toml::table& config) {
	auto fiber = config["fiber"];
	if (!fiber) {
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::MissingRequiredField, "No [fiber] section found in config"));
		return Result<void, ConfigError>::error(ConfigError::MissingRequiredField);
	}

	FiberSettings settings;
	if (auto type = fiber["type"].value<std::string>()) {
		settings.type = *type;
	}
	if (settings.type != "cylinder" && settings.type != "cone") {
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::InvalidValue,
												 "Fiber type must be \"cylinder\" or \"cone\", got \"" + settings.type + "\""));
		return Result<void, ConfigError>::error(ConfigError::InvalidValue);
	}

	// Required numeric fields per shape
	auto require = [&](const char* key, double& target) {
		if (auto val = fiber[key].value<double>()) {
			target = *val;
			return true;
		}
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::MissingRequiredField,
												 "[fiber] " + settings.type + " requires '" + key + "'"));
		return false;
	};

	bool complete = require("length", settings.length)
		&& require("core_index", settings.core_index)
		&& require("clad_index", settings.clad_index);

	if (settings.type == "cylinder") {
		complete = complete && require("core_radius", settings.core_radius) && require("clad_radius", settings.clad_radius);
	}
	else {
		complete = complete && require("base_radius", settings.base_radius) && require("top_radius", settings.top_radius);
	}

	if (!complete) {
		return Result<void, ConfigError>::error(ConfigError::MissingRequiredField);
	}

	if (auto diffusion = fiber["diffusion"].value<double>()) {
		settings.diffusion = *diffusion;
	}

	if (!validate_range(settings.clad_index, 0.0, settings.core_index, "clad_index (must not exceed core_index)")) {
		return Result<void, ConfigError>::error(ConfigError::InvalidValue);
	}

	fiber_ = std::move(settings);

	if (log_) {
		std::ostringstream debug_msg;
		debug_msg << "Configured " << fiber_.type << " fiber (length=" << fiber_.length
				  << ", core_n=" << fiber_.core_index << ", clad_n=" << fiber_.clad_index << ")";
		Logger::instance().log_info(debug_msg.str());
	}

	return Result<void, ConfigError>::ok();
}

bool Config::parse_trace_config(const toml::table& config) {
	auto trace = config["trace"];

	if (auto max_reflections = trace["max_reflections"].value<int64_t>()) {
		if (!validate_range<int64_t>(*max_reflections, 1, std::numeric_limits<uint32_t>::max(), "max_reflections")) {
			return false;
		}
		trace_.max_reflections = static_cast<uint32_t>(*max_reflections);
	}

	if (auto elimination = trace["angle_elimination"].value<bool>()) {
		trace_.angle_elimination = *elimination;
	}

	if (auto verbose = trace["verbose"].value<bool>()) {
		trace_.verbose = *verbose;
	}

	return true;
}

bool Config::parse_launch_config(const toml::table& config) {
	auto launch = config["launch"];

	if (auto rays = launch["rays"].value<int64_t>()) {
		if (!validate_range<int64_t>(*rays, 1, std::numeric_limits<int64_t>::max(), "rays")) {
			return false;
		}
		launch_.rays = static_cast<uint64_t>(*rays);
	}

	if (auto max_zenith = launch["max_zenith"].value<double>()) {
		if (!validate_range(*max_zenith, 0.0, 90.0, "max_zenith (degrees)")) {
			return false;
		}
		launch_.max_zenith = *max_zenith;
	}

	if (auto random_start = launch["random_start"].value<bool>()) {
		launch_.random_start = *random_start;
	}

	if (auto position_arr = launch["position"].as_array()) {
		if (!validate_array_size(*position_arr, 3, "Launch position")) {
			return false;
		}
		launch_.position = parse_vec3(*position_arr);
	}

	if (auto azimuth = launch["azimuth"].value<double>()) {
		launch_.azimuth = *azimuth;
	}

	if (auto zenith = launch["zenith"].value<double>()) {
		if (!validate_range(*zenith, 0.0, 90.0, "zenith (degrees)")) {
			return false;
		}
		launch_.zenith = *zenith;
	}

	return true;
}

Result<std::unique_ptr<Fiber>, ConfigError> Config::make_fiber() const {
	using FiberResult = Result<std::unique_ptr<Fiber>, ConfigError>;

	if (fiber_.type == "cone") {
		auto cone = Cone::create(fiber_.length, fiber_.base_radius, fiber_.top_radius,
								 fiber_.core_index, fiber_.clad_index, fiber_.diffusion);
		if (cone.is_error()) {
			return FiberResult::error(cone.error());
		}
		return FiberResult::ok(std::unique_ptr<Fiber>(std::make_unique<Cone>(std::move(cone).value())));
	}

	auto cylinder = Cylinder::create(fiber_.core_radius, fiber_.clad_radius,
									 fiber_.core_index, fiber_.clad_index, fiber_.length, fiber_.diffusion);
	if (cylinder.is_error()) {
		return FiberResult::error(cylinder.error());
	}
	return FiberResult::ok(std::unique_ptr<Fiber>(std::make_unique<Cylinder>(std::move(cylinder).value())));
}

glm::dvec3 Config::parse_vec3(const toml::array& arr) const {
	return glm::dvec3(
		arr[0].value_or<double>(0.0),
		arr[1].value_or<double>(0.0),
		arr[2].value_or<double>(0.0)
	);
}

template<typename T>
bool Config::validate_range(T value, T min, T max, const std::string& param_name) const {
	if (value < min || value > max) {
		std::ostringstream error_msg;
		error_msg << "Invalid " << param_name << "=" << value;
		if (max == std::numeric_limits<T>::max()) {
			error_msg << ". Must be >= " << min;
		}
		else {
			error_msg << ". Must be between " << min << " and " << max;
		}
		REPORT_CONFIG_ERROR(ErrorMessage::format(ConfigError::ValidationError, error_msg.str()));
		return false;
	}
	return true;
}

bool Config::validate_array_size(const toml::array& arr, size_t expected_size, const std::string& param_name) const {
	if (arr.size() != expected_size) {
		REPORT_CONFIG_ERROR(param_name + " must be an array of " + std::to_string(expected_size) + " numbers");
		return false;
	}
	return true;
}

// Explicit template instantiations
template bool Config::validate_range<double>(double, double, double, const std::string&) const;
template bool Config::validate_range<int64_t>(int64_t, int64_t, int64_t, const std::string&) const;
