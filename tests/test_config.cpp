#include <cmath>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "common/config.hpp"
#include "common/error_types.hpp"
#include "common/result.hpp"
#include "fiber/cone.hpp"
#include "fiber/fiber.hpp"

static Config& fresh_config() {
	Config::shutdown();
	Config::initialize();
	return Config::get();
}

static const char* CYLINDER_DOC = R"(
[general]
log = false
seed = 42

[fiber]
type = "cylinder"
core_radius = 1e-4
clad_radius = 1.2e-4
length = 1.0
core_index = 1.48
clad_index = 1.46

[trace]
max_reflections = 500
angle_elimination = false
verbose = false

[launch]
rays = 25
max_zenith = 8.0
)";

int main() {
	// Complete cylinder document
	{
		Config& config = fresh_config();
		auto parsed = config.parse_config_string(CYLINDER_DOC);
		if (!parsed.is_ok()) {
			std::cerr << "Valid cylinder config rejected\n";
			return 1;
		}
		if (config.fiber().type != "cylinder" || config.fiber().core_radius != 1e-4 || config.fiber().length != 1.0) {
			std::cerr << "Fiber settings not read\n";
			return 1;
		}
		if (!config.seed() || *config.seed() != 42 || config.log()) {
			std::cerr << "General settings not read\n";
			return 1;
		}
		if (config.trace().max_reflections != 500 || config.trace().angle_elimination) {
			std::cerr << "Trace settings not read\n";
			return 1;
		}
		if (config.launch().rays != 25 || !config.launch().max_zenith || *config.launch().max_zenith != 8.0
			|| !config.launch().random_start) {
			std::cerr << "Launch settings not read\n";
			return 1;
		}

		auto fiber = config.make_fiber();
		if (!fiber.is_ok()) {
			std::cerr << "make_fiber failed for a valid cylinder\n";
			return 1;
		}
		const Fiber& f = *fiber.value();
		if (f.kind() != "cylinder" || f.core_radius() != 1e-4 || f.core_n() != 1.48 || f.clad_n() != 1.46
			|| f.diffusion()) {
			std::cerr << "Configured cylinder does not match the document\n";
			return 1;
		}
	}

	// Cone with diffusion and a fixed launch
	{
		Config& config = fresh_config();
		auto parsed = config.parse_config_string(R"(
[fiber]
type = "cone"
base_radius = 2e-4
top_radius = 1e-4
length = 0.5
core_index = 1.445
clad_index = 1.44
diffusion = 0.001

[launch]
random_start = false
position = [1e-5, 2e-5, 0.0]
azimuth = 45.0
zenith = 6.0
)");
		if (!parsed.is_ok()) {
			std::cerr << "Valid cone config rejected\n";
			return 1;
		}
		if (config.launch().random_start || config.launch().max_zenith || config.launch().zenith != 6.0
			|| config.launch().position != glm::dvec3(1e-5, 2e-5, 0.0)) {
			std::cerr << "Fixed launch settings not read\n";
			return 1;
		}
		if (config.trace().max_reflections != 1000 || !config.trace().angle_elimination) {
			std::cerr << "Trace defaults not kept\n";
			return 1;
		}

		auto fiber = config.make_fiber();
		if (!fiber.is_ok()) {
			std::cerr << "make_fiber failed for a valid cone\n";
			return 1;
		}
		const auto* cone = dynamic_cast<const Cone*>(fiber.value().get());
		if (!cone || cone->base_radius() != 2e-4 || cone->top_radius() != 1e-4 || !cone->is_diffuse()
			|| std::abs(cone->angle() - std::asin(2e-4)) > 1e-15) {
			std::cerr << "Configured cone does not match the document\n";
			return 1;
		}
	}

	// Missing required field
	{
		Config& config = fresh_config();
		auto parsed = config.parse_config_string(R"(
[fiber]
type = "cylinder"
core_radius = 1e-4
clad_radius = 1.2e-4
length = 1.0
clad_index = 1.46
)");
		if (parsed.is_ok() || parsed.error() != ConfigError::MissingRequiredField) {
			std::cerr << "Missing core_index should be MissingRequiredField\n";
			return 1;
		}
	}

	// Missing [fiber] table
	{
		Config& config = fresh_config();
		auto parsed = config.parse_config_string("[launch]\nrays = 3\n");
		if (parsed.is_ok() || parsed.error() != ConfigError::MissingRequiredField) {
			std::cerr << "Missing [fiber] should be MissingRequiredField\n";
			return 1;
		}
	}

	// Unknown shape
	{
		Config& config = fresh_config();
		auto parsed = config.parse_config_string(R"(
[fiber]
type = "hexagon"
length = 1.0
core_index = 1.48
clad_index = 1.46
)");
		if (parsed.is_ok() || parsed.error() != ConfigError::InvalidValue) {
			std::cerr << "Unknown fiber type should be InvalidValue\n";
			return 1;
		}
	}

	// Cladding index above the core index
	{
		Config& config = fresh_config();
		auto parsed = config.parse_config_string(R"(
[fiber]
core_radius = 1e-4
clad_radius = 1.2e-4
length = 1.0
core_index = 1.46
clad_index = 1.48
)");
		if (parsed.is_ok() || parsed.error() != ConfigError::InvalidValue) {
			std::cerr << "clad_index > core_index should be InvalidValue\n";
			return 1;
		}
	}

	// Out of range launch and trace values
	{
		Config& config = fresh_config();
		auto bad_zenith = config.parse_config_string(R"(
[fiber]
core_radius = 1e-4
clad_radius = 1.2e-4
length = 1.0
core_index = 1.48
clad_index = 1.46

[launch]
max_zenith = 120.0
)");
		if (bad_zenith.is_ok() || bad_zenith.error() != ConfigError::ValidationError) {
			std::cerr << "max_zenith above 90 should be a ValidationError\n";
			return 1;
		}

		Config& again = fresh_config();
		auto bad_budget = again.parse_config_string(R"(
[fiber]
core_radius = 1e-4
clad_radius = 1.2e-4
length = 1.0
core_index = 1.48
clad_index = 1.46

[trace]
max_reflections = 0
)");
		if (bad_budget.is_ok() || bad_budget.error() != ConfigError::ValidationError) {
			std::cerr << "max_reflections = 0 should be a ValidationError\n";
			return 1;
		}
	}

	// Impossible cone taper passes parsing and fails in the factory
	{
		Config& config = fresh_config();
		auto parsed = config.parse_config_string(R"(
[fiber]
type = "cone"
base_radius = 1.0
top_radius = 0.0
length = 1e-3
core_index = 1.48
clad_index = 1.46
)");
		if (!parsed.is_ok()) {
			std::cerr << "Cone document should parse\n";
			return 1;
		}
		auto fiber = config.make_fiber();
		if (fiber.is_ok() || fiber.error() != ConfigError::GeometryError) {
			std::cerr << "Impossible taper should be a GeometryError\n";
			return 1;
		}
	}

	// Malformed TOML and missing files
	{
		Config& config = fresh_config();
		auto malformed = config.parse_config_string("[fiber\ntype = ");
		if (malformed.is_ok() || malformed.error() != ConfigError::ParseError) {
			std::cerr << "Malformed TOML should be a ParseError\n";
			return 1;
		}

		auto missing = config.parse_config_file("does/not/exist.toml");
		if (missing.is_ok() || missing.error() != ConfigError::FileNotFound) {
			std::cerr << "Missing file should be FileNotFound\n";
			return 1;
		}
	}

	// Failed file initialization leaves no config behind
	{
		Config::shutdown();
		if (Config::initialize("does/not/exist.toml") || Config::is_initialized()) {
			std::cerr << "Config::initialize should fail for a missing file\n";
			return 1;
		}
	}

	// The pre-initialization fallback is one instance for every thread
	{
		Config::shutdown();
		std::vector<const Config*> seen(8, nullptr);
		std::vector<std::thread> threads;
		for (std::size_t i = 0; i < seen.size(); ++i) {
			threads.emplace_back([&seen, i] { seen[i] = &Config::get(); });
		}
		for (std::thread& thread : threads) {
			thread.join();
		}
		for (const Config* config : seen) {
			if (config != seen.front() || config->log() || config->trace().max_reflections != 1000) {
				std::cerr << "Fallback config differs between threads\n";
				return 1;
			}
		}
		if (&Config::get() != seen.front()) {
			std::cerr << "Fallback config was replaced after first use\n";
			return 1;
		}
	}

	Config::shutdown();
	std::cout << "config OK\n";
	return 0;
}
