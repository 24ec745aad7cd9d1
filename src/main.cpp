/*******************************************************************************
 * FIBERTRACE: RAY TRACING IN OPTICAL FIBER WAVEGUIDES
 *
 * DESCRIPTION:
 * 	Geometric-optics tracing of rays bouncing by total internal
 * 	reflection through cylindrical and conical fibers.
 ******************************************************************************/


#include "app.hpp"

/**
 * @brief Application entry point for Fibertrace
 *
 * @param argc Number of command line arguments
 * @param argv Array of command line argument strings
 * @return int Exit code (0 for success, 1 for initialization or batch failure)
 */
int main(int argc, char* argv[]) {
	App app;
	if (!app.initialize(argc, argv)) {
		return 1;
	}

	if (!app.run()) {
		app.shutdown();
		return 1;
	}

	app.shutdown();
	return 0;
}
