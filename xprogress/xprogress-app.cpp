#include <atomic>
#include <signal.h>
#include <iostream>
#include <string>
#include <vector>

// Third party libraries
#include "CLI/CLI.hpp"
#include "spdlog/spdlog.h"

#include "import.hpp"

#ifndef XPR_VERSION_STRING
#define XPR_VERSION_STRING "0.0.0"
#endif

using namespace std;

atomic_bool force_break(false);

void OnINT_ForceExit(int)
{
	cerr << "\n-------- REQUESTED INTERRUPT!\n";
	force_break = true;
}

int main(int argc, char** argv)
{
	using namespace xprogress;

	CLI::App app("xprogress transfer tool v" XPR_VERSION_STRING);
	app.set_config("--config");
	app.set_help_all_flag("--help-all", "Expand all help");

	spdlog::set_pattern("%H:%M:%S.%f %^[%L]%$ %v");
	app.add_flag_function(
		"--verbose,-v",
		[](size_t) {
			spdlog::set_level(spdlog::level::trace);
		},
		"enable verbose output");

	app.add_flag_function(
		"--handle-sigint",
		[](size_t) {
			signal(SIGINT, OnINT_ForceExit);
			signal(SIGTERM, OnINT_ForceExit);
		},
		"Handle Ctrl+C interrupt");

	app.add_option(
		"--loglevel",
		[](CLI::results_t val) {
			const spdlog::level::level_enum lev = spdlog::level::from_str(val[0]);
			// from_str() falls back to "off" for unknown names.
			if (lev == spdlog::level::off && val[0] != "off")
				return false;

			spdlog::set_level(lev);
			spdlog::info("Log level set to {}", val[0]);
			return true;
		},
		"log level [trace, debug, info, warning, error, critical, off]");

	app.add_flag_function(
		"--version",
		[](size_t) {
			cerr << "xprogress v" << XPR_VERSION_STRING << endl;
		},
		"Show version info");

	vector<string> segments;

	import::config cfg_import;
	CLI::App*      sc_import = import::add_subcommand(app, cfg_import, segments);

	app.require_subcommand(1);
	CLI11_PARSE(app, argc, argv);

	if (sc_import->parsed())
	{
		return import::run(segments, cfg_import, force_break) ? 0 : 1;
	}

	cerr << "Failed to recognize subcommand" << endl;
	return 1;
}
