#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

// Third party libraries
#include "CLI/CLI.hpp"

// xprogress
#include "metrics_gauge.hpp"
#include "misc.hpp"

namespace xprogress::import
{

	struct config : stats_config
	{
		std::string dst_path;
		std::string owner_id          = "xprogress";
		int64_t     total_bytes       = -1; // -1: sum of segment sizes, 0: unknown
		size_t      chunk_size        = 1456 * 1000;
		int         progress_freq_ms  = 1000; // 0: no timed update
		bool        keep_metric       = false;
	};

	/// @brief Copy the segments into cfg.dst_path one after another, reporting the progress
	/// of the whole transfer under cfg.owner_id.
	/// @param segments  paths of the segment files in transfer order
	/// @param cfg       import configuration
	/// @param sink      progress destination
	/// @param force_break  stops the copy when raised
	/// @return the number of bytes written
	/// @throws io::exception on a read failure, std::runtime_error on other failures
	uint64_t import_segments(const std::vector<std::string>& segments, const config& cfg,
		metrics::shared_sink sink, const std::atomic_bool& force_break);

	/// @return true on success, false if the import failed.
	bool run(const std::vector<std::string>& segments, const config& cfg,
		const std::atomic_bool& force_break);

	CLI::App* add_subcommand(CLI::App& app, config& cfg, std::vector<std::string>& segments);

} // namespace xprogress::import
