#include <chrono>
#include <fstream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// submodules
#include "spdlog/spdlog.h"

// xprogress
#include "file_reader.hpp"
#include "import.hpp"
#include "metrics_writer.hpp"
#include "progress_reader.hpp"

using namespace std;
using namespace std::chrono;
using namespace xprogress;
using namespace xprogress::import;

#define LOG_SC_IMPORT "IMPORT "

namespace
{

uint64_t expected_total(const vector<string>& segments, const config& cfg)
{
	if (cfg.total_bytes >= 0)
		return static_cast<uint64_t>(cfg.total_bytes);

	uint64_t total = 0;
	for (const auto& path : segments)
		total += io::file_size(path);
	return total;
}

} // namespace

uint64_t xprogress::import::import_segments(const vector<string>& segments, const config& cfg,
	metrics::shared_sink sink, const atomic_bool& force_break)
{
	if (segments.empty())
		throw runtime_error("No segments to import");
	if (cfg.chunk_size == 0)
		throw runtime_error("Chunk size must be positive");

	const uint64_t total = expected_total(segments, cfg);

	ofstream ofile(cfg.dst_path, ios::out | ios::trunc | ios::binary);
	if (!ofile)
		throw runtime_error("Failed to open '" + cfg.dst_path + "' for writing");

	spdlog::info(LOG_SC_IMPORT "Importing {} segment(s) to '{}', {} bytes expected.", segments.size(),
		cfg.dst_path, total);

	const auto time_start = steady_clock::now();
	progress_reader reader(make_shared<io::file_reader>(segments[0]), total, cfg.owner_id, std::move(sink),
		segments.size() == 1);

	if (cfg.progress_freq_ms > 0)
		reader.start_timed_update(milliseconds(cfg.progress_freq_ms));

	vector<char> buf(cfg.chunk_size);
	for (size_t i = 0; i < segments.size() && !force_break; ++i)
	{
		if (i > 0)
			reader.set_next_reader(make_shared<io::file_reader>(segments[i]), i + 1 == segments.size());

		spdlog::debug(LOG_SC_IMPORT "Reading segment '{}'.", segments[i]);
		while (!force_break)
		{
			const size_t n = reader.read(mutable_buffer(buf.data(), buf.size()));
			if (n == 0)
				break;

			ofile.write(buf.data(), static_cast<streamsize>(n));
			if (!ofile)
				throw runtime_error("Failed writing to '" + cfg.dst_path + "'");
		}
	}

	reader.stop_timed_update();
	ofile.close();

	if (force_break)
	{
		spdlog::info(LOG_SC_IMPORT "interrupted by request!");
	}

	const uint64_t bytes    = reader.current();
	const auto     delta_us = duration_cast<microseconds>(steady_clock::now() - time_start).count();
	const uint64_t rate_kbps = (bytes * 1000) / (delta_us ? delta_us : 1) * 8;
	spdlog::info(LOG_SC_IMPORT "{} kbytes imported at {} kbps, took {:.3f} s.", bytes / 1024, rate_kbps,
		delta_us / 1000000.0);

	if (total != 0 && bytes != total)
		spdlog::warn(LOG_SC_IMPORT "Imported {} bytes, {} were expected.", bytes, total);

	return bytes;
}

bool xprogress::import::run(const vector<string>& segments, const config& cfg, const atomic_bool& force_break)
{
	auto progress = make_shared<metrics::gauge_vec>("import_progress", "The import progress in percentage");

	try
	{
		unique_ptr<metrics::metrics_writer> writer;
		if (cfg.stats_freq_ms > 0)
		{
			writer = make_unique<metrics::metrics_writer>(progress, cfg.stats_file, milliseconds(cfg.stats_freq_ms));
			writer->start();
		}

		import_segments(segments, cfg, progress, force_break);

		if (writer)
			writer->stop();
	}
	catch (const io::exception& e)
	{
		spdlog::error(LOG_SC_IMPORT "{}", e.what());
		return false;
	}
	catch (const runtime_error& e)
	{
		spdlog::error(LOG_SC_IMPORT "{}", e.what());
		return false;
	}

	if (!cfg.keep_metric)
		progress->remove(cfg.owner_id);

	return true;
}

CLI::App* xprogress::import::add_subcommand(CLI::App& app, config& cfg, vector<string>& segments)
{
	const map<string, int> to_ms{{"s", 1'000}, {"ms", 1}};

	CLI::App* sc_import = app.add_subcommand("import", "Import one or more segment files into a destination")->fallthrough();
	sc_import->add_option("segments", segments, "Segment files in transfer order")->required()->check(CLI::ExistingFile);
	sc_import->add_option("-o,--output", cfg.dst_path, "Destination file")->required();
	sc_import->add_option("--owner", cfg.owner_id, fmt::format("Owner ID labelling the progress metric (default {})", cfg.owner_id));
	sc_import->add_option("--total", cfg.total_bytes, "Expected number of bytes (default: sum of segment sizes, 0 - unknown)")
		->check(CLI::Range(int64_t(-1), numeric_limits<int64_t>::max()));
	sc_import->add_option("--chunk", cfg.chunk_size, fmt::format("Size of a single read (default {})", cfg.chunk_size))
		->check(CLI::PositiveNumber);
	sc_import->add_option("--progressfreq", cfg.progress_freq_ms,
		fmt::format("Timed progress update interval, ms (default {}, 0 - disabled)", cfg.progress_freq_ms))
		->transform(CLI::AsNumberWithUnit(to_ms, CLI::AsNumberWithUnit::CASE_SENSITIVE));
	sc_import->add_option("--statsfile", cfg.stats_file, "Output metrics report filename (default: log)");
	sc_import->add_option("--statsfreq", cfg.stats_freq_ms,
		fmt::format("Output metrics report frequency, ms (default {}, 0 - disabled)", cfg.stats_freq_ms))
		->transform(CLI::AsNumberWithUnit(to_ms, CLI::AsNumberWithUnit::CASE_SENSITIVE));
	sc_import->add_flag("--keep-metric", cfg.keep_metric, "Keep the progress series after the import");

	return sc_import;
}
