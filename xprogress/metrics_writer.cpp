#include <stdexcept>
#include <thread>

#include "metrics_writer.hpp"
#include "misc.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
using namespace std::chrono;

namespace xprogress
{
namespace metrics
{

metrics_writer::metrics_writer(shared_ptr<const gauge_vec> gauges, const string& filename,
							   const milliseconds& interval)
	: m_gauges(std::move(gauges))
	, m_interval(interval)
	, m_stop_token(false)
{
	if (!m_gauges)
		throw runtime_error("[METRICS] No gauge supplied.");

	if (!filename.empty())
	{
		m_file.open(filename, ios::out);
		if (!m_file)
		{
			const auto msg = fmt::format("[METRICS] Failed to open file for output. Path: {0}.", filename);
			spdlog::critical(msg);
			throw runtime_error(msg);
		}
		m_file << csv_header() << flush;
	}
}

metrics_writer::~metrics_writer() { stop(); }

string metrics_writer::csv_header() { return "Timestamp,Metric,OwnerID,Value\n"; }

void metrics_writer::start()
{
	if (m_metrics_future.valid())
		return;

	m_stop_token     = false;
	m_metrics_future = launch();
	spdlog::trace("[METRICS] Exporting {} every {} ms.", m_gauges->name(), m_interval.count());
}

void metrics_writer::stop()
{
	if (!m_metrics_future.valid())
		return;

	{
		lock_guard<mutex> lock(m_lock);
		m_stop_token = true;
	}
	m_cv.notify_one();
	m_metrics_future.wait();
	m_metrics_future = future<void>();

	write_snapshot();
}

void metrics_writer::write_snapshot()
{
	const auto values = m_gauges->snapshot();
	if (!m_file.is_open())
	{
		for (const auto& it : values)
			spdlog::info("[METRICS] {} @{}: {:.2f}", m_gauges->name(), it.first, it.second);
		return;
	}

	const string timestamp = print_timestamp_now();
	for (const auto& it : values)
		m_file << fmt::format("{},{},{},{:.2f}\n", timestamp, m_gauges->name(), it.first, it.second);
	m_file << flush;
}

future<void> metrics_writer::launch()
{
	auto metrics_func = [this]()
	{
		unique_lock<mutex> lock(m_lock);
		while (!m_stop_token)
		{
			// The lock is released while waiting.
			if (m_cv.wait_for(lock, m_interval, [this] { return m_stop_token.load(); }))
				break;

			write_snapshot();
		}
	};

	return async(::launch::async, metrics_func);
}

} // namespace metrics
} // namespace xprogress
