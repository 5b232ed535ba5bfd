#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include "metrics_gauge.hpp"

namespace xprogress
{
namespace metrics
{

/// Periodically exports the values of a gauge vector to a CSV file,
/// or to the log if no file is given.
class metrics_writer
{
public:
	/// @throws std::runtime_error if the output file can not be opened.
	metrics_writer(std::shared_ptr<const gauge_vec> gauges, const std::string& filename,
				   const std::chrono::milliseconds& interval);
	~metrics_writer();

public:
	void start();

	/// Stop the export and write the last snapshot.
	void stop();

	static std::string csv_header();

private:
	std::future<void> launch();
	void              write_snapshot();

private:
	std::shared_ptr<const gauge_vec> m_gauges;
	std::ofstream                    m_file;
	std::future<void>                m_metrics_future;
	const std::chrono::milliseconds  m_interval;
	std::atomic<bool>                m_stop_token;
	std::mutex                       m_lock;
	std::condition_variable          m_cv;
};

} // namespace metrics
} // namespace xprogress
