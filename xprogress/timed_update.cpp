#include <exception>

#include "timed_update.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
using namespace std::chrono;

#define LOG_SC_TIMER "TIMER "

namespace xprogress
{

timed_update::timed_update(update_fn_t update_fn, const milliseconds& interval)
	: m_update_fn(std::move(update_fn))
	, m_interval(interval)
	, m_stop(false)
{
	m_worker = launch();
}

timed_update::~timed_update() { stop(); }

void timed_update::stop()
{
	{
		lock_guard<mutex> lock(m_lock);
		if (m_stop)
			return;
		m_stop = true;
	}
	m_cv.notify_one();

	if (m_worker.valid())
		m_worker.wait();
}

bool timed_update::is_running() const
{
	return m_worker.valid() && m_worker.wait_for(milliseconds(0)) != future_status::ready;
}

bool timed_update::wait_for(const milliseconds& timeout) const
{
	if (!m_worker.valid())
		return true;

	return m_worker.wait_for(timeout) == future_status::ready;
}

future<void> timed_update::launch()
{
	auto update_func = [this]()
	{
		// The lock is held during an update, so stop() can not complete while one is in flight.
		unique_lock<mutex> lock(m_lock);
		while (!m_stop)
		{
			if (m_cv.wait_for(lock, m_interval, [this] { return m_stop; }))
				break;

			try
			{
				if (!m_update_fn())
				{
					spdlog::trace(LOG_SC_TIMER "update loop finished.");
					break;
				}
			}
			catch (const std::exception& e)
			{
				spdlog::error(LOG_SC_TIMER "update failed: {}. Stopping the loop.", e.what());
				break;
			}
		}
	};

	return async(std::launch::async, update_func);
}

} // namespace xprogress
