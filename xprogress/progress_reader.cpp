#include <stdexcept>

#include "progress_reader.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
using namespace std::chrono;

#define LOG_SC_PROGRESS "PROGRESS "

namespace xprogress
{

progress_reader::progress_reader(io::shared_reader reader, uint64_t total, const string& owner_id,
								 metrics::shared_sink sink, bool final, uint64_t offset)
	: m_counting(std::move(reader), offset)
	, m_total(total)
	, m_owner_id(owner_id)
	, m_sink(std::move(sink))
	, m_final(final)
	, m_completed(false)
{
	if (!m_sink)
		throw runtime_error("No progress sink supplied for " + owner_id);

	if (m_total == 0)
		spdlog::debug(LOG_SC_PROGRESS "{}: total size unknown, progress will not be reported.", m_owner_id);
}

progress_reader::~progress_reader() { stop_timed_update(); }

size_t progress_reader::read(const mutable_buffer& buffer)
{
	const size_t n = m_counting.read(buffer);
	update_progress();
	return n;
}

bool progress_reader::update_progress()
{
	if (m_total == 0)
		return false;

	lock_guard<mutex> lock(m_lock);
	// The final value has been published already.
	if (m_completed)
		return false;

	const uint64_t    current  = m_counting.current();
	const bool        finished = m_final && m_counting.done();

	double percentage = 100.0;
	if (!finished && current < m_total)
		percentage = static_cast<double>(current) / static_cast<double>(m_total) * 100.0;

	m_sink->set(m_owner_id, percentage);
	spdlog::debug(LOG_SC_PROGRESS "{}: {:.2f}", m_owner_id, percentage);

	// A segment that is not final being done means the next one is about to be set.
	if (finished)
	{
		m_completed = true;
		spdlog::trace(LOG_SC_PROGRESS "{}: transfer complete.", m_owner_id);
	}
	return !finished;
}

void progress_reader::set_next_reader(io::shared_reader reader, bool is_final)
{
	lock_guard<mutex> lock(m_lock);
	m_counting.reset(std::move(reader));
	m_final = is_final;
	spdlog::trace(LOG_SC_PROGRESS "{}: next segment at {} bytes{}.", m_owner_id, m_counting.current(),
				  is_final ? " (final)" : "");
}

bool progress_reader::is_final() const
{
	lock_guard<mutex> lock(m_lock);
	return m_final;
}

void progress_reader::start_timed_update(const milliseconds& interval)
{
	if (m_timer && m_timer->is_running())
	{
		spdlog::trace(LOG_SC_PROGRESS "{}: timed update is already running.", m_owner_id);
		return;
	}

	m_timer = make_unique<timed_update>([this]() { return update_progress(); }, interval);
}

void progress_reader::stop_timed_update()
{
	if (!m_timer)
		return;

	m_timer->stop();
	m_timer.reset();
}

bool progress_reader::timed_update_active() const { return m_timer && m_timer->is_running(); }

} // namespace xprogress
