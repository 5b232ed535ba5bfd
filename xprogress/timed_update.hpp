#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>

namespace xprogress
{

/// Calls an update function at a fixed interval on a worker thread
/// until the function returns false or the loop is stopped.
class timed_update
{
public:
	using update_fn_t = std::function<bool()>;

	/// Starts the loop. The first call happens one interval after construction.
	timed_update(update_fn_t update_fn, const std::chrono::milliseconds& interval);

	timed_update(const timed_update&) = delete;
	timed_update& operator=(const timed_update&) = delete;

	~timed_update();

public:
	/// Cancel the loop and wait for the worker to exit.
	/// No update call is made after stop() returns.
	void stop();

	/// @returns true if the loop has not finished yet.
	bool is_running() const;

	/// Wait for the loop to finish on its own.
	/// @returns true if the loop has finished within the timeout.
	bool wait_for(const std::chrono::milliseconds& timeout) const;

private:
	std::future<void> launch();

private:
	const update_fn_t               m_update_fn;
	const std::chrono::milliseconds m_interval;
	bool                            m_stop; // Guarded by m_lock.
	std::mutex                      m_lock;
	std::condition_variable         m_cv;
	std::future<void>               m_worker;
};

} // namespace xprogress
