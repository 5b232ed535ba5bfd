#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// xprogress
#include "counting_reader.hpp"
#include "metrics_gauge.hpp"
#include "timed_update.hpp"

namespace xprogress
{

/// Reports the progress of a transfer to a metrics sink as bytes are read through it.
///
/// A transfer may consist of several consecutive streams (segments). The byte count
/// is cumulative over all of them: set_next_reader() switches to the next segment
/// without resetting it. The transfer is complete once the final segment is exhausted.
///
/// Progress is published on every read() and, if started, periodically by a timed update.
/// read() and set_next_reader() are expected to be called from one thread.
class progress_reader : public io::ireader
{
public:
	static constexpr std::chrono::milliseconds default_update_interval{1000};

	/// @param [in] reader    the first segment of the transfer
	/// @param [in] total     the expected number of bytes, 0 if unknown
	/// @param [in] owner_id  label of the progress metric
	/// @param [in] sink      where the progress is published
	/// @param [in] final     whether the first segment is also the last one
	/// @param [in] offset    bytes already transferred before this reader was created
	progress_reader(io::shared_reader reader, uint64_t total, const std::string& owner_id,
					metrics::shared_sink sink, bool final = true, uint64_t offset = 0);

	~progress_reader() override;

public:
	/** Read from the current segment and publish the progress.
	 *
	 * @returns The number of bytes read, 0 on end of input of the current segment.
	 *
	 * @throws io::exception Thrown on failure of the underlying stream.
	 */
	size_t read(const mutable_buffer& buffer) override;

	/// Publish the current progress. Nothing is published after the transfer has completed.
	/// @returns true if further updates are expected, false if the transfer is complete
	///          or its progress can not be measured (total is 0).
	///          The value is advisory, a reader may still be read from.
	bool update_progress();

	/// Continue the transfer with the next segment. The byte count is preserved.
	/// @param [in] reader    the next segment
	/// @param [in] is_final  whether it is the last segment of the transfer
	void set_next_reader(io::shared_reader reader, bool is_final);

	/// Start publishing the progress periodically. Does nothing if already running.
	/// The loop ends once update_progress() returns false or stop_timed_update() is called.
	void start_timed_update(const std::chrono::milliseconds& interval = default_update_interval);

	/// Cancel the timed update. No metric is written by the loop after the call returns.
	void stop_timed_update();

	bool timed_update_active() const;

public:
	uint64_t           current() const { return m_counting.current(); }
	uint64_t           total() const { return m_total; }
	bool               done() const { return m_counting.done(); }
	bool               is_final() const;
	const std::string& owner_id() const { return m_owner_id; }

	io::shared_reader underlying() const { return m_counting.underlying(); }

private:
	io::counting_reader  m_counting;
	const uint64_t       m_total;
	const std::string    m_owner_id;
	metrics::shared_sink m_sink;
	bool                 m_final;     // Guarded by m_lock.
	bool                 m_completed; // Guarded by m_lock. Set once the final value is published.
	mutable std::mutex   m_lock;  // Serializes updates and segment hand-off.

	std::unique_ptr<timed_update> m_timer;
};

} // namespace xprogress
