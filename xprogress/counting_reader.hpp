#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>

// xprogress
#include "reader.hpp"

namespace xprogress
{
namespace io
{

/// Passes reads through to the underlying stream and counts the bytes.
/// The count survives a reset() to the next stream of a multi-part transfer.
class counting_reader : public ireader
{
public:
	/// @param [in] reader  the stream to count bytes of
	/// @param [in] current the number of bytes already transferred before this reader
	explicit counting_reader(shared_reader reader, uint64_t current = 0);

	counting_reader(const counting_reader&) = delete;
	counting_reader& operator=(const counting_reader&) = delete;

public:
	/** Read from the underlying stream.
	 *
	 * @returns The number of bytes read, 0 on end of input.
	 *
	 * @throws io::exception Thrown on failure (the counter and the done flag are not changed).
	 */
	size_t read(const mutable_buffer& buffer) override;

	/// Replace the underlying stream. The done flag is cleared, the byte count is kept.
	void reset(shared_reader reader);

	uint64_t current() const { return m_current; }
	bool     done() const { return m_done; }

	shared_reader underlying() const;

private:
	shared_reader         m_reader;
	mutable std::mutex    m_lock; // Guards m_reader.
	std::atomic<uint64_t> m_current;
	std::atomic<bool>     m_done;
};

} // namespace io
} // namespace xprogress
