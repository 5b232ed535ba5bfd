#include "counting_reader.hpp"

using namespace std;

namespace xprogress
{
namespace io
{

counting_reader::counting_reader(shared_reader reader, uint64_t current)
	: m_reader(std::move(reader))
	, m_current(current)
	, m_done(false)
{
}

size_t counting_reader::read(const mutable_buffer& buffer)
{
	// The lock is not held while blocked in the stream.
	const shared_reader reader = underlying();
	if (!reader)
		throw io::exception("No underlying stream to read from");

	const size_t n = reader->read(buffer);
	if (n == 0 && buffer.size() > 0)
	{
		m_done = true;
		return 0;
	}

	m_current += n;
	return n;
}

void counting_reader::reset(shared_reader reader)
{
	lock_guard<mutex> lock(m_lock);
	m_reader = std::move(reader);
	m_done   = false;
}

shared_reader counting_reader::underlying() const
{
	lock_guard<mutex> lock(m_lock);
	return m_reader;
}

} // namespace io
} // namespace xprogress
