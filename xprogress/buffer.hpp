#pragma once
#include <cstddef>

namespace xprogress
{

/// Writable memory range handed to a reader.
/**
 * The buffer does not own the memory it points to. Copying it copies the view,
 * not the bytes.
 *
 * @code
 * std::vector<char> storage(4096);
 * const size_t n = reader.read(mutable_buffer(storage.data(), storage.size()));
 * @endcode
 */
class mutable_buffer
{
  public:
	mutable_buffer() noexcept
		: m_data(nullptr)
		, m_size(0)
	{
	}

	mutable_buffer(void* data, std::size_t size) noexcept
		: m_data(data)
		, m_size(size)
	{
	}

	void* data() const noexcept { return m_data; }

	std::size_t size() const noexcept { return m_size; }

	/// Skip the first n bytes (clamped to the size of the range).
	mutable_buffer& operator+=(std::size_t n) noexcept
	{
		const std::size_t offset = n < m_size ? n : m_size;
		m_data                   = static_cast<char*>(m_data) + offset;
		m_size -= offset;
		return *this;
	}

  private:
	void*       m_data;
	std::size_t m_size;
};

} // namespace xprogress
