#pragma once
#include <exception>
#include <memory>
#include <string>

// xprogress
#include "buffer.hpp"

namespace xprogress
{
namespace io
{

class exception : public std::exception
{

public:
	exception(const std::string&& err)
		: m_error_msg(err)
	{
	}

public:
	virtual const char* what() const throw() { return m_error_msg.c_str(); }

private:
	const std::string m_error_msg;
};

class ireader
{

public:
	virtual ~ireader() = default;

public:
	/** Read data from the stream.
	 *
	 * @returns The number of bytes read. Zero bytes read into a non-empty
	 *          buffer means end of input.
	 *
	 * @throws io::exception Thrown on failure.
	 */
	virtual size_t read(const mutable_buffer& buffer) = 0;
};

typedef std::shared_ptr<ireader> shared_reader;

} // namespace io
} // namespace xprogress
