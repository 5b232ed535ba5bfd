#include <filesystem> // Requires C++17
#include <system_error>

#include "file_reader.hpp"

// submodules
#include "spdlog/spdlog.h"

using namespace std;
namespace fs = std::filesystem;

#define LOG_SC_FILE "FILE "

namespace xprogress
{
namespace io
{

uint64_t file_size(const string& path)
{
	error_code     ec;
	const uintmax_t sz = fs::file_size(path, ec);
	if (ec)
		throw io::exception("Failed to get the size of '" + path + "': " + ec.message());

	return static_cast<uint64_t>(sz);
}

file_reader::file_reader(const string& path)
	: m_path(path)
	, m_file(path, ios::in | ios::binary)
{
	if (!m_file)
	{
		spdlog::error(LOG_SC_FILE "Failed to open '{}' for reading.", path);
		throw io::exception("Failed to open file for reading. Path " + path);
	}

	m_size = file_size(path);
	spdlog::trace(LOG_SC_FILE "Opened '{}' ({} bytes).", path, m_size);
}

size_t file_reader::read(const mutable_buffer& buffer)
{
	if (buffer.size() == 0)
		return 0;

	// Once the end of file is reached the stream stays in the fail state and gcount() is 0.
	m_file.read(static_cast<char*>(buffer.data()), static_cast<streamsize>(buffer.size()));
	if (m_file.bad())
		throw io::exception("Error while reading from file " + m_path);

	return static_cast<size_t>(m_file.gcount());
}

} // namespace io
} // namespace xprogress
