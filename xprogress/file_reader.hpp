#pragma once
#include <cstdint>
#include <fstream>
#include <string>

// xprogress
#include "reader.hpp"

namespace xprogress
{
namespace io
{

/// Binary read access to a regular file, one segment of a transfer.
class file_reader : public ireader
{
public:
	/// @throws io::exception if the file can not be opened.
	explicit file_reader(const std::string& path);

public:
	size_t read(const mutable_buffer& buffer) override;

	const std::string& path() const { return m_path; }
	uint64_t           size() const { return m_size; }

private:
	const std::string m_path;
	std::ifstream     m_file;
	uint64_t          m_size = 0;
};

/// Size of the file in bytes.
/// @throws io::exception if the size can not be determined.
uint64_t file_size(const std::string& path);

} // namespace io
} // namespace xprogress
