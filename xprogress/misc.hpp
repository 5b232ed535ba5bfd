#pragma once
#include <chrono>
#include <ctime>
#include <iomanip> // std::put_time
#include <sstream>
#include <string>

namespace xprogress
{

// Follows ISO 8601, microsecond precision.
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp)
{
	using namespace std;
	using namespace std::chrono;

	const time_t time_now = system_clock::to_time_t(tp);
	// A zeroed tm is acceptable if localtime fails.
	tm tm_now = {};
#ifdef _WIN32
	localtime_s(&tm_now, &time_now);
#else
	localtime_r(&time_now, &tm_now);
#endif

	const auto    since_epoch = tp.time_since_epoch();
	const seconds s           = duration_cast<seconds>(since_epoch);

	stringstream ss;
	ss << put_time(&tm_now, "%FT%T.") << setfill('0') << setw(6)
	   << duration_cast<microseconds>(since_epoch - s).count() << put_time(&tm_now, "%z");
	return ss.str();
}

inline std::string print_timestamp_now() { return format_timestamp(std::chrono::system_clock::now()); }

struct stats_config
{
	int         stats_freq_ms = 1000;
	std::string stats_file;
};

} // namespace xprogress
