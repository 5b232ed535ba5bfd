#include "metrics_gauge.hpp"

using namespace std;

namespace xprogress
{
namespace metrics
{

gauge_vec::gauge_vec(const string& name, const string& help)
	: m_name(name)
	, m_help(help)
{
}

void gauge_vec::set(const string& label, double value)
{
	lock_guard<mutex> lock(m_lock);
	m_values[label] = value;
}

optional<double> gauge_vec::value(const string& label) const
{
	lock_guard<mutex> lock(m_lock);
	const auto        it = m_values.find(label);
	if (it == m_values.end())
		return nullopt;

	return it->second;
}

bool gauge_vec::remove(const string& label)
{
	lock_guard<mutex> lock(m_lock);
	return m_values.erase(label) == 1;
}

map<string, double> gauge_vec::snapshot() const
{
	lock_guard<mutex> lock(m_lock);
	return m_values;
}

} // namespace metrics
} // namespace xprogress
