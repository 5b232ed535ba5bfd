#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace xprogress
{
namespace metrics
{

/// Destination of progress values, keyed by the transfer owner.
/// Implementations must accept concurrent set() calls.
class progress_sink
{
public:
	virtual ~progress_sink() = default;

public:
	/// Set the progress of a transfer.
	/// @param [in] owner_id  the label identifying the transfer
	/// @param [in] percentage  progress value in the range [0, 100]
	virtual void set(const std::string& owner_id, double percentage) = 0;
};

typedef std::shared_ptr<progress_sink> shared_sink;

/// In-memory gauge with one value per label.
class gauge_vec : public progress_sink
{
public:
	gauge_vec(const std::string& name, const std::string& help);

public:
	void set(const std::string& label, double value) override;

	/// @returns the current value of the series, or nothing if the label is unknown.
	std::optional<double> value(const std::string& label) const;

	/// Delete the series of a label.
	/// @returns true if the series existed.
	bool remove(const std::string& label);

	std::map<std::string, double> snapshot() const;

	const std::string& name() const { return m_name; }
	const std::string& help() const { return m_help; }

private:
	const std::string             m_name;
	const std::string             m_help;
	std::map<std::string, double> m_values;
	mutable std::mutex            m_lock;
};

} // namespace metrics
} // namespace xprogress
