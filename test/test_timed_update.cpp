#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "metrics_gauge.hpp"
#include "progress_reader.hpp"
#include "test_utils.hpp"
#include "timed_update.hpp"

using namespace xprogress;
using namespace std::chrono;
using testutil::mem_reader;
using testutil::recording_sink;

namespace
{

const std::string owner_uid = "1111-1111-111";

// Polls until the predicate holds or the deadline passes.
template <typename Pred>
bool eventually(Pred pred, milliseconds timeout = milliseconds(5000))
{
	const auto deadline = steady_clock::now() + timeout;
	while (steady_clock::now() < deadline)
	{
		if (pred())
			return true;
		std::this_thread::sleep_for(milliseconds(1));
	}
	return pred();
}

} // namespace

TEST(TimedUpdate, StopsWhenUpdateReturnsFalse)
{
	std::atomic<int> calls(0);
	timed_update     loop([&calls]() { return ++calls < 3; }, milliseconds(1));

	ASSERT_TRUE(loop.wait_for(milliseconds(5000)));
	EXPECT_FALSE(loop.is_running());
	EXPECT_EQ(calls.load(), 3);
}

TEST(TimedUpdate, NoCallsAfterStop)
{
	std::atomic<int> calls(0);
	timed_update     loop([&calls]() { ++calls; return true; }, milliseconds(1));

	ASSERT_TRUE(eventually([&calls]() { return calls.load() >= 2; }));
	loop.stop();
	EXPECT_FALSE(loop.is_running());

	const int after_stop = calls.load();
	std::this_thread::sleep_for(milliseconds(20));
	EXPECT_EQ(calls.load(), after_stop);
}

TEST(TimedUpdate, StopInterruptsLongInterval)
{
	std::atomic<int> calls(0);
	const auto       start = steady_clock::now();
	{
		timed_update loop([&calls]() { ++calls; return true; }, milliseconds(60000));
		loop.stop();
	}
	EXPECT_LT(steady_clock::now() - start, seconds(10));
	EXPECT_EQ(calls.load(), 0);
}

TEST(TimedUpdate, ThrowingUpdateEndsLoop)
{
	timed_update loop([]() -> bool { throw std::runtime_error("sink failure"); }, milliseconds(1));

	ASSERT_TRUE(loop.wait_for(milliseconds(5000)));
	EXPECT_FALSE(loop.is_running());
}

TEST(ProgressReaderTimedUpdate, StartsAndStopsWhenFinished)
{
	auto            sink = std::make_shared<recording_sink>();
	progress_reader reader(std::make_shared<mem_reader>("hello world"), 11, owner_uid, sink);
	reader.start_timed_update(milliseconds(1));
	EXPECT_TRUE(reader.timed_update_active());

	std::vector<char> buf(64);
	while (reader.read(mutable_buffer(buf.data(), buf.size())) != 0)
	{
	}

	ASSERT_TRUE(eventually([&reader]() { return !reader.timed_update_active(); }));
	EXPECT_DOUBLE_EQ(sink->values().back().second, 100.0);
}

TEST(ProgressReaderTimedUpdate, ExhaustedFinalReaderStopsWithoutWriting)
{
	auto            sink = std::make_shared<recording_sink>();
	progress_reader reader(std::make_shared<mem_reader>(""), 1000, owner_uid, sink, true, 1000);

	// Reaching the end of input publishes once from the read path.
	std::vector<char> buf(16);
	EXPECT_EQ(reader.read(mutable_buffer(buf.data(), buf.size())), 0u);
	ASSERT_TRUE(reader.done());
	ASSERT_EQ(sink->count(), 1u);

	// The final value is already published, the loop ends on its first tick.
	reader.start_timed_update(milliseconds(1));
	ASSERT_TRUE(eventually([&reader]() { return !reader.timed_update_active(); }));
	EXPECT_EQ(sink->count(), 1u);

	std::this_thread::sleep_for(milliseconds(20));
	EXPECT_EQ(sink->count(), 1u);
	EXPECT_DOUBLE_EQ(sink->values().back().second, 100.0);
}

TEST(ProgressReaderTimedUpdate, RemovedSeriesStaysRemovedAfterCompletion)
{
	auto            progress = std::make_shared<metrics::gauge_vec>("test_progress", "");
	progress_reader reader(std::make_shared<mem_reader>("hello"), 5, owner_uid, progress);
	reader.start_timed_update(milliseconds(5));

	std::vector<char> buf(16);
	while (reader.read(mutable_buffer(buf.data(), buf.size())) != 0)
	{
	}
	ASSERT_DOUBLE_EQ(*progress->value(owner_uid), 100.0);

	// The host drops the series of a finished transfer.
	ASSERT_TRUE(progress->remove(owner_uid));
	std::this_thread::sleep_for(milliseconds(50));
	EXPECT_FALSE(progress->value(owner_uid).has_value());
	EXPECT_FALSE(reader.timed_update_active());

	// Neither does a read after completion publish again.
	EXPECT_EQ(reader.read(mutable_buffer(buf.data(), buf.size())), 0u);
	EXPECT_FALSE(reader.update_progress());
	EXPECT_FALSE(progress->value(owner_uid).has_value());
}

TEST(ProgressReaderTimedUpdate, KeepsRunningBetweenSegments)
{
	auto            sink = std::make_shared<recording_sink>();
	progress_reader reader(std::make_shared<mem_reader>("first"), 10, owner_uid, sink, false);

	std::vector<char> buf(16);
	while (reader.read(mutable_buffer(buf.data(), buf.size())) != 0)
	{
	}
	ASSERT_TRUE(reader.done());

	reader.start_timed_update(milliseconds(1));
	const size_t before = sink->count();
	ASSERT_TRUE(eventually([&sink, before]() { return sink->count() >= before + 3; }));
	EXPECT_TRUE(reader.timed_update_active());
	EXPECT_DOUBLE_EQ(sink->values().back().second, 50.0);

	reader.set_next_reader(std::make_shared<mem_reader>("again"), true);
	while (reader.read(mutable_buffer(buf.data(), buf.size())) != 0)
	{
	}
	ASSERT_TRUE(eventually([&reader]() { return !reader.timed_update_active(); }));
	EXPECT_DOUBLE_EQ(sink->values().back().second, 100.0);
}

TEST(ProgressReaderTimedUpdate, CancelledLoopWritesNothing)
{
	auto            sink = std::make_shared<recording_sink>();
	progress_reader reader(std::make_shared<mem_reader>("hello"), 10, owner_uid, sink);

	reader.start_timed_update(milliseconds(60000));
	reader.stop_timed_update();
	EXPECT_FALSE(reader.timed_update_active());
	EXPECT_EQ(sink->count(), 0u);
}

TEST(ProgressReaderTimedUpdate, UnknownTotalStopsLoop)
{
	auto            sink = std::make_shared<recording_sink>();
	progress_reader reader(std::make_shared<mem_reader>("hello"), 0, owner_uid, sink);

	reader.start_timed_update(milliseconds(1));
	ASSERT_TRUE(eventually([&reader]() { return !reader.timed_update_active(); }));
	EXPECT_EQ(sink->count(), 0u);
}
