#include <politeia/node/write_lock.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

TEST (write_lock, acquire_release)
{
	politeia::write_lock write_lock;
	{
		boost::optional<politeia::write_guard> guard;
		ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
		ASSERT_TRUE (guard);
		ASSERT_TRUE (guard->is_owned ());
		ASSERT_EQ (1, write_lock.size ());
	}
	ASSERT_EQ (0, write_lock.size ());
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
	guard->release ();
	ASSERT_FALSE (guard->is_owned ());
	ASSERT_EQ (0, write_lock.size ());
}

TEST (write_lock, timeout)
{
	politeia::write_lock write_lock;
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
	boost::optional<politeia::write_guard> second;
	auto start (std::chrono::steady_clock::now ());
	ASSERT_EQ (politeia::error_plugin::backend_busy, write_lock.acquire (std::chrono::milliseconds (50), second).get_code ());
	ASSERT_GE (std::chrono::steady_clock::now () - start, std::chrono::milliseconds (50));
	ASSERT_FALSE (second);
	// The timed out writer left the queue
	ASSERT_EQ (1, write_lock.size ());
	guard = boost::none;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), second));
}

TEST (write_lock, move_guard)
{
	politeia::write_lock write_lock;
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
	politeia::write_guard moved (std::move (*guard));
	ASSERT_FALSE (guard->is_owned ());
	ASSERT_TRUE (moved.is_owned ());
	guard = boost::none;
	ASSERT_EQ (1, write_lock.size ());
	moved.release ();
	ASSERT_EQ (0, write_lock.size ());
}

TEST (write_lock, fifo)
{
	politeia::write_lock write_lock;
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
	std::mutex order_mutex;
	std::vector<int> order;
	std::vector<std::thread> threads;
	for (int i (0); i < 4; ++i)
	{
		threads.emplace_back ([&write_lock, &order_mutex, &order, i]() {
			boost::optional<politeia::write_guard> guard_l;
			auto error (write_lock.acquire (std::chrono::seconds (10), guard_l));
			EXPECT_FALSE (error);
			std::lock_guard<std::mutex> lock (order_mutex);
			order.push_back (i);
		});
		// Each writer queues before the next one starts
		while (write_lock.size () != static_cast<size_t> (i + 2))
		{
			std::this_thread::yield ();
		}
	}
	guard = boost::none;
	for (auto & thread : threads)
	{
		thread.join ();
	}
	ASSERT_EQ ((std::vector<int>{ 0, 1, 2, 3 }), order);
}

TEST (write_lock, stop)
{
	politeia::write_lock write_lock;
	boost::optional<politeia::write_guard> guard;
	ASSERT_FALSE (write_lock.acquire (std::chrono::milliseconds (100), guard));
	std::atomic<bool> stopped{ false };
	std::thread stopper ([&write_lock, &stopped]() {
		write_lock.stop ();
		stopped = true;
	});
	while (!write_lock.stopped ())
	{
		std::this_thread::yield ();
	}
	// stop () waits for the holder
	std::this_thread::sleep_for (std::chrono::milliseconds (20));
	ASSERT_FALSE (stopped);
	guard = boost::none;
	stopper.join ();
	ASSERT_TRUE (stopped);
	boost::optional<politeia::write_guard> after;
	ASSERT_EQ (politeia::error_plugin::shutdown_in_progress, write_lock.acquire (std::chrono::milliseconds (100), after).get_code ());
	ASSERT_FALSE (after);
	ASSERT_EQ (0, write_lock.size ());
}
