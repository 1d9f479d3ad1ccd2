#pragma once

#include <politeia/lib/errors.hpp>

#include <boost/optional.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace politeia
{
/** Releases the write lock on destruction */
class write_guard final
{
public:
	explicit write_guard (std::function<void()> guard_finish_callback_a);
	void release ();
	~write_guard ();
	write_guard (write_guard const &) = delete;
	write_guard & operator= (write_guard const &) = delete;
	write_guard (write_guard &&) noexcept;
	write_guard & operator= (write_guard &&) noexcept;
	bool is_owned () const;

private:
	std::function<void()> guard_finish_callback;
	bool owns{ true };
};

/**
 * Process wide lock serializing every ledger and metadata mutation. Writers are served in
 * the order they arrive.
 */
class write_lock final
{
public:
	write_lock ();
	/**
	 * Waits up to \p timeout_a for the lock
	 * @return error_plugin::backend_busy if the wait timed out, error_plugin::shutdown_in_progress if
	 * stop () was called, in both cases \p guard_a is left empty
	 */
	politeia::error acquire (std::chrono::milliseconds timeout_a, boost::optional<politeia::write_guard> & guard_a);
	/** Refuses further writers and waits for the current holder to finish */
	void stop ();
	bool stopped () const;
	/** Number of writers holding or waiting for the lock */
	size_t size ();

private:
	std::mutex mutex;
	std::condition_variable condition;
	std::deque<uint64_t> queue;
	uint64_t next_ticket{ 0 };
	std::atomic<bool> shutdown{ false };
	std::function<void()> guard_finish_callback;
};
}
