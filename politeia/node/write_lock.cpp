#include <politeia/lib/utility.hpp>
#include <politeia/node/write_lock.hpp>

#include <algorithm>

politeia::write_guard::write_guard (std::function<void()> guard_finish_callback_a) :
guard_finish_callback (guard_finish_callback_a)
{
}

politeia::write_guard::write_guard (politeia::write_guard && write_guard_a) noexcept :
guard_finish_callback (std::move (write_guard_a.guard_finish_callback)),
owns (write_guard_a.owns)
{
	write_guard_a.owns = false;
	write_guard_a.guard_finish_callback = nullptr;
}

politeia::write_guard & politeia::write_guard::operator= (politeia::write_guard && write_guard_a) noexcept
{
	if (owns)
	{
		guard_finish_callback ();
	}
	owns = write_guard_a.owns;
	guard_finish_callback = std::move (write_guard_a.guard_finish_callback);

	write_guard_a.owns = false;
	write_guard_a.guard_finish_callback = nullptr;
	return *this;
}

politeia::write_guard::~write_guard ()
{
	if (owns)
	{
		guard_finish_callback ();
	}
}

bool politeia::write_guard::is_owned () const
{
	return owns;
}

void politeia::write_guard::release ()
{
	debug_assert (owns);
	if (owns)
	{
		guard_finish_callback ();
	}
	owns = false;
}

politeia::write_lock::write_lock () :
guard_finish_callback ([& queue = queue, &mutex = mutex, &condition = condition]() {
	{
		std::lock_guard<std::mutex> guard (mutex);
		queue.pop_front ();
	}
	condition.notify_all ();
})
{
}

politeia::error politeia::write_lock::acquire (std::chrono::milliseconds timeout_a, boost::optional<politeia::write_guard> & guard_a)
{
	politeia::error result;
	std::unique_lock<std::mutex> lock (mutex);
	auto ticket (next_ticket++);
	queue.push_back (ticket);
	auto owner (condition.wait_for (lock, timeout_a, [& queue = queue, ticket]() { return queue.front () == ticket; }));
	if (owner)
	{
		lock.unlock ();
		politeia::write_guard guard (guard_finish_callback);
		if (shutdown)
		{
			result.set ("Backend is shutting down", politeia::error_plugin::shutdown_in_progress);
		}
		else
		{
			guard_a.emplace (std::move (guard));
		}
	}
	else
	{
		auto existing (std::find (queue.begin (), queue.end (), ticket));
		debug_assert (existing != queue.end ());
		queue.erase (existing);
		lock.unlock ();
		condition.notify_all ();
		result.set ("Timed out waiting for the write lock", politeia::error_plugin::backend_busy);
	}
	return result;
}

void politeia::write_lock::stop ()
{
	shutdown = true;
	std::unique_lock<std::mutex> lock (mutex);
	auto ticket (next_ticket++);
	queue.push_back (ticket);
	condition.wait (lock, [& queue = queue, ticket]() { return queue.front () == ticket; });
	lock.unlock ();
	politeia::write_guard guard (guard_finish_callback);
}

bool politeia::write_lock::stopped () const
{
	return shutdown;
}

size_t politeia::write_lock::size ()
{
	std::lock_guard<std::mutex> guard (mutex);
	return queue.size ();
}
