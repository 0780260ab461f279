#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace scramble {

//! One-shot wake-up for a single suspended thread.
//! \note All calls must be made while holding the mutex the waiter passes to wait().
class WakeSignal {
public:
	//! Blocks until fire() was called. Releases the lock while suspended.
	void wait(std::unique_lock<std::mutex>& lock) {
		m_condition.wait(lock, [this] { return m_fired; });
	}

	//! Returns false if the timeout expired before fire() was called.
	bool waitFor(std::unique_lock<std::mutex>& lock, std::chrono::milliseconds timeout) {
		return m_condition.wait_for(lock, timeout, [this] { return m_fired; });
	}

	void fire() {
		m_fired = true;
		m_condition.notify_one();
	}

	bool fired() const {
		return m_fired;
	}

private:
	bool m_fired{false};
	std::condition_variable m_condition;
};

} // namespace scramble
