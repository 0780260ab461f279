#pragma once

#include "scramble/wakeSignal.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace scramble {

//! Lets observers wait for the next visible change of the board.
//! A notification wakes every watcher registered before it and clears the registry,
//! so each watcher is woken at most once and has to watch again for the next change.
class ChangeNotifier {
public:
	void watch();                                      //!< Block until the next notification.
	bool watchFor(std::chrono::milliseconds timeout); //!< Returns false if nothing changed in time.

	//! Wake all registered watchers.
	void notify();

	std::size_t watcherCount() const;

private:
	mutable std::mutex m_watcherMutex;
	std::vector<std::shared_ptr<WakeSignal>> m_watchers;
};

} // namespace scramble
