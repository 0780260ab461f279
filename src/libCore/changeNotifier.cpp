#include "scramble/changeNotifier.hpp"

#include <algorithm>

namespace scramble {

void ChangeNotifier::watch() {
	std::unique_lock<std::mutex> lock(m_watcherMutex);

	auto signal = std::make_shared<WakeSignal>();
	m_watchers.push_back(signal);
	signal->wait(lock);
}

bool ChangeNotifier::watchFor(const std::chrono::milliseconds timeout) {
	std::unique_lock<std::mutex> lock(m_watcherMutex);

	auto signal = std::make_shared<WakeSignal>();
	m_watchers.push_back(signal);
	if (signal->waitFor(lock, timeout)) {
		return true;
	}

	m_watchers.erase(std::remove(m_watchers.begin(), m_watchers.end(), signal), m_watchers.end());
	return false;
}

void ChangeNotifier::notify() {
	std::lock_guard<std::mutex> lock(m_watcherMutex);

	auto watchers = std::move(m_watchers);
	m_watchers.clear();
	for (const auto& watcher: watchers) {
		watcher->fire();
	}
}

std::size_t ChangeNotifier::watcherCount() const {
	std::lock_guard<std::mutex> lock(m_watcherMutex);
	return m_watchers.size();
}

} // namespace scramble
