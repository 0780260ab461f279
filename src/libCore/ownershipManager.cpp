#include "scramble/ownershipManager.hpp"

namespace scramble {

OwnershipManager::OwnershipManager(CellGrid& grid) : m_grid(grid) {
}

bool OwnershipManager::tryAcquire(const Coord c, const PlayerId& player) {
	auto& cell = m_grid.at(c);
	if (cell.controller && *cell.controller != player) {
		return false;
	}

	cell.controller = player;
	return true;
}

void OwnershipManager::release(const Coord c) {
	auto& cell = m_grid.at(c);
	cell.controller.reset();

	auto next = popWaiter(c);
	if (!next) {
		return;
	}

	// A removed card has no controller. The waiter finds it gone and passes the wake-up on.
	if (cell.content) {
		cell.controller = next->player;
	}
	next->signal->fire();
}

bool OwnershipManager::wakeNext(const Coord c) {
	const auto next = popWaiter(c);
	if (!next) {
		return false;
	}

	next->signal->fire();
	return true;
}

void OwnershipManager::enqueueAndWait(const Coord c, const PlayerId& player, std::unique_lock<std::mutex>& lock, const bool atFront) {
	auto signal = std::make_shared<WakeSignal>();
	auto& queue = m_waitQueues[index(c)];
	if (atFront) {
		queue.push_front({player, signal});
	} else {
		queue.push_back({player, signal});
	}

	signal->wait(lock);
}

std::size_t OwnershipManager::waiting(const Coord c) const {
	const auto it = m_waitQueues.find(index(c));
	return it == m_waitQueues.end() ? 0u : it->second.size();
}

std::size_t OwnershipManager::index(const Coord c) const {
	return c.row * m_grid.cols() + c.col;
}

std::optional<OwnershipManager::Waiter> OwnershipManager::popWaiter(const Coord c) {
	const auto it = m_waitQueues.find(index(c));
	if (it == m_waitQueues.end()) {
		return {};
	}

	auto& queue = it->second;
	auto next   = std::move(queue.front());
	queue.pop_front();
	if (queue.empty()) {
		m_waitQueues.erase(it);
	}
	return next;
}

} // namespace scramble
