#pragma once

#include "scramble/cellGrid.hpp"
#include "scramble/types.hpp"
#include "scramble/wakeSignal.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace scramble {

//! Assigns card control to players and queues players waiting for a controlled card.
//! Every cell has its own FIFO queue; a release hands the card to the oldest waiter of that cell only.
//! \note Not synchronized itself. All calls happen under the board lock.
class OwnershipManager {
public:
	explicit OwnershipManager(CellGrid& grid);

	//! Take control of the card if it is free or already ours. Never blocks.
	bool tryAcquire(Coord c, const PlayerId& player);

	//! Clear the controller and wake the oldest waiter of that cell, if any.
	//! The woken waiter becomes the controller right away unless the card was removed,
	//! so no later player can take the card before the waiter runs again.
	void release(Coord c);

	//! Wake the oldest waiter of the cell without changing the controller.
	//! Returns false if nobody was waiting.
	bool wakeNext(Coord c);

	//! Queue the player on the cell and suspend until a release wakes it.
	//! \param lock    Lock on the board mutex. Released while suspended, held again on return.
	//! \param atFront Queue ahead of everybody else. Used by a waiter that has to wait again.
	void enqueueAndWait(Coord c, const PlayerId& player, std::unique_lock<std::mutex>& lock, bool atFront = false);

	//! Number of players suspended on the cell.
	std::size_t waiting(Coord c) const;

private:
	struct Waiter {
		PlayerId player;
		std::shared_ptr<WakeSignal> signal;
	};

	std::size_t index(Coord c) const;

	//! Remove the oldest waiter of the cell from its queue. Empty if there is none.
	std::optional<Waiter> popWaiter(Coord c);

private:
	CellGrid& m_grid;
	std::unordered_map<std::size_t, std::deque<Waiter>> m_waitQueues; //!< Waiters per cell index.
};

} // namespace scramble
