#pragma once

#include "scramble/cellGrid.hpp"
#include "scramble/changeNotifier.hpp"
#include "scramble/ownershipManager.hpp"
#include "scramble/playerSession.hpp"
#include "scramble/types.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scramble {

//! Memory game board shared by any number of concurrently playing players.
//!
//! A turn consists of two flips. The first flip takes control of a card, waiting in line if another
//! player controls it. The second flip never waits: if the card is taken, the player loses the first card.
//! Matched pairs are removed and mismatched cards turned face down only on the player's next flip.
class Board {
public:
	using Transform = std::function<std::string(const std::string&)>;

public:
	//! Face down board with cards given in row-major order.
	Board(std::size_t rows, std::size_t cols, std::vector<std::string> cards);

	std::size_t rows() const;
	std::size_t cols() const;

	//! Flip the card at c for the player.
	//! \note Blocks while the card is the player's first pick and controlled by another player.
	FlipResult flip(const PlayerId& player, Coord c);

	void watch();                                      //!< Block until the next visible change.
	bool watchFor(std::chrono::milliseconds timeout); //!< Returns false if nothing visible changed in time.

	//! Replace every remaining card by f(card). Runs f concurrently on up to kTransformWorkers threads,
	//! without holding the board. Cards removed while f was running keep removed.
	//! \note If f throws, the other cards are still transformed and the first exception is rethrown afterwards.
	void transform(const Transform& f);

	static constexpr std::size_t kTransformWorkers = 16u; //!< Upper bound of threads started by transform().

public:
	bool isFaceUp(Coord c) const;
	std::optional<PlayerId> controllerOf(Coord c) const;
	CellGrid snapshot() const; //!< Consistent copy of all cells.

	std::size_t waitingOn(Coord c) const; //!< Players blocked on a first pick of this card.
	std::size_t watcherCount() const;
	std::size_t playerCount() const;

private:
	//! Remove the last matched pair or turn the last mismatch face down.
	void commitPendingTurn(PlayerSession& session);

	FlipResult resolvePick(const PlayerId& player, PlayerSession& session, const IdleTurn&, Coord c, bool waited);
	FlipResult resolvePick(const PlayerId& player, PlayerSession& session, const HoldingFirst& state, Coord c, bool waited);

	//! Pending turns are committed before a pick, so no other state may reach here.
	template <class State>
	FlipResult resolvePick(const PlayerId&, PlayerSession&, const State&, Coord, bool) {
		assert(false && "pending turn not committed before pick");
		return FlipResult::ProtocolViolation;
	}

	//! Give up the first card after a failed second pick.
	void forfeitFirst(PlayerSession& session, const Pick& first);

	bool reveal(Coord c); //!< Turn card face up. Returns true if it was face down.

private:
	mutable std::mutex m_mutex; //!< Guards grid, ownership and sessions.

	CellGrid m_grid;
	OwnershipManager m_ownership{m_grid};
	SessionTracker m_sessions;
	ChangeNotifier m_notifier;
};

} // namespace scramble
