#pragma once

#include "scramble/types.hpp"

#include <array>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace scramble {

//! A card a player flipped during the current turn.
struct Pick {
	Coord coord;
	std::string content; //!< Card symbol at the time of the flip.
};

// Turn states of a player.
struct IdleTurn {};
struct HoldingFirst {
	Pick first;
};
//! Matched pair, removed on the player's next flip.
struct PendingMatch {
	std::array<Coord, 2> cards;
};
//! Cards turned face down on the player's next flip, if nobody took them meanwhile.
struct PendingMismatch {
	std::vector<Coord> cards;
};

using TurnState = std::variant<IdleTurn, HoldingFirst, PendingMatch, PendingMismatch>;

struct PlayerSession {
	TurnState state{}; //!< Where the player is in its turn.
};

//! Owns the sessions of all players that ever flipped a card.
//! \note Sessions are kept for the lifetime of the board.
class SessionTracker {
public:
	//! Session of the player. Created on first access.
	PlayerSession& get(const PlayerId& player);

	std::size_t size() const;

private:
	std::unordered_map<PlayerId, PlayerSession> m_sessions;
};

} // namespace scramble
