#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace scramble {

using Id       = std::size_t; //!< Row or column index on the board.
using PlayerId = std::string; //!< Identifies a player across all requests.

//! Position of a card on the board. Origin is the top left card.
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

//! Outcome of a flip request.
enum class FlipResult {
	Ok,
	InvalidCoordinates,    //!< Position outside the board.
	NoCardAtPosition,      //!< Card at the position was already removed.
	CardControlledByOther, //!< First pick on a card someone else took while we were woken.
	CardAlreadyControlled, //!< Second pick on a card controlled by another player. Never waits.
	ProtocolViolation,     //!< Player tried to hold more than two cards.
};

//! Message reported to the player for a flip result.
inline constexpr std::string_view toString(FlipResult result) {
	switch (result) {
	case FlipResult::Ok:
		return "Ok";
	case FlipResult::InvalidCoordinates:
		return "Invalid coordinates";
	case FlipResult::NoCardAtPosition:
		return "No card at that position";
	case FlipResult::CardControlledByOther:
		return "Card controlled by another player";
	case FlipResult::CardAlreadyControlled:
		return "Card already controlled";
	case FlipResult::ProtocolViolation:
		return "Player cannot flip a third card without completing a pair";
	}
	return "Unknown";
}

} // namespace scramble
