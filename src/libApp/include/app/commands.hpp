#pragma once

#include "scramble/board.hpp"
#include "scramble/cellGrid.hpp"
#include "scramble/types.hpp"

#include <string>

namespace scramble::app {

//! Answer to a player request.
struct Response {
	FlipResult result{FlipResult::Ok};
	std::string view; //!< Board as seen by the requesting player after the request.
};

//! Board from the player's perspective:
//!   "<rows>x<cols>" followed by one line per card in row-major order,
//!   each one of "none", "down", "my <card>" or "up <card>".
std::string renderBoard(const CellGrid& grid, const PlayerId& player);

//! Debug dump of all cards, one text row per board row.
std::string renderBoard(const CellGrid& grid);

Response look(const Board& board, const PlayerId& player);

//! Flip a card. The view is rendered even if the flip was rejected.
Response flip(Board& board, const PlayerId& player, Coord c);

//! Replace every card by f(card).
Response map(Board& board, const PlayerId& player, const Board::Transform& f);

//! Wait for the next visible change of the board.
Response watch(Board& board, const PlayerId& player);

} // namespace scramble::app
