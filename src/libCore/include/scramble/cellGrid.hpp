#pragma once

#include "scramble/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace scramble {

//! Internal consistency failure of the board. Signals a bug, not a rejected move.
class InvariantViolation : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

//! One position on the board.
struct Cell {
	std::optional<std::string> content;   //!< Card symbol. Empty once the card was removed.
	bool faceUp{false};                   //!< Visible to all players.
	std::optional<PlayerId> controller{}; //!< Player currently holding the card.
};

//! Fixed size matrix of cards stored in row-major order.
class CellGrid {
public:
	//! Creates a face down, uncontrolled grid.
	//! \note Throws std::invalid_argument if a dimension is zero or cards.size() != rows * cols.
	CellGrid(std::size_t rows, std::size_t cols, std::vector<std::string> cards);

	std::size_t rows() const;
	std::size_t cols() const;

	bool contains(Coord c) const; //!< True if c lies on the board.

	Cell& at(Coord c); //!< With c.row \in [0, rows-1] and c.col \in [0, cols-1]
	const Cell& at(Coord c) const;

	//! Verifies that every cell is consistent:
	//!  - removed cards are face down and uncontrolled,
	//!  - controlled cards exist and are face up.
	//! \note Throws InvariantViolation on the first inconsistent cell.
	void checkInvariants() const;

private:
	std::size_t m_rows;
	std::size_t m_cols;
	std::vector<Cell> m_cells;
};

} // namespace scramble
