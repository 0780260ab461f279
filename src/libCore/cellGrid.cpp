#include "scramble/cellGrid.hpp"

#include "Logging.hpp"

#include <cassert>
#include <format>

namespace scramble {

static constexpr char LOG_INVARIANT[] = "[CellGrid] Invariant violated at ({}, {}): {}.";

CellGrid::CellGrid(const std::size_t rows, const std::size_t cols, std::vector<std::string> cards) : m_rows(rows), m_cols(cols) {
	if (rows == 0 || cols == 0) {
		throw std::invalid_argument(std::format("Board must have positive dimensions, but has {}x{}.", rows, cols));
	}
	if (cards.size() != rows * cols) {
		throw std::invalid_argument(std::format("Board {}x{} needs {} cards, got {}.", rows, cols, rows * cols, cards.size()));
	}

	m_cells.reserve(cards.size());
	for (auto& card: cards) {
		m_cells.push_back(Cell{.content = std::move(card)});
	}
}

std::size_t CellGrid::rows() const {
	return m_rows;
}

std::size_t CellGrid::cols() const {
	return m_cols;
}

bool CellGrid::contains(const Coord c) const {
	return c.row < m_rows && c.col < m_cols;
}

Cell& CellGrid::at(const Coord c) {
	assert(contains(c));
	return m_cells[c.row * m_cols + c.col];
}

const Cell& CellGrid::at(const Coord c) const {
	assert(contains(c));
	return m_cells[c.row * m_cols + c.col];
}

void CellGrid::checkInvariants() const {
	auto fail = [](Coord c, const char* reason) {
		const auto message = std::format(LOG_INVARIANT, c.row, c.col, reason);
		Logger().Log(Logging::LogLevel::Error, message);
		throw InvariantViolation(message);
	};

	for (Id row = 0; row != m_rows; ++row) {
		for (Id col = 0; col != m_cols; ++col) {
			const Coord c{row, col};
			const auto& cell = at(c);

			if (!cell.content && cell.faceUp) {
				fail(c, "removed card is face up");
			}
			if (!cell.content && cell.controller) {
				fail(c, "removed card has a controller");
			}
			if (cell.controller && !cell.faceUp) {
				fail(c, "controlled card is face down");
			}
		}
	}
}

} // namespace scramble
