#include "app/commands.hpp"

#include "Logging.hpp"

#include <format>

namespace scramble::app {

std::string renderBoard(const CellGrid& grid, const PlayerId& player) {
	std::string out = std::format("{}x{}\n", grid.rows(), grid.cols());
	for (Id row = 0; row != grid.rows(); ++row) {
		for (Id col = 0; col != grid.cols(); ++col) {
			const auto& cell = grid.at({row, col});
			if (!cell.content) {
				out += "none\n";
			} else if (!cell.faceUp) {
				out += "down\n";
			} else if (cell.controller == player) {
				out += std::format("my {}\n", *cell.content);
			} else {
				out += std::format("up {}\n", *cell.content);
			}
		}
	}
	return out;
}

std::string renderBoard(const CellGrid& grid) {
	std::string out;
	for (Id row = 0; row != grid.rows(); ++row) {
		for (Id col = 0; col != grid.cols(); ++col) {
			const auto& cell = grid.at({row, col});
			if (!cell.content) {
				out += "none(none) ";
			} else {
				out += std::format("{}({}) ", *cell.content, cell.faceUp ? "up" : "down");
			}
		}
		out += "\n";
	}
	return out;
}

Response look(const Board& board, const PlayerId& player) {
	return {FlipResult::Ok, renderBoard(board.snapshot(), player)};
}

Response flip(Board& board, const PlayerId& player, const Coord c) {
	const auto result = board.flip(player, c);
	if (result != FlipResult::Ok) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Commands] Flip of '{}' at ({}, {}) failed: {}.", player, c.row, c.col, toString(result)));
	}
	return {result, renderBoard(board.snapshot(), player)};
}

Response map(Board& board, const PlayerId& player, const Board::Transform& f) {
	board.transform(f);
	return {FlipResult::Ok, renderBoard(board.snapshot(), player)};
}

Response watch(Board& board, const PlayerId& player) {
	board.watch();
	return {FlipResult::Ok, renderBoard(board.snapshot(), player)};
}

} // namespace scramble::app
