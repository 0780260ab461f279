#pragma once

#include "scramble/board.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scramble::app {

//! Initial board layout read from a board description.
struct BoardSetup {
	std::size_t rows;
	std::size_t cols;
	std::vector<std::string> cards; //!< Row-major.
};

//! Parse a board description:
//!   line 1:  "<rows>x<cols>"
//!   then:    rows*cols non-blank card lines, row by row.
//! Returns empty on any deviation of the format.
std::optional<BoardSetup> parseBoard(std::string_view text);

//! Read and parse a board description file. Returns empty if the file cannot be read or is malformed.
std::optional<BoardSetup> loadBoardFile(const std::filesystem::path& path);

//! Create a fresh board from the setup.
std::unique_ptr<Board> makeBoard(const BoardSetup& setup);

} // namespace scramble::app
