#include "app/boardLoader.hpp"

#include "Logging.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace scramble::app {

static constexpr char LOG_REJECT[] = "[BoardLoader] Invalid board description: {}.";

static std::string_view trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1);
	}
	return text;
}

//! Split on '\n', dropping a trailing '\r' of every line.
static std::vector<std::string_view> splitLines(std::string_view text) {
	std::vector<std::string_view> lines;
	while (true) {
		const auto pos = text.find('\n');
		auto line      = text.substr(0, pos);
		if (!line.empty() && line.back() == '\r') {
			line.remove_suffix(1);
		}
		lines.push_back(line);

		if (pos == std::string_view::npos) {
			break;
		}
		text.remove_prefix(pos + 1);
	}
	return lines;
}

static std::optional<std::size_t> parseDimension(std::string_view digits) {
	if (digits.empty()) {
		return {};
	}
	for (const auto ch: digits) {
		if (!std::isdigit(static_cast<unsigned char>(ch))) {
			return {};
		}
	}

	std::size_t value{};
	const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
	if (ec != std::errc{} || end != digits.data() + digits.size() || value == 0) {
		return {};
	}
	return value;
}

static std::optional<BoardSetup> reject(const std::string& reason) {
	Logger().Log(Logging::LogLevel::Warning, std::format(LOG_REJECT, reason));
	return {};
}

std::optional<BoardSetup> parseBoard(std::string_view text) {
	const auto lines = splitLines(trim(text));
	if (lines.size() < 2) {
		return reject("missing card lines");
	}

	// Expect "<rows>x<cols>"
	const auto sizeLine = lines.front();
	const auto xPos     = sizeLine.find('x');
	if (xPos == std::string_view::npos) {
		return reject(std::format("malformed size line '{}'", sizeLine));
	}
	const auto rows = parseDimension(sizeLine.substr(0, xPos));
	const auto cols = parseDimension(sizeLine.substr(xPos + 1));
	if (!rows || !cols) {
		return reject(std::format("malformed size line '{}'", sizeLine));
	}
	if (*rows > std::numeric_limits<std::size_t>::max() / *cols) {
		return reject(std::format("board size '{}' too large", sizeLine));
	}

	const auto expected = *rows * *cols;
	if (lines.size() - 1 != expected) {
		return reject(std::format("expected {} cards, found {}", expected, lines.size() - 1));
	}

	BoardSetup setup{.rows = *rows, .cols = *cols, .cards = {}};
	setup.cards.reserve(expected);
	for (std::size_t i = 0; i != expected; ++i) {
		const auto card = trim(lines[i + 1]);
		if (card.empty()) {
			return reject(std::format("empty card at position {},{}", i / *cols, i % *cols));
		}
		setup.cards.emplace_back(card);
	}

	return setup;
}

std::optional<BoardSetup> loadBoardFile(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		return reject(std::format("cannot open '{}'", path.string()));
	}

	std::stringstream content;
	content << file.rdbuf();
	if (file.bad()) {
		return reject(std::format("cannot read '{}'", path.string()));
	}

	return parseBoard(content.str());
}

std::unique_ptr<Board> makeBoard(const BoardSetup& setup) {
	return std::make_unique<Board>(setup.rows, setup.cols, setup.cards);
}

} // namespace scramble::app
