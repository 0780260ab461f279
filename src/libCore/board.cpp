#include "scramble/board.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <future>

namespace scramble {

static constexpr char LOG_REJECT[]    = "[Board] Rejected flip of '{}' at ({}, {}): {}.";
static constexpr char LOG_WAIT[]      = "[Board] Player '{}' waits for card ({}, {}) held by '{}'.";
static constexpr char LOG_WOKEN[]     = "[Board] Player '{}' woken for card ({}, {}).";
static constexpr char LOG_MATCH[]     = "[Board] Player '{}' matched '{}' at ({}, {}) and ({}, {}).";
static constexpr char LOG_REMOVED[]   = "[Board] Removed matched pair of player '{}'.";
static constexpr char LOG_TRANSFORM[] = "[Board] Transformed {} cards.";

Board::Board(const std::size_t rows, const std::size_t cols, std::vector<std::string> cards) : m_grid(rows, cols, std::move(cards)) {
	m_grid.checkInvariants();
}

std::size_t Board::rows() const {
	return m_grid.rows();
}

std::size_t Board::cols() const {
	return m_grid.cols();
}

FlipResult Board::flip(const PlayerId& player, const Coord c) {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_grid.checkInvariants();

	if (!m_grid.contains(c)) {
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REJECT, player, c.row, c.col, toString(FlipResult::InvalidCoordinates)));
		return FlipResult::InvalidCoordinates;
	}

	auto& session = m_sessions.get(player);
	commitPendingTurn(session);

	// Only a first pick waits. Waiting with a card in hand could deadlock two players.
	// A release hands the card to the woken waiter, so the loop normally runs at most once.
	bool waited = false;
	if (std::holds_alternative<IdleTurn>(session.state)) {
		while (true) {
			const auto& cell = m_grid.at(c);
			if (!cell.content || !cell.controller || *cell.controller == player) {
				break;
			}
			Logger().Log(Logging::LogLevel::Debug, std::format(LOG_WAIT, player, c.row, c.col, *cell.controller));
			m_ownership.enqueueAndWait(c, player, lock, waited);
			Logger().Log(Logging::LogLevel::Debug, std::format(LOG_WOKEN, player, c.row, c.col));
			waited = true;
		}
	}

	const auto result = std::visit([&](const auto& state) { return resolvePick(player, session, state, c, waited); }, session.state);
	if (result != FlipResult::Ok) {
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REJECT, player, c.row, c.col, toString(result)));
	}

	m_grid.checkInvariants();
	return result;
}

void Board::commitPendingTurn(PlayerSession& session) {
	if (const auto* match = std::get_if<PendingMatch>(&session.state)) {
		bool removed = false;
		for (const auto c: match->cards) {
			auto& cell = m_grid.at(c);
			if (!cell.content) {
				continue;
			}
			cell.content.reset();
			cell.faceUp = false;
			m_ownership.release(c);
			removed = true;
		}

		session.state = IdleTurn{};
		if (removed) {
			m_notifier.notify();
		}
		return;
	}

	if (const auto* mismatch = std::get_if<PendingMismatch>(&session.state)) {
		bool hidden = false;
		for (const auto c: mismatch->cards) {
			auto& cell = m_grid.at(c);
			// Another player may have taken the card since; it is theirs to turn then.
			if (cell.content && cell.faceUp && !cell.controller) {
				cell.faceUp = false;
				hidden      = true;
			}
		}

		session.state = IdleTurn{};
		if (hidden) {
			m_notifier.notify();
		}
	}
}

FlipResult Board::resolvePick(const PlayerId& player, PlayerSession& session, const IdleTurn&, const Coord c, const bool waited) {
	const auto& cell = m_grid.at(c);
	if (!cell.content) {
		// Let the next waiter see the removal too.
		if (waited) {
			m_ownership.wakeNext(c);
		}
		return FlipResult::NoCardAtPosition;
	}

	if (!m_ownership.tryAcquire(c, player)) {
		return FlipResult::CardControlledByOther;
	}

	const bool revealed = reveal(c);
	session.state       = HoldingFirst{Pick{c, *cell.content}};

	if (revealed) {
		m_notifier.notify();
	}
	return FlipResult::Ok;
}

FlipResult Board::resolvePick(const PlayerId& player, PlayerSession& session, const HoldingFirst& state, const Coord c, bool) {
	const Pick first = state.first;
	if (c == first.coord) {
		return FlipResult::Ok; // Double click on the first card.
	}

	const auto& cell = m_grid.at(c);
	if (!cell.content) {
		forfeitFirst(session, first);
		return FlipResult::NoCardAtPosition;
	}
	if (!m_ownership.tryAcquire(c, player)) {
		forfeitFirst(session, first);
		return FlipResult::CardAlreadyControlled;
	}

	const bool revealed = reveal(c);
	const Pick second{c, *cell.content};

	if (first.content == second.content) {
		Logger().Log(Logging::LogLevel::Info,
		             std::format(LOG_MATCH, player, first.content, first.coord.row, first.coord.col, second.coord.row, second.coord.col));
		session.state = PendingMatch{{first.coord, second.coord}};
	} else {
		m_ownership.release(first.coord);
		m_ownership.release(second.coord);
		session.state = PendingMismatch{{first.coord, second.coord}};
	}

	if (revealed) {
		m_notifier.notify();
	}
	return FlipResult::Ok;
}

void Board::forfeitFirst(PlayerSession& session, const Pick& first) {
	m_ownership.release(first.coord);
	session.state = PendingMismatch{{first.coord}};
}

bool Board::reveal(const Coord c) {
	auto& cell = m_grid.at(c);
	if (cell.faceUp) {
		return false;
	}
	cell.faceUp = true;
	return true;
}

void Board::watch() {
	m_notifier.watch();
}

bool Board::watchFor(const std::chrono::milliseconds timeout) {
	return m_notifier.watchFor(timeout);
}

void Board::transform(const Transform& f) {
	struct LiveCard {
		Coord coord;
		std::string content;
	};

	std::vector<LiveCard> cards;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		for (Id row = 0; row != m_grid.rows(); ++row) {
			for (Id col = 0; col != m_grid.cols(); ++col) {
				const auto& cell = m_grid.at({row, col});
				if (cell.content) {
					cards.push_back({{row, col}, *cell.content});
				}
			}
		}
	}

	// Workers take the next card until all are done. A throwing f only costs its own card.
	std::atomic<std::size_t> nextCard{0u};
	std::mutex failureMutex;
	std::exception_ptr failure;

	auto work = [&] {
		for (auto i = nextCard++; i < cards.size(); i = nextCard++) {
			const auto& card = cards[i];
			try {
				auto next = f(card.content);

				std::lock_guard<std::mutex> lock(m_mutex);
				auto& cell = m_grid.at(card.coord);
				if (cell.content) {
					cell.content = std::move(next);
				}
			} catch (...) {
				std::lock_guard<std::mutex> lock(failureMutex);
				if (!failure) {
					failure = std::current_exception();
				}
			}
		}
	};

	const auto workerCount = std::min(cards.size(), kTransformWorkers);
	std::vector<std::future<void>> workers;
	workers.reserve(workerCount);
	for (std::size_t i = 0; i != workerCount; ++i) {
		workers.push_back(std::async(std::launch::async, work));
	}
	for (auto& worker: workers) {
		worker.get();
	}

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_grid.checkInvariants();
	}
	Logger().Log(Logging::LogLevel::Info, std::format(LOG_TRANSFORM, cards.size()));
	m_notifier.notify();

	if (failure) {
		std::rethrow_exception(failure);
	}
}

bool Board::isFaceUp(const Coord c) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_grid.contains(c) && m_grid.at(c).faceUp;
}

std::optional<PlayerId> Board::controllerOf(const Coord c) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (!m_grid.contains(c)) {
		return std::nullopt;
	}
	return m_grid.at(c).controller;
}

CellGrid Board::snapshot() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_grid;
}

std::size_t Board::waitingOn(const Coord c) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_grid.contains(c) ? m_ownership.waiting(c) : 0u;
}

std::size_t Board::watcherCount() const {
	return m_notifier.watcherCount();
}

std::size_t Board::playerCount() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.size();
}

} // namespace scramble
