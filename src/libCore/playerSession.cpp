#include "scramble/playerSession.hpp"

namespace scramble {

PlayerSession& SessionTracker::get(const PlayerId& player) {
	return m_sessions.try_emplace(player).first->second;
}

std::size_t SessionTracker::size() const {
	return m_sessions.size();
}

} // namespace scramble
