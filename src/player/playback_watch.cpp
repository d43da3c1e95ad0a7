#include "lb/player/playback_watch.hpp"

namespace lb::player {

std::uint64_t playback_watch::started(const std::string& encoded)
{
    m_encoded     = encoded;
    m_active      = true;
    m_confirmed   = false;
    m_unconfirmed = 0;
    return ++m_generation;
}

void playback_watch::reset()
{
    m_encoded.clear();
    m_active      = false;
    m_confirmed   = false;
    m_unconfirmed = 0;
    ++m_generation;
}

bool playback_watch::observe(std::uint64_t generation, const lavalink::player_state& state)
{
    if (!m_active || generation != m_generation) {
        return false;
    }

    if (!state.track_encoded.empty() && state.track_encoded == m_encoded) {
        m_confirmed = true;
        return false;
    }

    // Until Lavalink has picked the track up it may still report the previous one.
    if (!m_confirmed && ++m_unconfirmed < k_unconfirmed_limit) {
        return false;
    }

    m_active = false;
    return true;
}

} // namespace lb::player
