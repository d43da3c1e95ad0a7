#pragma once

#include <cstdint>
#include <string>

#include "lb/lavalink/client.hpp"

namespace lb::player {

/// Follows what Lavalink reports for the track we last asked it to play.
/// A track has ended once Lavalink was seen playing it and then reports no
/// track or another one. A track never seen playing is given up on after
/// k_unconfirmed_limit polls.
class playback_watch {
public:
    static constexpr int k_unconfirmed_limit = 5;

    /// A new track was sent to Lavalink. Returns the generation polls must carry.
    std::uint64_t started(const std::string& encoded);

    /// Playback stopped on our side; pending polls become stale.
    void reset();

    std::uint64_t generation() const { return m_generation; }
    bool active() const { return m_active; }

    /// @return true exactly once, when the track started under `generation` has ended
    bool observe(std::uint64_t generation, const lavalink::player_state& state);

private:
    std::string   m_encoded;
    std::uint64_t m_generation  = 0;
    bool          m_active      = false;
    bool          m_confirmed   = false;
    int           m_unconfirmed = 0;
};

} // namespace lb::player
