#pragma once

#include <memory>
#include <cstdint>

#include <dpp/snowflake.h>

#include "lb/lavalink/track.hpp"

namespace lb::queue {

/// A resolved track waiting in (or playing from) a guild queue.
class queued_track {
public:
    queued_track(lavalink::track track, dpp::snowflake user_id, bool priority = false);

    /// New identity and track id, same item. Replays start from the beginning
    /// and never keep priority.
    std::shared_ptr<queued_track> make_clone() const;

    const lavalink::track& track() const { return m_track; }
    dpp::snowflake user_id() const { return m_user_id; }
    std::uint64_t track_id() const { return m_track_id; }

    bool is_priority() const { return m_priority; }
    void set_priority(bool priority) { m_priority = priority; }

    std::int32_t rank() const { return m_rank; }
    void set_rank(std::int32_t rank) { m_rank = rank; }
    void randomize();

    std::int64_t start_position_ms() const { return m_start_position_ms; }
    void set_start_position_ms(std::int64_t position) { m_start_position_ms = position; }

    std::int64_t effective_duration_ms() const { return m_track.length_ms; }
    bool is_stream() const { return m_track.is_stream; }

private:
    lavalink::track m_track;
    dpp::snowflake  m_user_id;
    std::uint64_t   m_track_id;
    bool            m_priority;
    std::int32_t    m_rank = 0;
    std::int64_t    m_start_position_ms = 0;
};

using queued_track_ptr = std::shared_ptr<queued_track>;

} // namespace lb::queue
