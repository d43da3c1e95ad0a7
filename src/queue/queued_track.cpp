#include "lb/queue/queued_track.hpp"

#include <atomic>
#include <limits>
#include <random>

namespace lb::queue {

namespace {

std::atomic<std::uint64_t> g_next_track_id{1};

std::int32_t random_rank()
{
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::int32_t> dist(
        std::numeric_limits<std::int32_t>::min(),
        std::numeric_limits<std::int32_t>::max());
    return dist(engine);
}

} // namespace

queued_track::queued_track(lavalink::track track, dpp::snowflake user_id, bool priority)
    : m_track(std::move(track))
    , m_user_id(user_id)
    , m_track_id(g_next_track_id.fetch_add(1))
    , m_priority(priority)
    , m_rank(random_rank())
{
}

std::shared_ptr<queued_track> queued_track::make_clone() const
{
    return std::make_shared<queued_track>(m_track, m_user_id, false);
}

void queued_track::randomize()
{
    m_rank = random_rank();
}

} // namespace lb::queue
