#include "lb/player/guild_player.hpp"

#include <vector>

namespace lb::player {

guild_player::guild_player(dpp::cluster& cluster,
                           lavalink::node& node,
                           dpp::snowflake guild_id,
                           loader::ratelimiter& ratelimiter,
                           loader::resolver& resolver,
                           const loader::loader_config& cfg)
    : m_cluster(cluster)
    , m_node(node)
    , m_guild_id(guild_id)
    , m_loader(cluster, ratelimiter, m_provider, resolver, *this, cfg)
{
}

bool guild_player::is_playing() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_playing != nullptr && !m_paused;
}

bool guild_player::is_paused() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

void guild_player::play()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_paused) {
        m_paused = false;
        m_node.pause(m_guild_id, false);
    }
    if (!m_playing) {
        play_next_locked();
    }
}

std::size_t guild_player::track_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_provider.size() + (m_playing ? 1 : 0);
}

queue::queued_track_ptr guild_player::playing() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_playing;
}

void guild_player::set_paused(bool paused)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_paused == paused) {
        return;
    }
    m_paused = paused;
    m_node.pause(m_guild_id, paused);
}

void guild_player::skip()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_provider.skipped();
    play_next_locked();
}

void guild_player::stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_provider.clear();
    m_playing.reset();
    m_watch.reset();
    m_node.stop(m_guild_id);
}

void guild_player::poll()
{
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_playing || m_paused || !m_watch.active()) {
            return;
        }
        generation = m_watch.generation();
    }

    m_node.get_player(m_guild_id, [this, generation](std::optional<lavalink::player_state> state) {
        if (state) {
            on_player_state(generation, *state);
        }
    });
}

void guild_player::on_player_state(std::uint64_t generation, const lavalink::player_state& state)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_watch.observe(generation, state)) {
        return;
    }

    m_cluster.log(dpp::ll_debug, "Track ended in guild " + m_guild_id.str());
    m_playing.reset();
    play_next_locked();
}

void guild_player::play_next_locked()
{
    m_playing = m_provider.provide_next();
    if (!m_playing) {
        m_cluster.log(dpp::ll_debug, "Queue exhausted for guild " + m_guild_id.str());
        m_watch.reset();
        m_node.stop(m_guild_id);
        return;
    }

    m_watch.started(m_playing->track().encoded);
    m_node.play(m_guild_id,
                m_playing->track().encoded,
                false,
                m_playing->start_position_ms());
}

player_registry::player_registry(dpp::cluster& cluster,
                                 lavalink::node& node,
                                 loader::ratelimiter& ratelimiter,
                                 loader::resolver& resolver,
                                 const loader::loader_config& cfg)
    : m_cluster(cluster)
    , m_node(node)
    , m_ratelimiter(ratelimiter)
    , m_resolver(resolver)
    , m_cfg(cfg)
{
}

guild_player& player_registry::get_or_create(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& player = m_players[guild_id];
    if (!player) {
        m_cluster.log(dpp::ll_debug, "Creating player for guild " + guild_id.str());
        player = std::make_unique<guild_player>(m_cluster, m_node, guild_id,
                                                m_ratelimiter, m_resolver, m_cfg);
    }
    return *player;
}

guild_player* player_registry::find(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(guild_id);
    return it == m_players.end() ? nullptr : it->second.get();
}

void player_registry::poll_all()
{
    std::vector<guild_player*> players;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        players.reserve(m_players.size());
        for (const auto& entry : m_players) {
            players.push_back(entry.second.get());
        }
    }

    for (auto* player : players) {
        player->poll();
    }
}

} // namespace lb::player
