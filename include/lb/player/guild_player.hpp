#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <dpp/dpp.h>

#include "lb/lavalink/client.hpp"
#include "lb/loader/audio_loader.hpp"
#include "lb/loader/playback_controller.hpp"
#include "lb/player/playback_watch.hpp"
#include "lb/queue/simple_track_provider.hpp"

namespace lb::player {

/// One guild's queue, loader and Lavalink player.
class guild_player : public loader::playback_controller {
public:
    guild_player(dpp::cluster& cluster,
                 lavalink::node& node,
                 dpp::snowflake guild_id,
                 loader::ratelimiter& ratelimiter,
                 loader::resolver& resolver,
                 const loader::loader_config& cfg);

    guild_player(const guild_player&) = delete;
    guild_player& operator=(const guild_player&) = delete;

    dpp::snowflake guild_id() const { return m_guild_id; }
    queue::track_provider& provider() { return m_provider; }
    loader::audio_loader& loader() { return m_loader; }

    bool is_playing() const override;
    bool is_paused() const override;
    void play() override;
    std::size_t track_count() const override;

    queue::queued_track_ptr playing() const;

    void set_paused(bool paused);
    /// Drops the current track, forgets it as the repeat source and starts the next one.
    void skip();
    /// Clears the queue and stops playback.
    void stop();

    /// Asks Lavalink whether the current track is still playing.
    void poll();
    /// Moves on to the next track once the current one has ended.
    void on_player_state(std::uint64_t generation, const lavalink::player_state& state);

private:
    dpp::cluster&                m_cluster;
    lavalink::node&              m_node;
    dpp::snowflake               m_guild_id;
    queue::simple_track_provider m_provider;
    loader::audio_loader         m_loader;

    mutable std::mutex      m_mutex;
    queue::queued_track_ptr m_playing;
    bool                    m_paused = false;
    playback_watch          m_watch;

    void play_next_locked();
};

/// Creates players on first use and keeps them for the lifetime of the bot.
class player_registry {
public:
    player_registry(dpp::cluster& cluster,
                    lavalink::node& node,
                    loader::ratelimiter& ratelimiter,
                    loader::resolver& resolver,
                    const loader::loader_config& cfg);

    guild_player& get_or_create(dpp::snowflake guild_id);
    guild_player* find(dpp::snowflake guild_id);

    /// Polls every player that has a track.
    void poll_all();

private:
    dpp::cluster&         m_cluster;
    lavalink::node&       m_node;
    loader::ratelimiter&  m_ratelimiter;
    loader::resolver&     m_resolver;
    loader::loader_config m_cfg;

    std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, std::unique_ptr<guild_player>> m_players;
};

} // namespace lb::player
