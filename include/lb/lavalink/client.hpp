#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <functional>
#include <unordered_map>
#include <cstdint>

#include <dpp/dpp.h>

#include "lb/lavalink/track.hpp"

namespace lb::lavalink {

struct node_config {
    std::string host = "127.0.0.1";
    uint16_t    port = 2333;
    bool        https = false;
    std::string password;                   // Lavalink password
    std::string session_id  = "default";    // Lavalink v4 session id
    std::string client_name = "LyrebirdBot";
    std::uint32_t player_poll_seconds = 2;  // how often playing guilds are checked for a finished track
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

struct load_result {
    load_type          type = load_type::empty;
    std::vector<track> tracks;
    std::string        playlist_name;  // for load_type::playlist
    std::string        error_message;  // for load_type::error
    std::string        error_severity; // "common", "suspicious" or "fault"
    std::string        error_cause;
};

/// What Lavalink reports for one guild's player.
struct player_state {
    std::string  track_encoded;  // empty when nothing is loaded
    std::int64_t position_ms = 0;
    bool         paused      = false;
};

/// Parses a GET /v4/sessions/{sessionId}/players/{guildId} body.
/// std::nullopt when the body is not a player object.
std::optional<player_state> parse_player_state(const std::string& body);

/// Parses a /v4/loadtracks response body. Never throws; malformed bodies
/// become load_type::error with severity "fault".
load_result parse_load_result(const std::string& body);

class node {
public:
    node(dpp::cluster& cluster, const node_config& cfg);

    // Hook these from the bot:
    void handle_voice_state_update(const dpp::voice_state_update_t& ev);
    void handle_voice_server_update(const dpp::voice_server_update_t& ev);

    /// PATCH /v4/sessions/{sessionId}; call once the cluster is running.
    void ensure_session();

    /// Track lookup. `on_done` runs on a D++ request thread.
    void load_tracks(const std::string& identifier,
                     std::function<void(load_result)> on_done) const;

    /// Current player state. `on_done` gets std::nullopt when the node could
    /// not be asked; a guild without a player reports an empty state.
    void get_player(dpp::snowflake guild_id,
                    std::function<void(std::optional<player_state>)> on_done) const;

    // Player controls. false when the update could not be sent.
    bool play(dpp::snowflake guild_id,
              const std::string& encoded_track,
              bool no_replace = false,
              std::optional<std::int64_t> start_ms = std::nullopt);

    bool stop(dpp::snowflake guild_id);
    bool pause(dpp::snowflake guild_id, bool pause_flag);

private:
    struct voice_state {
        std::string session_id;      // Discord voice session id
        std::string token;
        std::string endpoint;
    };

    using completion = std::function<void(const dpp::http_request_completion_t&)>;

    dpp::cluster& m_cluster;
    node_config   m_cfg;

    mutable std::mutex m_voice_mutex;
    std::unordered_map<dpp::snowflake, voice_state> m_voice_states;

    void http_request(const std::string& method,
                      const std::string& urlpath,
                      const std::string& body_json,
                      completion on_done) const;

    std::optional<voice_state> get_voice_state_locked(dpp::snowflake guild_id) const;

    bool send_player_update(dpp::snowflake guild_id,
                            const dpp::json& payload,
                            const std::string& query = "");
};

} // namespace lb::lavalink
