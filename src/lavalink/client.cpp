#include "lb/lavalink/client.hpp"

#include <map>
#include <sstream>

namespace lb::lavalink {

using json = dpp::json;

namespace {

track parse_track(const json& el)
{
    track t;
    t.encoded = el.value("encoded", "");

    if (el.contains("info") && el["info"].is_object()) {
        const auto& info = el["info"];
        t.identifier = info.value("identifier", "");
        t.title      = info.value("title", "");
        t.author     = info.value("author", "");
        t.uri        = info.value("uri", "");
        t.length_ms  = info.value("length", std::int64_t{0});
        t.is_stream  = info.value("isStream", false);
    }
    return t;
}

void parse_tracks(const json& array, std::vector<track>& out)
{
    if (!array.is_array()) {
        return;
    }
    for (const auto& el : array) {
        if (!el.is_object()) {
            continue;
        }
        track t = parse_track(el);
        // encoded is the only thing strictly required to play
        if (!t.encoded.empty()) {
            out.push_back(std::move(t));
        }
    }
}

load_result make_error(const std::string& message)
{
    load_result res;
    res.type           = load_type::error;
    res.error_message  = message;
    res.error_severity = "fault";
    return res;
}

} // namespace

load_result parse_load_result(const std::string& body)
{
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return make_error("Failed to parse Lavalink response");
    }

    const std::string load_type_str = j.value("loadType", "");
    const json data = j.contains("data") ? j["data"] : json();

    load_result res;
    if (load_type_str == "track") {
        res.type = load_type::track;
        if (data.is_object()) {
            parse_tracks(json::array({data}), res.tracks);
        }
    } else if (load_type_str == "search") {
        res.type = load_type::search;
        parse_tracks(data, res.tracks);
    } else if (load_type_str == "playlist") {
        res.type = load_type::playlist;
        if (data.is_object()) {
            if (data.contains("info") && data["info"].is_object()) {
                res.playlist_name = data["info"].value("name", "");
            }
            if (data.contains("tracks")) {
                parse_tracks(data["tracks"], res.tracks);
            }
        }
    } else if (load_type_str == "empty") {
        res.type = load_type::empty;
    } else if (load_type_str == "error") {
        res.type = load_type::error;
        if (data.is_object()) {
            res.error_message  = data.value("message", "Unknown Lavalink error");
            res.error_severity = data.value("severity", "fault");
            res.error_cause    = data.value("cause", "");
        } else {
            res.error_message  = "Unknown Lavalink error (no data field)";
            res.error_severity = "fault";
        }
    } else {
        return make_error("Unknown loadType: " + load_type_str);
    }

    // A track or search result without anything playable is no result.
    if ((res.type == load_type::track || res.type == load_type::search) && res.tracks.empty()) {
        res.type = load_type::empty;
    }
    return res;
}

std::optional<player_state> parse_player_state(const std::string& body)
{
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    player_state state;
    if (j.contains("track") && j["track"].is_object()) {
        state.track_encoded = j["track"].value("encoded", "");
    }
    if (j.contains("state") && j["state"].is_object()) {
        state.position_ms = j["state"].value("position", std::int64_t{0});
    }
    state.paused = j.value("paused", false);
    return state;
}

node::node(dpp::cluster& cluster, const node_config& cfg)
    : m_cluster(cluster)
    , m_cfg(cfg)
{
    std::ostringstream oss;
    oss << "Initialising Lavalink node at "
        << (m_cfg.https ? "https://" : "http://")
        << m_cfg.host << ":" << m_cfg.port
        << " with session_id='" << m_cfg.session_id << "'";
    m_cluster.log(dpp::ll_info, oss.str());
}

void node::handle_voice_state_update(const dpp::voice_state_update_t& ev)
{
    // Only cache our own bot's voice state
    if (ev.state.user_id != m_cluster.me.id) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_voice_mutex);
    if (!ev.state.channel_id) {
        m_voice_states.erase(ev.state.guild_id);
        m_cluster.log(dpp::ll_debug,
                      "Dropped voice state for guild " + ev.state.guild_id.str());
        return;
    }

    auto& vs = m_voice_states[ev.state.guild_id];
    vs.session_id = ev.state.session_id;

    std::ostringstream oss;
    oss << "Cached voice_state for guild " << ev.state.guild_id
        << " session_id=" << vs.session_id;
    m_cluster.log(dpp::ll_debug, oss.str());
}

void node::handle_voice_server_update(const dpp::voice_server_update_t& ev)
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto& vs = m_voice_states[ev.guild_id];
    vs.token    = ev.token;
    vs.endpoint = ev.endpoint;

    std::ostringstream oss;
    oss << "Cached voice_server for guild " << ev.guild_id
        << " token=" << (!vs.token.empty() ? "<set>" : "<empty>")
        << " endpoint=" << vs.endpoint;
    m_cluster.log(dpp::ll_debug, oss.str());
}

std::optional<node::voice_state> node::get_voice_state_locked(dpp::snowflake guild_id) const
{
    auto it = m_voice_states.find(guild_id);
    if (it == m_voice_states.end()) {
        return std::nullopt;
    }
    const auto& vs = it->second;
    if (vs.token.empty() || vs.endpoint.empty() || vs.session_id.empty()) {
        return std::nullopt;
    }
    return vs;
}

void node::http_request(const std::string& method,
                        const std::string& urlpath,
                        const std::string& body_json,
                        completion on_done) const
{
    dpp::http_method http_method_enum = dpp::m_get;
    if (method == "POST") {
        http_method_enum = dpp::m_post;
    } else if (method == "PATCH") {
        http_method_enum = dpp::m_patch;
    } else if (method == "DELETE") {
        http_method_enum = dpp::m_delete;
    } else if (method == "PUT") {
        http_method_enum = dpp::m_put;
    }

    const std::string scheme   = m_cfg.https ? "https://" : "http://";
    const std::string full_url = scheme + m_cfg.host + ":" + std::to_string(m_cfg.port) + urlpath;

    std::multimap<std::string, std::string> headers;
    headers.emplace("Authorization", m_cfg.password);
    headers.emplace("User-Id",       m_cluster.me.id.str());
    headers.emplace("Client-Name",   m_cfg.client_name);

    m_cluster.log(
        dpp::ll_debug,
        "Lavalink HTTP request: " + method + " " + urlpath +
        " (URL=" + full_url + ", body=" +
        (body_json.empty() ? "empty" : std::to_string(body_json.size()) + " bytes") + ")"
    );

    m_cluster.request(
        full_url,
        http_method_enum,
        [this, method, urlpath, on_done = std::move(on_done)](const dpp::http_request_completion_t& cc) {
            std::ostringstream oss;
            oss << "Lavalink HTTP " << cc.status
                << " on " << method << " " << urlpath
                << " (response length=" << cc.body.size() << ")";

            if (cc.status == 0) {
                m_cluster.log(dpp::ll_warning, oss.str() + " (request failed)");
            } else if (cc.status >= 400) {
                m_cluster.log(dpp::ll_warning, oss.str() + " response: " + cc.body);
            } else {
                m_cluster.log(dpp::ll_debug, oss.str());
            }

            if (on_done) {
                on_done(cc);
            }
        },
        body_json,
        body_json.empty() ? "" : "application/json",
        headers
    );
}

void node::ensure_session()
{
    json payload;
    payload["resuming"] = true;
    payload["timeout"]  = 60;

    const std::string path = "/v4/sessions/" + m_cfg.session_id;

    m_cluster.log(dpp::ll_debug,
                  "Ensuring Lavalink session '" + m_cfg.session_id + "' via PATCH " + path);

    http_request("PATCH", path, payload.dump(),
        [this](const dpp::http_request_completion_t& cc) {
            if (cc.status < 200 || cc.status >= 300) {
                m_cluster.log(dpp::ll_warning,
                              "Failed to ensure Lavalink session '" + m_cfg.session_id + "'");
                return;
            }
            m_cluster.log(dpp::ll_info,
                          "Lavalink session '" + m_cfg.session_id + "' ensured/created");
        });
}

void node::load_tracks(const std::string& identifier,
                       std::function<void(load_result)> on_done) const
{
    m_cluster.log(dpp::ll_debug, "Requesting /v4/loadtracks for identifier: " + identifier);

    const std::string path = "/v4/loadtracks?identifier=" + dpp::utility::url_encode(identifier);

    http_request("GET", path, {},
        [this, identifier, on_done = std::move(on_done)](const dpp::http_request_completion_t& cc) {
            load_result res;
            if (cc.status == 0 || cc.status >= 400 || cc.body.empty()) {
                res = make_error("Lavalink /loadtracks failed with HTTP status " +
                                 std::to_string(cc.status));
            } else {
                res = parse_load_result(cc.body);
            }

            if (res.type == load_type::error) {
                m_cluster.log(dpp::ll_warning,
                              "Lavalink /loadtracks error for identifier '" + identifier +
                              "': " + res.error_message);
            } else {
                std::ostringstream oss;
                oss << "Loaded " << res.tracks.size()
                    << " track(s) from Lavalink for identifier: " << identifier;
                m_cluster.log(dpp::ll_info, oss.str());
            }

            on_done(std::move(res));
        });
}

void node::get_player(dpp::snowflake guild_id,
                      std::function<void(std::optional<player_state>)> on_done) const
{
    if (m_cfg.session_id.empty()) {
        on_done(std::nullopt);
        return;
    }

    const std::string path = "/v4/sessions/" + m_cfg.session_id + "/players/" + guild_id.str();

    http_request("GET", path, {},
        [this, guild_id, on_done = std::move(on_done)](const dpp::http_request_completion_t& cc) {
            if (cc.status == 404) {
                // No player on the node yet.
                on_done(player_state{});
                return;
            }
            if (cc.status == 0 || cc.status >= 400) {
                on_done(std::nullopt);
                return;
            }

            auto state = parse_player_state(cc.body);
            if (!state) {
                m_cluster.log(dpp::ll_warning,
                              "Unreadable Lavalink player state for guild " + guild_id.str());
            }
            on_done(std::move(state));
        });
}

bool node::send_player_update(dpp::snowflake guild_id,
                              const json& payload,
                              const std::string& query)
{
    if (m_cfg.session_id.empty()) {
        m_cluster.log(dpp::ll_warning, "Cannot send player update: session id is empty");
        return false;
    }

    const std::string path = "/v4/sessions/" + m_cfg.session_id +
                             "/players/" + guild_id.str() + query;
    const std::string body = payload.dump();

    std::ostringstream oss;
    oss << "Sending player update to Lavalink for guild " << guild_id << ": " << body;
    m_cluster.log(dpp::ll_debug, oss.str());

    http_request("PATCH", path, body, nullptr);
    return true;
}

bool node::play(dpp::snowflake guild_id,
                const std::string& encoded_track,
                bool no_replace,
                std::optional<std::int64_t> start_ms)
{
    json payload;
    payload["track"]["encoded"] = encoded_track;

    if (start_ms.has_value() && *start_ms > 0) {
        payload["position"] = *start_ms;
    }
    payload["paused"] = false;

    std::optional<voice_state> vs;
    {
        std::lock_guard<std::mutex> lock(m_voice_mutex);
        vs = get_voice_state_locked(guild_id);
    }

    if (vs.has_value()) {
        payload["voice"]["token"]     = vs->token;
        payload["voice"]["endpoint"]  = vs->endpoint;
        payload["voice"]["sessionId"] = vs->session_id;
    }

    std::ostringstream oss;
    oss << "Sending play to Lavalink for guild " << guild_id
        << " (noReplace=" << std::boolalpha << no_replace << ")";
    m_cluster.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload, no_replace ? "?noReplace=true" : "");
}

bool node::stop(dpp::snowflake guild_id)
{
    json payload;
    payload["track"]["encoded"] = nullptr;

    m_cluster.log(dpp::ll_info, "Sending stop to Lavalink for guild " + guild_id.str());

    return send_player_update(guild_id, payload);
}

bool node::pause(dpp::snowflake guild_id, bool pause_flag)
{
    json payload;
    payload["paused"] = pause_flag;

    std::ostringstream oss;
    oss << "Sending pause=" << std::boolalpha << pause_flag
        << " to Lavalink for guild " << guild_id;
    m_cluster.log(dpp::ll_info, oss.str());

    return send_player_update(guild_id, payload);
}

} // namespace lb::lavalink
