#include "lb/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lb {

namespace {

dpp::loglevel parse_log_level(const std::string& level)
{
    if (level == "trace")    return dpp::ll_trace;
    if (level == "debug")    return dpp::ll_debug;
    if (level == "info")     return dpp::ll_info;
    if (level == "warning")  return dpp::ll_warning;
    if (level == "error")    return dpp::ll_error;
    if (level == "critical") return dpp::ll_critical;
    throw config_error("Unknown log_level '" + level + "'");
}

template <typename T>
void read(const dpp::json& obj, const char* key, T& out)
{
    if (!obj.contains(key)) {
        return;
    }
    try {
        out = obj.at(key).get<T>();
    } catch (const dpp::json::exception& e) {
        throw config_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

const dpp::json* section(const dpp::json& j, const char* key)
{
    if (!j.contains(key)) {
        return nullptr;
    }
    if (!j[key].is_object()) {
        throw config_error(std::string("Section '") + key + "' must be an object");
    }
    return &j[key];
}

} // namespace

bot_config parse_config(const dpp::json& j)
{
    if (!j.is_object()) {
        throw config_error("Configuration root must be an object");
    }

    bot_config cfg;
    read(j, "token", cfg.token);

    std::string level;
    read(j, "log_level", level);
    if (!level.empty()) {
        cfg.log_level = parse_log_level(level);
    }

    if (const auto* lav = section(j, "lavalink")) {
        read(*lav, "host",        cfg.lavalink.host);
        read(*lav, "port",        cfg.lavalink.port);
        read(*lav, "https",       cfg.lavalink.https);
        read(*lav, "password",    cfg.lavalink.password);
        read(*lav, "session_id",  cfg.lavalink.session_id);
        read(*lav, "client_name", cfg.lavalink.client_name);
        read(*lav, "player_poll_seconds", cfg.lavalink.player_poll_seconds);
        if (cfg.lavalink.player_poll_seconds == 0) {
            throw config_error("lavalink.player_poll_seconds must be positive");
        }
    }

    if (const auto* ld = section(j, "loader")) {
        read(*ld, "queue_track_limit",              cfg.loader.queue_track_limit);
        read(*ld, "playlist_announce_threshold",    cfg.loader.playlist_announce_threshold);
        read(*ld, "show_youtube_ratelimit_warning", cfg.loader.show_youtube_ratelimit_warning);
    }

    if (const auto* rl = section(j, "ratelimit")) {
        long long window_seconds = cfg.ratelimit.window.count();
        read(*rl, "window_seconds", window_seconds);
        if (window_seconds <= 0) {
            throw config_error("ratelimit.window_seconds must be positive");
        }
        cfg.ratelimit.window = std::chrono::seconds(window_seconds);
        read(*rl, "max_collection_loads", cfg.ratelimit.max_collection_loads);
        read(*rl, "max_items",            cfg.ratelimit.max_items);
        read(*rl, "known_collections",    cfg.ratelimit.known_collections);
        read(*rl, "slow_sources",         cfg.ratelimit.slow_sources);
    }

    return cfg;
}

bot_config load_config(const std::string& path)
{
    bot_config cfg;

    std::ifstream in(path);
    if (in.is_open()) {
        std::stringstream buffer;
        buffer << in.rdbuf();
        dpp::json j = dpp::json::parse(buffer.str(), nullptr, false);
        if (j.is_discarded()) {
            throw config_error("Failed to parse " + path + " as JSON");
        }
        cfg = parse_config(j);
    }

    if (const char* token = std::getenv("token")) {
        cfg.token = token;
    }
    return cfg;
}

} // namespace lb
