#include <dpp/dpp.h>                    // D++

#include <iostream>                     // std::cerr
#include <string>

#include "lb/config.hpp"                // Bot configuration
#include "lb/lavalink/client.hpp"       // Lavalink connection
#include "lb/lavalink/resolver.hpp"     // Lavalink track resolution
#include "lb/loader/ratelimiter.hpp"    // Playlist rate limits
#include "lb/player/guild_player.hpp"   // Per-guild players
#include "lb/commands/music.hpp"        // Music slash commands

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "config.json";

    lb::bot_config cfg;
    try {
        cfg = lb::load_config(config_path);
    } catch (const lb::config_error& e) {
        std::cerr << "Failed to load " << config_path << ": " << e.what() << std::endl;
        return 1;
    }

    if (cfg.token.empty()) {
        std::cerr << "No bot token: set 'token' in " << config_path
                  << " or the token environment variable" << std::endl;
        return 1;
    }

    dpp::cluster bot(cfg.token, dpp::i_default_intents);

    // D++ logger, filtered by the configured level
    bot.on_log([logger = dpp::utility::cout_logger(), level = cfg.log_level](const dpp::log_t& ev) {
        if (ev.severity >= level) {
            logger(ev);
        }
    });

    // ---------- Lavalink node ----------
    lb::lavalink::node lavalink(bot, cfg.lavalink);
    lb::lavalink::lavalink_resolver resolver(lavalink);
    lb::loader::playlist_ratelimiter ratelimiter(cfg.ratelimit);
    lb::player::player_registry players(bot, lavalink, ratelimiter, resolver, cfg.loader);

    // ---------- Voice glue for Lavalink ----------
    bot.on_voice_state_update([&](const dpp::voice_state_update_t& ev) {
        lavalink.handle_voice_state_update(ev);
    });

    bot.on_voice_server_update([&](const dpp::voice_server_update_t& ev) {
        lavalink.handle_voice_server_update(ev);
    });

    // ---------- Slash command handler ----------
    bot.on_slashcommand([&bot, &players](const dpp::slashcommand_t& event) {
        lb::commands::route_slashcommand(event, bot, players);
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot, &lavalink, &players, &cfg](const dpp::ready_t& event) {
        (void)event;

        bot.log(dpp::ll_info, "Logged in as " + bot.me.username);

        if (dpp::run_once<struct ensure_lavalink_session>()) {
            lavalink.ensure_session();
        }

        // Lavalink events are not consumed, so finished tracks are found by polling.
        if (dpp::run_once<struct poll_players>()) {
            bot.start_timer([&players](const dpp::timer&) {
                players.poll_all();
            }, cfg.lavalink.player_poll_seconds);
        }

        if (dpp::run_once<struct register_bot_commands>()) {
            bot.log(dpp::ll_info, "Registering slash commands...");
            bot.global_bulk_command_create(lb::commands::make_commands(bot));
        }
    });

    // ---------- Start bot ----------
    bot.start(dpp::st_wait);
    return 0;
}
