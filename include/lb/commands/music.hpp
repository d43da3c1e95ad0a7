#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <dpp/dpp.h>

#include "lb/loader/load_request.hpp"
#include "lb/player/guild_player.hpp"

namespace lb::commands {

/// Answers an interaction: the first notice edits the deferred response,
/// later ones go to the channel the command was issued in.
class interaction_reply : public loader::reply_sink {
public:
    interaction_reply(dpp::cluster& cluster, const dpp::slashcommand_t& event);

    void reply(const std::string& text) override;
    void reply_with_name(const std::string& text) override;

private:
    dpp::cluster&       m_cluster;
    dpp::slashcommand_t m_event;

    std::mutex m_mutex;
    bool       m_answered = false;
};

/// Plain queries become YouTube searches, URLs and prefixed searches pass through.
std::string to_identifier(const std::string& query);

/// "m:ss", or "h:mm:ss" from one hour on.
std::string format_duration(std::int64_t ms);

/// Build the music slash commands.
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

/// Dispatch a music slash command to the correct handler.
void route_slashcommand(const dpp::slashcommand_t& ev,
                        dpp::cluster& bot,
                        player::player_registry& players);

} // namespace lb::commands
