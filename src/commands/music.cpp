#include "lb/commands/music.hpp"

#include <algorithm>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <unordered_set>
#include <variant>

namespace lb::commands {

namespace {

constexpr std::size_t k_queue_page_size = 10;

/// Sends a gateway voice state update so Discord hands the voice session to
/// us; the Lavalink node picks it up through the voice events.
bool join_voice(dpp::cluster& bot, dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    const auto& shards = bot.get_shards();
    if (shards.empty()) {
        return false;
    }

    const auto shard_id = static_cast<unsigned>((static_cast<std::uint64_t>(guild_id) >> 22) % shards.size());
    auto it = shards.find(shard_id);
    if (it == shards.end() || !it->second) {
        it = shards.begin();
    }

    dpp::json payload;
    payload["op"] = 4;
    payload["d"]["guild_id"]   = guild_id.str();
    payload["d"]["channel_id"] = channel_id.str();
    payload["d"]["self_mute"]  = false;
    payload["d"]["self_deaf"]  = true;

    it->second->queue_message(payload.dump());
    return true;
}

dpp::snowflake find_user_voice_channel(dpp::snowflake guild_id, dpp::snowflake user_id)
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return {};
    }
    auto it = g->voice_members.find(user_id);
    if (it == g->voice_members.end()) {
        return {};
    }
    return it->second.channel_id;
}

template <typename T>
std::optional<T> optional_parameter(const dpp::slashcommand_t& ev, const std::string& name)
{
    const auto value = ev.get_parameter(name);
    if (std::holds_alternative<T>(value)) {
        return std::get<T>(value);
    }
    return std::nullopt;
}

std::string describe(const queue::queued_track& track)
{
    const auto& info = track.track();
    std::ostringstream oss;
    oss << "**" << dpp::utility::markdown_escape(info.title) << "**";
    if (!info.author.empty()) {
        oss << " by " << dpp::utility::markdown_escape(info.author);
    }
    oss << " [" << (track.is_stream() ? std::string("LIVE") : format_duration(track.effective_duration_ms()))
        << "] <@" << track.user_id().str() << ">";
    return oss.str();
}

// ---------- handlers ----------

void handle_play(const dpp::slashcommand_t& ev, dpp::cluster& bot, player::guild_player& gp)
{
    const auto user_id = ev.command.get_issuing_user().id;
    const auto channel_id = find_user_voice_channel(ev.command.guild_id, user_id);
    if (!channel_id) {
        ev.edit_original_response(dpp::message("You must join a voice channel first."));
        return;
    }
    join_voice(bot, ev.command.guild_id, channel_id);

    loader::load_request request;
    request.identifier  = to_identifier(std::get<std::string>(ev.get_parameter("query")));
    request.user_id     = user_id;
    request.user_name   = ev.command.get_issuing_user().format_username();
    request.priority    = optional_parameter<bool>(ev, "first").value_or(false);
    request.position_ms = optional_parameter<std::int64_t>(ev, "position").value_or(0) * 1000;
    request.sink        = std::make_shared<interaction_reply>(bot, ev);

    gp.loader().load_async(std::move(request));
}

void handle_queue(const dpp::slashcommand_t& ev, player::guild_player& gp)
{
    auto& provider = gp.provider();
    const auto page = static_cast<std::size_t>(
        std::max<std::int64_t>(1, optional_parameter<std::int64_t>(ev, "page").value_or(1)));

    std::ostringstream out;
    if (auto playing = gp.playing()) {
        out << "Now playing: " << describe(*playing) << "\n\n";
    }

    const std::size_t size = provider.size();
    if (size == 0) {
        out << "The queue is empty.";
        ev.edit_original_response(dpp::message(out.str()));
        return;
    }

    const std::size_t start = (page - 1) * k_queue_page_size;
    const auto tracks = provider.get_tracks_in_range(start, start + k_queue_page_size);
    std::size_t number = start + 1;
    for (const auto& track : tracks) {
        out << "`[" << number++ << "]` " << describe(*track) << "\n";
    }

    const std::size_t pages = (size + k_queue_page_size - 1) / k_queue_page_size;
    out << "\nPage " << page << "/" << pages << " | " << size << " track(s) | "
        << format_duration(provider.duration_ms());
    if (const auto streams = provider.streams_count()) {
        out << " + " << streams << " live stream(s)";
    }
    if (provider.is_shuffle()) {
        out << " | shuffled";
    }

    ev.edit_original_response(dpp::message(out.str()));
}

void handle_remove(const dpp::slashcommand_t& ev, player::guild_player& gp)
{
    const auto first = std::get<std::int64_t>(ev.get_parameter("start"));
    const auto last  = optional_parameter<std::int64_t>(ev, "end").value_or(first);
    if (first < 1 || last < 1) {
        ev.edit_original_response(dpp::message("Track numbers start at 1."));
        return;
    }

    const auto lo = static_cast<std::size_t>(std::min(first, last));
    const auto hi = static_cast<std::size_t>(std::max(first, last));
    const auto tracks = gp.provider().get_tracks_in_range(lo - 1, hi);
    if (tracks.empty()) {
        ev.edit_original_response(dpp::message("There are no tracks at that position."));
        return;
    }

    std::unordered_set<std::uint64_t> ids;
    for (const auto& track : tracks) {
        ids.insert(track->track_id());
    }

    const auto user_id = ev.command.get_issuing_user().id;
    if (!gp.provider().is_user_track_owner(user_id, ids)) {
        ev.edit_original_response(dpp::message("You can only remove tracks you added yourself."));
        return;
    }

    gp.provider().remove_all_by_id(ids);

    std::ostringstream out;
    if (tracks.size() == 1) {
        out << "Removed " << describe(*tracks.front()) << " from the queue.";
    } else {
        out << "Removed " << tracks.size() << " tracks from the queue.";
    }
    ev.edit_original_response(dpp::message(out.str()));
}

void handle_repeat(const dpp::slashcommand_t& ev, player::guild_player& gp)
{
    const std::string mode = std::get<std::string>(ev.get_parameter("mode"));
    if (mode == "single") {
        gp.provider().set_repeat_mode(queue::repeat_mode::single);
        ev.edit_original_response(dpp::message("The player will now repeat the current track."));
    } else if (mode == "all") {
        gp.provider().set_repeat_mode(queue::repeat_mode::all);
        ev.edit_original_response(dpp::message("The player will now repeat the queue."));
    } else {
        gp.provider().set_repeat_mode(queue::repeat_mode::none);
        ev.edit_original_response(dpp::message("The player is no longer on repeat."));
    }
}

} // namespace

// ---------- interaction_reply ----------

interaction_reply::interaction_reply(dpp::cluster& cluster, const dpp::slashcommand_t& event)
    : m_cluster(cluster)
    , m_event(event)
{
}

void interaction_reply::reply(const std::string& text)
{
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        first      = !m_answered;
        m_answered = true;
    }

    if (first) {
        m_event.edit_original_response(dpp::message(text));
    } else {
        m_cluster.message_create(dpp::message(m_event.command.channel_id, text));
    }
}

void interaction_reply::reply_with_name(const std::string& text)
{
    reply("**" + m_event.command.get_issuing_user().format_username() + "**: " + text);
}

// ---------- helpers ----------

std::string to_identifier(const std::string& query)
{
    static const char* const passthrough[] = {
        "http://", "https://", "ytsearch:", "ytmsearch:", "scsearch:"
    };
    for (const char* prefix : passthrough) {
        if (query.rfind(prefix, 0) == 0) {
            return query;
        }
    }
    return "ytsearch:" + query;
}

std::string format_duration(std::int64_t ms)
{
    if (ms < 0) {
        ms = 0;
    }
    const std::int64_t total   = ms / 1000;
    const std::int64_t hours   = total / 3600;
    const std::int64_t minutes = (total / 60) % 60;
    const std::int64_t seconds = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ":" << std::setw(2) << std::setfill('0') << minutes;
    } else {
        oss << minutes;
    }
    oss << ":" << std::setw(2) << std::setfill('0') << seconds;
    return oss.str();
}

// ---------- registration ----------

std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot)
{
    dpp::slashcommand play("play", "Play a track, playlist or search result", bot.me.id);
    play.add_option(dpp::command_option(dpp::co_string, "query", "URL or search terms", true));
    play.add_option(dpp::command_option(dpp::co_boolean, "first", "Put it at the front of the queue", false));
    play.add_option(dpp::command_option(dpp::co_integer, "position", "Start at this many seconds", false));

    dpp::slashcommand queue("queue", "Show the queue", bot.me.id);
    queue.add_option(dpp::command_option(dpp::co_integer, "page", "Page to show", false));

    dpp::slashcommand remove("remove", "Remove tracks from the queue", bot.me.id);
    remove.add_option(dpp::command_option(dpp::co_integer, "start", "First track number", true));
    remove.add_option(dpp::command_option(dpp::co_integer, "end", "Last track number", false));

    dpp::slashcommand repeat("repeat", "Set the repeat mode", bot.me.id);
    repeat.add_option(
        dpp::command_option(dpp::co_string, "mode", "Repeat mode", true)
            .add_choice(dpp::command_option_choice("Off", std::string("none")))
            .add_choice(dpp::command_option_choice("Current track", std::string("single")))
            .add_choice(dpp::command_option_choice("Whole queue", std::string("all")))
    );

    return {
        play,
        queue,
        remove,
        repeat,
        dpp::slashcommand("skip", "Skip the current track", bot.me.id),
        dpp::slashcommand("pause", "Pause playback", bot.me.id),
        dpp::slashcommand("resume", "Resume playback", bot.me.id),
        dpp::slashcommand("stop", "Stop playback and clear the queue", bot.me.id),
        dpp::slashcommand("shuffle", "Toggle shuffle", bot.me.id),
        dpp::slashcommand("reshuffle", "Shuffle the queue again", bot.me.id),
    };
}

void route_slashcommand(const dpp::slashcommand_t& ev,
                        dpp::cluster& bot,
                        player::player_registry& players)
{
    static const std::unordered_set<std::string> music_commands{
        "play", "queue", "remove", "repeat", "skip", "pause", "resume", "stop", "shuffle", "reshuffle"
    };

    const std::string name = ev.command.get_command_name();
    if (music_commands.count(name) == 0) {
        return;
    }

    ev.thinking();

    if (!ev.command.guild_id) {
        ev.edit_original_response(dpp::message("Music commands only work in servers."));
        return;
    }

    auto& gp = players.get_or_create(ev.command.guild_id);

    try {
        if (name == "play") {
            handle_play(ev, bot, gp);
        } else if (name == "queue") {
            handle_queue(ev, gp);
        } else if (name == "remove") {
            handle_remove(ev, gp);
        } else if (name == "repeat") {
            handle_repeat(ev, gp);
        } else if (name == "skip") {
            auto skipped = gp.playing();
            gp.skip();
            ev.edit_original_response(dpp::message(
                skipped ? "Skipped " + describe(*skipped) + "." : std::string("Nothing is playing.")));
        } else if (name == "pause") {
            gp.set_paused(true);
            ev.edit_original_response(dpp::message("The player is now paused."));
        } else if (name == "resume") {
            gp.play();
            ev.edit_original_response(dpp::message("The player is now playing."));
        } else if (name == "stop") {
            gp.stop();
            ev.edit_original_response(dpp::message("The queue has been cleared."));
        } else if (name == "shuffle") {
            const bool shuffle = !gp.provider().is_shuffle();
            gp.provider().set_shuffle(shuffle);
            ev.edit_original_response(dpp::message(
                shuffle ? "The player is now shuffled." : "The player is no longer shuffled."));
        } else if (name == "reshuffle") {
            gp.provider().reshuffle();
            ev.edit_original_response(dpp::message("The queue has been reshuffled."));
        }
    } catch (const std::exception& e) {
        bot.log(dpp::ll_error, "Music command /" + name + " failed: " + e.what());
        ev.edit_original_response(dpp::message("Something went wrong while running that command."));
    }
}

} // namespace lb::commands
