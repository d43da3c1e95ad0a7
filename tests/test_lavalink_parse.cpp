#include <catch2/catch.hpp>

#include "lb/lavalink/client.hpp"
#include "lb/lavalink/resolver.hpp"

using namespace lb;
using lavalink::load_type;
using lavalink::parse_load_result;

namespace {

const char* const track_json = R"({
    "encoded": "QAAA1",
    "info": {
        "identifier": "dQw4w9WgXcQ",
        "title": "Never Gonna Give You Up",
        "author": "Rick Astley",
        "uri": "https://www.youtube.com/watch?v=dQw4w9WgXcQ",
        "length": 212000,
        "isStream": false
    }
})";

} // namespace

TEST_CASE("single track responses", "[lavalink]")
{
    const auto res = parse_load_result(std::string(R"({"loadType": "track", "data": )") + track_json + "}");

    REQUIRE(res.type == load_type::track);
    REQUIRE(res.tracks.size() == 1);
    const auto& t = res.tracks.front();
    REQUIRE(t.encoded == "QAAA1");
    REQUIRE(t.title == "Never Gonna Give You Up");
    REQUIRE(t.author == "Rick Astley");
    REQUIRE(t.length_ms == 212000);
    REQUIRE_FALSE(t.is_stream);
}

TEST_CASE("search and playlist responses", "[lavalink]")
{
    SECTION("search keeps every hit") {
        const auto res = parse_load_result(std::string(R"({"loadType": "search", "data": [)") +
                                           track_json + "," + track_json + "]}");
        REQUIRE(res.type == load_type::search);
        REQUIRE(res.tracks.size() == 2);
    }

    SECTION("a search without hits is empty") {
        const auto res = parse_load_result(R"({"loadType": "search", "data": []})");
        REQUIRE(res.type == load_type::empty);
    }

    SECTION("playlists carry their name") {
        const auto res = parse_load_result(std::string(R"({"loadType": "playlist", "data": {"info": {"name": "Mix"}, "tracks": [)") +
                                           track_json + "]}}");
        REQUIRE(res.type == load_type::playlist);
        REQUIRE(res.playlist_name == "Mix");
        REQUIRE(res.tracks.size() == 1);
    }

    SECTION("entries without an encoded track are skipped") {
        const auto res = parse_load_result(R"({"loadType": "search", "data": [{"info": {"title": "x"}}]})");
        REQUIRE(res.type == load_type::empty);
    }
}

TEST_CASE("error responses", "[lavalink][errors]")
{
    SECTION("errors keep their severity") {
        const auto res = parse_load_result(
            R"({"loadType": "error", "data": {"message": "Video unavailable", "severity": "common", "cause": "x"}})");
        REQUIRE(res.type == load_type::error);
        REQUIRE(res.error_message == "Video unavailable");
        REQUIRE(res.error_severity == "common");
        REQUIRE(res.error_cause == "x");
    }

    SECTION("garbage is a fault") {
        for (const char* body : {"", "not json", "[]", R"({"loadType": "mystery"})"}) {
            const auto res = parse_load_result(body);
            REQUIRE(res.type == load_type::error);
            REQUIRE(res.error_severity == "fault");
        }
    }
}

TEST_CASE("load results map onto loader outcomes", "[lavalink][resolver]")
{
    lavalink::load_result res;

    SECTION("search picks the first hit") {
        res.type = load_type::search;
        res.tracks.resize(2);
        res.tracks[0].title = "first";
        res.tracks[1].title = "second";
        const auto outcome = lavalink::to_outcome(res);
        REQUIRE(std::holds_alternative<loader::single_item>(outcome));
        REQUIRE(std::get<loader::single_item>(outcome).track.title == "first");
    }

    SECTION("playlists become collections") {
        res.type          = load_type::playlist;
        res.playlist_name = "Mix";
        res.tracks.resize(3);
        const auto outcome = lavalink::to_outcome(res);
        REQUIRE(std::get<loader::collection>(outcome).name == "Mix");
        REQUIRE(std::get<loader::collection>(outcome).tracks.size() == 3);
    }

    SECTION("empty is no match") {
        res.type = load_type::empty;
        REQUIRE(std::holds_alternative<loader::no_match>(lavalink::to_outcome(res)));
    }

    SECTION("severities are mapped") {
        res.type           = load_type::error;
        res.error_message  = "nope";
        res.error_severity = "suspicious";
        auto outcome = lavalink::to_outcome(res);
        REQUIRE(std::get<loader::load_failure>(outcome).severity == loader::failure_severity::suspicious);
        REQUIRE(std::get<loader::load_failure>(outcome).message == "nope");

        res.error_severity = "whatever";
        outcome = lavalink::to_outcome(res);
        REQUIRE(std::get<loader::load_failure>(outcome).severity == loader::failure_severity::fault);
    }
}

TEST_CASE("player state responses", "[lavalink][player]")
{
    SECTION("a playing track") {
        const auto state = lavalink::parse_player_state(
            std::string(R"({"guildId": "1", "track": )") + track_json +
            R"(, "volume": 100, "paused": true, "state": {"time": 1, "position": 5300, "connected": true, "ping": 20}})");
        REQUIRE(state.has_value());
        REQUIRE(state->track_encoded == "QAAA1");
        REQUIRE(state->position_ms == 5300);
        REQUIRE(state->paused);
    }

    SECTION("no track loaded") {
        const auto state = lavalink::parse_player_state(R"({"guildId": "1", "track": null, "paused": false})");
        REQUIRE(state.has_value());
        REQUIRE(state->track_encoded.empty());
        REQUIRE_FALSE(state->paused);
    }

    SECTION("not a player") {
        REQUIRE_FALSE(lavalink::parse_player_state("").has_value());
        REQUIRE_FALSE(lavalink::parse_player_state("[1, 2]").has_value());
    }
}
