#include <catch2/catch.hpp>

#include <memory>
#include <thread>

#include "fakes.hpp"
#include "lb/loader/audio_loader.hpp"
#include "lb/queue/simple_track_provider.hpp"

using namespace lb;
using lb::test::make_track;
using lb::test::recording_sink;

namespace {

const dpp::snowflake alice{1001};
const dpp::snowflake bob{1002};

struct loader_fixture {
    queue::simple_track_provider provider;
    test::fake_player            player{provider};
    test::scripted_resolver      resolver;
    test::fake_ratelimiter       ratelimiter;
    loader::loader_config        cfg;
    std::unique_ptr<loader::audio_loader> audio_loader;

    loader_fixture() { rebuild(); }

    // Outstanding resolver threads call back into the loader.
    ~loader_fixture() { resolver.join(); }

    void rebuild()
    {
        audio_loader = std::make_unique<loader::audio_loader>(
            test::test_cluster(), ratelimiter, provider, resolver, player, cfg);
    }

    std::shared_ptr<recording_sink> submit(const std::string& identifier,
                                           dpp::snowflake user = alice,
                                           bool priority = false,
                                           bool quiet = false,
                                           test::reply_counter* counter = nullptr)
    {
        auto sink = std::make_shared<recording_sink>(counter);
        loader::load_request request;
        request.identifier = identifier;
        request.user_id    = user;
        request.user_name  = "user";
        request.priority   = priority;
        request.quiet      = quiet;
        request.sink       = sink;
        audio_loader->load_async(std::move(request));
        return sink;
    }
};

} // namespace

TEST_CASE("a single track is queued and played", "[loader]")
{
    loader_fixture f;
    auto sink = f.submit("song");

    REQUIRE(f.resolver.calls == 1);
    REQUIRE(f.provider.size() == 1);
    REQUIRE(f.provider.peek()->user_id() == alice);
    REQUIRE(f.player.plays == 1);
    REQUIRE(sink->replies() == std::vector<std::string>{"**song** will now play."});
    REQUIRE_FALSE(f.audio_loader->is_loading());
}

TEST_CASE("single track notices depend on player state", "[loader]")
{
    loader_fixture f;
    f.player.playing = true;

    SECTION("queued behind others") {
        auto sink = f.submit("song");
        REQUIRE(sink->any_contains("has been added to the queue"));
    }

    SECTION("priority goes to the front") {
        f.submit("first");
        auto sink = f.submit("jump", bob, true);
        REQUIRE(sink->any_contains("front of the queue"));
        REQUIRE(f.provider.peek()->track().title == "jump");
        REQUIRE(f.provider.peek()->is_priority());
    }

    SECTION("quiet loads do not reply") {
        auto sink = f.submit("song", alice, false, true);
        REQUIRE(sink->replies().empty());
        REQUIRE(f.provider.size() == 1);
    }

    SECTION("a paused player is not started") {
        f.player.paused = true;
        f.submit("song");
        REQUIRE(f.player.plays == 0);
    }
}

TEST_CASE("the start position is applied to the queued track", "[loader]")
{
    loader_fixture f;
    auto sink = std::make_shared<recording_sink>();
    loader::load_request request;
    request.identifier  = "song";
    request.user_id     = alice;
    request.position_ms = 42000;
    request.sink        = sink;
    f.audio_loader->load_async(std::move(request));

    REQUIRE(f.provider.peek()->start_position_ms() == 42000);
}

TEST_CASE("collections are added as a batch", "[loader]")
{
    loader_fixture f;
    f.resolver.script = [](const std::string&) {
        return loader::load_outcome{loader::collection{"Mix", {make_track("a"), make_track("b"), make_track("c")}}};
    };

    SECTION("plain") {
        auto sink = f.submit("list");
        REQUIRE(f.provider.size() == 3);
        REQUIRE(sink->any_contains("`3` songs from playlist **Mix**"));
        REQUIRE(f.player.plays == 1);
    }

    SECTION("priority keeps the playlist order at the head") {
        f.provider.add(test::make_entry("old", bob));
        f.submit("list", alice, true);
        const auto list = f.provider.as_list();
        REQUIRE(list.size() == 4);
        REQUIRE(list[0]->track().title == "a");
        REQUIRE(list[1]->track().title == "b");
        REQUIRE(list[2]->track().title == "c");
    }
}

TEST_CASE("no match leaves the queue alone", "[loader]")
{
    loader_fixture f;
    f.resolver.script = [](const std::string&) { return loader::load_outcome{loader::no_match{}}; };

    auto sink = f.submit("nothing here");
    REQUIRE(f.provider.empty());
    REQUIRE(sink->any_contains("No audio could be found for `nothing here`"));
    REQUIRE(f.player.plays == 0);
}

TEST_CASE("failures are classified", "[loader][errors]")
{
    loader_fixture f;

    SECTION("common failures are shown verbatim") {
        f.resolver.script = [](const std::string&) {
            return loader::load_outcome{loader::load_failure{loader::failure_severity::common,
                                                             "This video is unavailable", ""}};
        };
        auto sink = f.submit("vid");
        REQUIRE(sink->any_contains("This video is unavailable"));
    }

    SECTION("suspicious failures get a generic notice") {
        f.resolver.script = [](const std::string&) {
            return loader::load_outcome{loader::load_failure{loader::failure_severity::suspicious,
                                                             "Something internal", "socket reset"}};
        };
        auto sink = f.submit("vid");
        REQUIRE(sink->any_contains("Suspicious error"));
        REQUIRE_FALSE(sink->any_contains("Something internal"));
    }

    SECTION("the YouTube warning replaces the generic notice when enabled") {
        f.cfg.show_youtube_ratelimit_warning = true;
        f.rebuild();
        f.resolver.script = [](const std::string&) {
            return loader::load_outcome{loader::load_failure{loader::failure_severity::fault, "boom", ""}};
        };
        auto sink = f.submit("vid");
        REQUIRE(sink->any_contains("YouTube blocking us"));
    }

    REQUIRE(f.provider.empty());
    REQUIRE_FALSE(f.audio_loader->is_loading());
}

TEST_CASE("the track limit stops requests before resolving", "[loader][limit]")
{
    loader_fixture f;
    f.cfg.queue_track_limit = 5;
    f.rebuild();
    f.player.extra_tracks = 5;

    auto first  = f.submit("one");
    auto second = f.submit("two");

    REQUIRE(f.resolver.calls == 0);
    REQUIRE(first->any_contains("more than 5 tracks"));
    REQUIRE(second->any_contains("more than 5 tracks"));
    REQUIRE(f.provider.empty());
    REQUIRE_FALSE(f.audio_loader->is_loading());

    SECTION("the pipeline recovers once there is room") {
        f.player.extra_tracks = 0;
        auto third = f.submit("three");
        REQUIRE(f.resolver.calls == 1);
        REQUIRE(f.provider.size() == 1);
    }
}

TEST_CASE("a collection that would overflow the queue is dropped whole", "[loader][limit]")
{
    loader_fixture f;
    f.cfg.queue_track_limit = 4;
    f.rebuild();
    f.player.extra_tracks = 2;
    f.resolver.script = [](const std::string&) {
        return loader::load_outcome{loader::collection{"Big", {make_track("a"), make_track("b"), make_track("c")}}};
    };

    auto sink = f.submit("list");
    REQUIRE(f.resolver.calls == 1);
    REQUIRE(f.provider.empty());
    REQUIRE(sink->any_contains("more than 4 tracks"));
}

TEST_CASE("slow collections go through the rate limiter", "[loader][ratelimit]")
{
    loader_fixture f;
    f.ratelimiter.info = loader::collection_info{"Huge list", 120};

    SECTION("rate limited requests never reach the resolver") {
        f.ratelimiter.limited = true;
        auto sink = f.submit("spotify:playlist:1");
        REQUIRE(f.ratelimiter.checks == 1);
        REQUIRE(f.resolver.calls == 0);
        REQUIRE(sink->any_contains("too quickly"));
        REQUIRE(f.audio_loader->pending_count() == 0);
    }

    SECTION("resolved collections are reported back") {
        f.ratelimiter.info->total_items = 10;
        f.resolver.script = [](const std::string&) {
            return loader::load_outcome{loader::collection{"Mix", {make_track("a"), make_track("b")}}};
        };
        f.submit("spotify:playlist:1");
        REQUIRE(f.ratelimiter.loaded.size() == 1);
        REQUIRE(f.ratelimiter.loaded.front().name == "Mix");
        REQUIRE(f.ratelimiter.loaded.front().total_items == 2);
    }

    SECTION("big collections are announced") {
        auto sink = f.submit("spotify:playlist:1");
        REQUIRE(f.resolver.calls == 1);
        REQUIRE(sink->any_contains("About to load playlist **Huge list**"));
    }

    SECTION("small collections are not announced") {
        f.ratelimiter.info->total_items = 10;
        auto sink = f.submit("spotify:playlist:1");
        REQUIRE_FALSE(sink->any_contains("About to load"));
    }
}

TEST_CASE("remembered collections are announced and limited by their size", "[loader][ratelimit]")
{
    queue::simple_track_provider provider;
    test::fake_player player{provider};
    test::scripted_resolver resolver;
    resolver.script = [](const std::string&) {
        std::vector<lavalink::track> tracks;
        for (int i = 0; i < 60; ++i) {
            tracks.push_back(make_track("t" + std::to_string(i)));
        }
        return loader::load_outcome{loader::collection{"Road trip", std::move(tracks)}};
    };

    loader::ratelimit_config limits;
    limits.max_collection_loads = 10;
    limits.max_items            = 150;
    limits.slow_sources         = {"^spotify:"};
    loader::playlist_ratelimiter ratelimiter(limits);
    loader::audio_loader audio_loader(test::test_cluster(), ratelimiter, provider, resolver, player);

    auto submit = [&audio_loader] {
        auto sink = std::make_shared<recording_sink>();
        loader::load_request request;
        request.identifier = "spotify:playlist:road";
        request.user_id    = alice;
        request.sink       = sink;
        audio_loader.load_async(std::move(request));
        return sink;
    };

    auto first = submit();
    REQUIRE(first->any_contains("`60` songs from playlist **Road trip**"));
    REQUIRE_FALSE(first->any_contains("About to load"));

    auto second = submit();
    REQUIRE(second->any_contains("About to load playlist **Road trip** with up to `60` tracks"));

    auto third = submit();
    REQUIRE(third->any_contains("About to load"));

    auto fourth = submit();
    REQUIRE(fourth->any_contains("too quickly"));
    REQUIRE(resolver.calls == 3);
    REQUIRE(provider.size() == 180);
}

TEST_CASE("notice failures do not stop the pipeline", "[loader][errors]")
{
    loader_fixture f;
    auto broken = std::make_shared<recording_sink>(nullptr, test::sink_failure::runtime_error);
    loader::load_request request;
    request.identifier = "first";
    request.user_id    = alice;
    request.sink       = broken;
    f.audio_loader->load_async(std::move(request));

    REQUIRE(f.provider.size() == 1);
    REQUIRE(f.player.plays == 1);

    auto sink = f.submit("second", bob);
    REQUIRE(f.resolver.calls == 2);
    REQUIRE(f.provider.size() == 2);
    REQUIRE_FALSE(f.audio_loader->is_loading());
}

TEST_CASE("foreign exceptions do not stall the pipeline", "[loader][errors]")
{
    loader_fixture f;

    SECTION("from a reply sink") {
        auto broken = std::make_shared<recording_sink>(nullptr, test::sink_failure::foreign);
        loader::load_request request;
        request.identifier = "first";
        request.user_id    = alice;
        request.sink       = broken;
        f.audio_loader->load_async(std::move(request));

        REQUIRE(f.provider.size() == 1);
        REQUIRE(f.player.plays == 1);
    }

    SECTION("from the player") {
        f.player.throw_on_play = true;
        auto sink = f.submit("first");
        REQUIRE(sink->any_contains("Suspicious error"));
        f.player.throw_on_play = false;
    }

    SECTION("from the resolver") {
        f.resolver.script = [](const std::string& id) -> loader::load_outcome {
            if (id == "first") {
                throw 13;
            }
            return loader::single_item{make_track(id)};
        };
        auto sink = f.submit("first");
        REQUIRE(sink->any_contains("Suspicious error"));
    }

    REQUIRE_FALSE(f.audio_loader->is_loading());

    auto second = f.submit("second", bob);
    REQUIRE(second->replies().size() == 1);
    REQUIRE(f.audio_loader->pending_count() == 0);
    REQUIRE_FALSE(f.audio_loader->is_loading());
}

TEST_CASE("inline resolutions work through a backlog without nesting", "[loader]")
{
    constexpr int backlog = 500;

    loader_fixture f;
    bool queued = false;
    f.resolver.script = [&f, &queued](const std::string& id) -> loader::load_outcome {
        if (!queued) {
            queued = true;
            for (int i = 0; i < backlog; ++i) {
                f.submit("later" + std::to_string(i), dpp::snowflake(5000 + i));
            }
        }
        return loader::single_item{make_track(id)};
    };

    f.submit("first");

    REQUIRE(f.resolver.calls == backlog + 1);
    REQUIRE(f.resolver.max_nesting == 1);
    REQUIRE(f.provider.size() == static_cast<std::size_t>(backlog + 1));
    REQUIRE(f.audio_loader->pending_count() == 0);
    REQUIRE_FALSE(f.audio_loader->is_loading());
}

TEST_CASE("a throwing resolver is reported and skipped", "[loader][errors]")
{
    loader_fixture f;
    f.resolver.script = [](const std::string& id) -> loader::load_outcome {
        if (id == "bad") {
            throw std::runtime_error("resolver exploded");
        }
        return loader::single_item{make_track(id)};
    };

    auto bad = f.submit("bad");
    REQUIRE(bad->any_contains("Suspicious error"));
    REQUIRE_FALSE(f.audio_loader->is_loading());

    auto good = f.submit("good");
    REQUIRE(f.provider.size() == 1);
    REQUIRE(good->any_contains("**good**"));
}

namespace {

class twice_resolver : public loader::resolver {
public:
    void resolve(const std::string& identifier,
                 std::function<void(loader::load_outcome)> on_done) override
    {
        on_done(loader::single_item{make_track(identifier)});
        on_done(loader::single_item{make_track(identifier)});
    }
};

} // namespace

TEST_CASE("a second completion for one request is ignored", "[loader]")
{
    queue::simple_track_provider provider;
    test::fake_player player{provider};
    test::fake_ratelimiter ratelimiter;
    twice_resolver resolver;
    loader::audio_loader audio_loader(test::test_cluster(), ratelimiter, provider, resolver, player);

    auto sink = std::make_shared<recording_sink>();
    loader::load_request request;
    request.identifier = "song";
    request.user_id    = alice;
    request.sink       = sink;
    audio_loader.load_async(std::move(request));

    REQUIRE(provider.size() == 1);
    REQUIRE(sink->replies().size() == 1);
}

TEST_CASE("concurrent submissions resolve one at a time", "[loader][threads]")
{
    constexpr int requests = 16;

    loader_fixture f;
    f.resolver.async = true;
    f.resolver.delay = std::chrono::milliseconds(2);

    test::reply_counter counter;
    std::vector<std::shared_ptr<recording_sink>> sinks(requests);

    std::vector<std::thread> submitters;
    for (int i = 0; i < requests; ++i) {
        submitters.emplace_back([&f, &sinks, &counter, i] {
            sinks[i] = f.submit("song" + std::to_string(i), dpp::snowflake(3000 + i), false, false, &counter);
        });
    }
    for (auto& t : submitters) {
        t.join();
    }

    REQUIRE(counter.wait_for(requests));
    f.resolver.join();

    REQUIRE(f.resolver.calls == requests);
    REQUIRE(f.resolver.max_in_flight == 1);
    REQUIRE(f.provider.size() == static_cast<std::size_t>(requests));
    for (const auto& sink : sinks) {
        REQUIRE(sink->replies().size() == 1);
    }
    REQUIRE_FALSE(f.audio_loader->is_loading());
    REQUIRE(f.audio_loader->pending_count() == 0);
}
