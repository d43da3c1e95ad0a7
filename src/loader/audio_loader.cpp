#include "lb/loader/audio_loader.hpp"

#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include "lb/queue/queued_track.hpp"

namespace lb::loader {

audio_loader::audio_loader(dpp::cluster& cluster,
                           ratelimiter& ratelimiter,
                           queue::track_provider& provider,
                           resolver& resolver,
                           playback_controller& player,
                           const loader_config& cfg)
    : m_cluster(cluster)
    , m_ratelimiter(ratelimiter)
    , m_provider(provider)
    , m_resolver(resolver)
    , m_player(player)
    , m_cfg(cfg)
{
}

void audio_loader::load_async(load_request request)
{
    if (!ratelimit_if_slow_loading(request)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        m_pending.push_back(std::move(request));
    }

    if (try_claim()) {
        load_next_async();
    }
}

std::size_t audio_loader::pending_count() const
{
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    return m_pending.size();
}

/// Slow-loading collections go through the rate limiter, and big ones get an
/// announcement because resolving them takes a while.
/// @return false if the request must be dropped
bool audio_loader::ratelimit_if_slow_loading(const load_request& request)
{
    std::optional<collection_info> info;
    try {
        info = m_ratelimiter.get_collection_info(request.identifier);
        if (!info.has_value()) {
            return true;
        }

        if (m_ratelimiter.is_ratelimited(request, *info, info->total_items)) {
            m_cluster.log(dpp::ll_info,
                          "Rate limited collection load of '" + request.identifier +
                          "' by user " + request.user_id.str());
            notify(request,
                   "You are loading playlists too quickly. Please wait a moment before trying again.",
                   true);
            return false;
        }
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_error,
                      "Rate limit check failed for '" + request.identifier + "': " + e.what());
        return true;
    } catch (...) {
        m_cluster.log(dpp::ll_error,
                      "Rate limit check failed for '" + request.identifier + "': unknown exception");
        return true;
    }

    if (info->total_items > m_cfg.playlist_announce_threshold) {
        std::ostringstream oss;
        oss << "About to load playlist **" << dpp::utility::markdown_escape(info->name)
            << "** with up to `" << info->total_items
            << "` tracks. This may take a while, please be patient.";
        notify(request, oss.str(), true);
    }
    return true;
}

bool audio_loader::try_claim()
{
    bool expected = false;
    return m_loading.compare_exchange_strong(expected, true);
}

std::optional<load_request> audio_loader::poll()
{
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    if (m_pending.empty()) {
        return std::nullopt;
    }
    load_request request = std::move(m_pending.front());
    m_pending.pop_front();
    return request;
}

namespace {

// Handshake between one dispatch and its resolver callback. Whichever side
// leaves `dispatching` first hands the pipeline to the other one.
struct dispatch {
    enum stage : int { dispatching, returned, finished_inline };

    std::atomic<bool> completed{false};
    std::atomic<int>  state{dispatching};
};

} // namespace

/// Must only run while this thread holds m_loading.
void audio_loader::load_next_async()
{
    for (;;) {
        std::optional<load_request> context;
        try {
            context = poll();
            if (!context) {
                m_loading.store(false);
                // A request appended between poll() and the store would
                // otherwise wait for the next submission.
                if (pending_count() != 0 && try_claim()) {
                    continue;
                }
                return;
            }

            if (exceeds_track_limit(0)) {
                reply_track_limit(*context);
                continue;
            }

            m_cluster.log(dpp::ll_debug, "Resolving identifier: " + context->identifier);

            auto d = std::make_shared<dispatch>();
            bool        threw = false;
            std::string thrown;
            try {
                m_resolver.resolve(context->identifier,
                                   [this, request = *context, d](load_outcome outcome) {
                                       if (d->completed.exchange(true)) {
                                           m_cluster.log(dpp::ll_warning,
                                                         "Ignoring duplicate resolution of '" +
                                                         request.identifier + "'");
                                           return;
                                       }
                                       handle_outcome(request, std::move(outcome));

                                       int expected = dispatch::dispatching;
                                       if (!d->state.compare_exchange_strong(expected, dispatch::finished_inline)) {
                                           load_next_async();
                                       }
                                   });
            } catch (const std::exception& e) {
                threw  = true;
                thrown = e.what();
            } catch (...) {
                threw  = true;
                thrown = "unknown exception";
            }

            if (threw) {
                if (!d->completed.exchange(true)) {
                    handle_exception(*context, thrown);
                    continue;
                }
                // The outcome already went through; the handshake below decides who advances.
                m_cluster.log(dpp::ll_error,
                              "Resolver threw after completing '" + context->identifier +
                              "': " + thrown);
            }

            int expected = dispatch::dispatching;
            if (d->state.compare_exchange_strong(expected, dispatch::returned)) {
                // Still resolving; the callback continues the pipeline.
                return;
            }
        } catch (const std::exception& e) {
            if (!recover(context, e.what())) {
                return;
            }
        } catch (...) {
            if (!recover(context, "unknown exception")) {
                return;
            }
        }
    }
}

bool audio_loader::recover(const std::optional<load_request>& context, const std::string& what)
{
    if (context) {
        handle_exception(*context, what);
        return true;
    }
    m_cluster.log(dpp::ll_error, "Error while loading track: " + what);
    m_loading.store(false);
    return false;
}

void audio_loader::handle_outcome(const load_request& context, load_outcome outcome)
{
    try {
        std::visit([this, &context](auto& result) { handle_result(context, result); }, outcome);
    } catch (const std::exception& e) {
        handle_exception(context, e.what());
    } catch (...) {
        handle_exception(context, "unknown exception");
    }
}

// ---------- outcomes ----------

void audio_loader::handle_result(const load_request& context, single_item& result)
{
    if (exceeds_track_limit(1)) {
        reply_track_limit(context);
        return;
    }

    auto track = std::make_shared<queue::queued_track>(std::move(result.track),
                                                       context.user_id,
                                                       context.priority);
    track->set_start_position_ms(context.position_ms);

    const bool was_playing = m_player.is_playing();

    if (context.priority) {
        m_provider.add_first(track);
    } else {
        m_provider.add(track);
    }

    if (!context.quiet) {
        const std::string title = dpp::utility::markdown_escape(track->track().title);
        if (!was_playing) {
            notify(context, "**" + title + "** will now play.");
        } else if (context.priority) {
            notify(context, "**" + title + "** has been added to the front of the queue.");
        } else {
            notify(context, "**" + title + "** has been added to the queue.");
        }
    } else {
        m_cluster.log(dpp::ll_info, "Quietly loaded " + context.identifier);
    }

    if (!m_player.is_paused()) {
        m_player.play();
    }
}

void audio_loader::handle_result(const load_request& context, collection& result)
{
    if (exceeds_track_limit(result.tracks.size())) {
        reply_track_limit(context);
        return;
    }

    std::vector<queue::queued_track_ptr> to_add;
    to_add.reserve(result.tracks.size());
    for (auto& track : result.tracks) {
        to_add.push_back(std::make_shared<queue::queued_track>(std::move(track),
                                                               context.user_id,
                                                               context.priority));
    }

    if (context.priority) {
        m_provider.add_all_first(to_add);
    } else {
        m_provider.add_all(to_add);
    }

    std::ostringstream oss;
    oss << "Found and added `" << to_add.size() << "` songs from playlist **"
        << dpp::utility::markdown_escape(result.name) << "**.";
    notify(context, oss.str());

    m_ratelimiter.collection_loaded(context.identifier, collection_info{result.name, to_add.size()});

    if (!m_player.is_paused()) {
        m_player.play();
    }
}

void audio_loader::handle_result(const load_request& context, no_match& result)
{
    (void)result;
    notify(context, "No audio could be found for `" + context.identifier + "`.");
}

void audio_loader::handle_result(const load_request& context, load_failure& result)
{
    handle_failure(context, result);
}

// ---------- failures ----------

void audio_loader::handle_failure(const load_request& context, const load_failure& failure)
{
    if (failure.severity == failure_severity::common) {
        notify(context, "Error occurred when loading info for `" + context.identifier + "`:\n" +
                        failure.message);
        return;
    }

    if (m_cfg.show_youtube_ratelimit_warning) {
        notify(context, "Error occurred when loading info for `" + context.identifier +
                        "`\nThis may be YouTube blocking us.");
    } else {
        notify(context, "Suspicious error when loading info for `" + context.identifier +
                        "`. The problem has been reported.");
    }

    std::ostringstream oss;
    oss << "Failed to load a track: identifier='" << context.identifier
        << "' user=" << context.user_id
        << " severity=" << (failure.severity == failure_severity::suspicious ? "suspicious" : "fault")
        << " message=" << failure.message;
    if (!failure.cause.empty()) {
        oss << " cause=" << failure.cause;
    }
    m_cluster.log(dpp::ll_error, oss.str());
}

void audio_loader::handle_exception(const load_request& context, const std::string& what)
{
    load_failure failure;
    failure.severity = failure_severity::fault;
    failure.message  = what;
    handle_failure(context, failure);
}

// ---------- helpers ----------

bool audio_loader::exceeds_track_limit(std::size_t incoming) const
{
    const std::size_t count = m_player.track_count();
    if (incoming == 0) {
        return count >= m_cfg.queue_track_limit;
    }
    return count + incoming > m_cfg.queue_track_limit;
}

void audio_loader::reply_track_limit(const load_request& context)
{
    std::ostringstream oss;
    oss << "You can't add tracks to a queue with more than " << m_cfg.queue_track_limit
        << " tracks! This is to prevent abuse.";
    notify(context, oss.str(), true);
}

void audio_loader::notify(const load_request& context, const std::string& text, bool with_name)
{
    if (!context.sink) {
        return;
    }
    try {
        if (with_name) {
            context.sink->reply_with_name(text);
        } else {
            context.sink->reply(text);
        }
    } catch (const std::exception& e) {
        m_cluster.log(dpp::ll_error,
                      "Failed to deliver notice for '" + context.identifier + "': " + e.what());
    } catch (...) {
        m_cluster.log(dpp::ll_error,
                      "Failed to deliver notice for '" + context.identifier + "': unknown exception");
    }
}

} // namespace lb::loader
