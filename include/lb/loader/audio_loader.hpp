#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include <dpp/dpp.h>

#include "lb/loader/load_outcome.hpp"
#include "lb/loader/load_request.hpp"
#include "lb/loader/playback_controller.hpp"
#include "lb/loader/ratelimiter.hpp"
#include "lb/queue/track_provider.hpp"

namespace lb::loader {

struct loader_config {
    std::size_t queue_track_limit              = 10000;
    std::size_t playlist_announce_threshold    = 50;
    bool        show_youtube_ratelimit_warning = false;
};

/// Resolves load requests one at a time and feeds the results into a track
/// provider. Requests may be submitted from any thread; only one resolution
/// is ever in flight and a finished one always starts the next.
class audio_loader {
public:
    audio_loader(dpp::cluster& cluster,
                 ratelimiter& ratelimiter,
                 queue::track_provider& provider,
                 resolver& resolver,
                 playback_controller& player,
                 const loader_config& cfg = {});

    audio_loader(const audio_loader&) = delete;
    audio_loader& operator=(const audio_loader&) = delete;

    void load_async(load_request request);

    bool is_loading() const { return m_loading.load(); }
    std::size_t pending_count() const;

private:
    dpp::cluster&          m_cluster;
    ratelimiter&           m_ratelimiter;
    queue::track_provider& m_provider;
    resolver&              m_resolver;
    playback_controller&   m_player;
    loader_config          m_cfg;

    mutable std::mutex       m_pending_mutex;
    std::deque<load_request> m_pending;

    // true while a request is being resolved; only changed by the pipeline.
    std::atomic<bool> m_loading{false};

    bool ratelimit_if_slow_loading(const load_request& request);
    bool try_claim();
    std::optional<load_request> poll();

    void load_next_async();
    bool recover(const std::optional<load_request>& context, const std::string& what);
    void handle_outcome(const load_request& context, load_outcome outcome);

    void handle_result(const load_request& context, single_item& result);
    void handle_result(const load_request& context, collection& result);
    void handle_result(const load_request& context, no_match& result);
    void handle_result(const load_request& context, load_failure& result);

    void handle_failure(const load_request& context, const load_failure& failure);
    void handle_exception(const load_request& context, const std::string& what);

    bool exceeds_track_limit(std::size_t incoming) const;
    void reply_track_limit(const load_request& context);
    void notify(const load_request& context, const std::string& text, bool with_name = false);
};

} // namespace lb::loader
