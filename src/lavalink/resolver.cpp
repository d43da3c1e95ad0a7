#include "lb/lavalink/resolver.hpp"

#include <utility>

namespace lb::lavalink {

namespace {

loader::failure_severity to_severity(const std::string& severity)
{
    if (severity == "common") {
        return loader::failure_severity::common;
    }
    if (severity == "suspicious") {
        return loader::failure_severity::suspicious;
    }
    return loader::failure_severity::fault;
}

} // namespace

loader::load_outcome to_outcome(load_result result)
{
    switch (result.type) {
    case load_type::track:
    case load_type::search:
        if (result.tracks.empty()) {
            return loader::no_match{};
        }
        return loader::single_item{std::move(result.tracks.front())};
    case load_type::playlist:
        return loader::collection{std::move(result.playlist_name), std::move(result.tracks)};
    case load_type::error:
        return loader::load_failure{to_severity(result.error_severity),
                                    std::move(result.error_message),
                                    std::move(result.error_cause)};
    case load_type::empty:
        break;
    }
    return loader::no_match{};
}

void lavalink_resolver::resolve(const std::string& identifier,
                                std::function<void(loader::load_outcome)> on_done)
{
    m_node.load_tracks(identifier, [on_done = std::move(on_done)](load_result result) {
        on_done(to_outcome(std::move(result)));
    });
}

} // namespace lb::lavalink
