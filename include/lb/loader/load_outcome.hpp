#pragma once

#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "lb/lavalink/track.hpp"

namespace lb::loader {

struct single_item {
    lavalink::track track;
};

struct collection {
    std::string                  name;
    std::vector<lavalink::track> tracks;
};

struct no_match {};

enum class failure_severity {
    common,     // expected and actionable by the user, shown verbatim
    suspicious, // unexpected, probably caused by the source
    fault       // bug or outage on our side
};

struct load_failure {
    failure_severity severity = failure_severity::fault;
    std::string      message;
    std::string      cause;
};

using load_outcome = std::variant<single_item, collection, no_match, load_failure>;

/// Turns an identifier into playable tracks. `on_done` must be called exactly
/// once, from any thread.
class resolver {
public:
    virtual ~resolver() = default;

    virtual void resolve(const std::string& identifier,
                         std::function<void(load_outcome)> on_done) = 0;
};

} // namespace lb::loader
