#pragma once

#include "lb/lavalink/client.hpp"
#include "lb/loader/load_outcome.hpp"

namespace lb::lavalink {

/// Maps a /v4/loadtracks result onto the four loader outcomes. Searches
/// resolve to their first hit.
loader::load_outcome to_outcome(load_result result);

class lavalink_resolver : public loader::resolver {
public:
    explicit lavalink_resolver(node& node) : m_node(node) {}

    void resolve(const std::string& identifier,
                 std::function<void(loader::load_outcome)> on_done) override;

private:
    node& m_node;
};

} // namespace lb::lavalink
