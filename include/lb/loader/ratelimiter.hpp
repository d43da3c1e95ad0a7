#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/snowflake.h>

#include "lb/loader/load_request.hpp"

namespace lb::loader {

/// A collection that takes long to resolve. total_items is 0 when unknown.
struct collection_info {
    std::string name;
    std::size_t total_items = 0;
};

class ratelimiter {
public:
    virtual ~ratelimiter() = default;

    /// Set only for identifiers of known slow-loading collections.
    virtual std::optional<collection_info> get_collection_info(const std::string& identifier) = 0;

    /// Called with what a collection actually resolved to.
    virtual void collection_loaded(const std::string& identifier, const collection_info& info) = 0;

    /// Records the load when it is allowed.
    virtual bool is_ratelimited(const load_request& request,
                                const collection_info& info,
                                std::size_t item_count) = 0;
};

struct ratelimit_config {
    std::chrono::seconds     window{60};
    std::size_t              max_collection_loads = 2;
    std::size_t              max_items            = 1000;
    std::size_t              known_collections    = 1024; // sizes remembered for pre-load checks
    std::vector<std::string> slow_sources; // ECMAScript patterns, searched in the identifier
};

/// Sliding window per requester over slow collection loads and their size.
/// Names and sizes are learned from earlier loads of the same collection;
/// a collection never seen before reports its identifier and 0 items.
class playlist_ratelimiter : public ratelimiter {
public:
    using clock = std::chrono::steady_clock;

    explicit playlist_ratelimiter(const ratelimit_config& cfg,
                                  std::function<clock::time_point()> now = &clock::now);

    std::optional<collection_info> get_collection_info(const std::string& identifier) override;
    void collection_loaded(const std::string& identifier, const collection_info& info) override;

    bool is_ratelimited(const load_request& request,
                        const collection_info& info,
                        std::size_t item_count) override;

private:
    struct load_record {
        clock::time_point at;
        std::size_t       items = 0;
    };

    ratelimit_config                   m_cfg;
    std::function<clock::time_point()> m_now;
    std::vector<std::regex>            m_slow_sources;

    std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, std::deque<load_record>> m_loads;

    // Oldest first in m_known_order.
    std::unordered_map<std::string, collection_info> m_known;
    std::deque<std::string>                          m_known_order;

    bool is_slow_source(const std::string& identifier) const;
};

} // namespace lb::loader
