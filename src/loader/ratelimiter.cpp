#include "lb/loader/ratelimiter.hpp"

namespace lb::loader {

playlist_ratelimiter::playlist_ratelimiter(const ratelimit_config& cfg,
                                           std::function<clock::time_point()> now)
    : m_cfg(cfg)
    , m_now(std::move(now))
{
    for (const auto& pattern : m_cfg.slow_sources) {
        m_slow_sources.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    }
}

bool playlist_ratelimiter::is_slow_source(const std::string& identifier) const
{
    for (const auto& source : m_slow_sources) {
        if (std::regex_search(identifier, source)) {
            return true;
        }
    }
    return false;
}

std::optional<collection_info> playlist_ratelimiter::get_collection_info(const std::string& identifier)
{
    if (!is_slow_source(identifier)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_known.find(identifier);
    if (it != m_known.end()) {
        return it->second;
    }
    return collection_info{identifier, 0};
}

void playlist_ratelimiter::collection_loaded(const std::string& identifier, const collection_info& info)
{
    if (m_cfg.known_collections == 0 || !is_slow_source(identifier)) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto inserted = m_known.insert_or_assign(identifier, info);
    if (inserted.second) {
        m_known_order.push_back(identifier);
    }
    while (m_known_order.size() > m_cfg.known_collections) {
        m_known.erase(m_known_order.front());
        m_known_order.pop_front();
    }
}

bool playlist_ratelimiter::is_ratelimited(const load_request& request,
                                          const collection_info& info,
                                          std::size_t item_count)
{
    (void)info;

    const auto now = m_now();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& loads = m_loads[request.user_id];
    while (!loads.empty() && now - loads.front().at >= m_cfg.window) {
        loads.pop_front();
    }

    std::size_t items = item_count;
    for (const auto& record : loads) {
        items += record.items;
    }

    if (loads.size() >= m_cfg.max_collection_loads || items > m_cfg.max_items) {
        return true;
    }

    loads.push_back({now, item_count});
    return false;
}

} // namespace lb::loader
