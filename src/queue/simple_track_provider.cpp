#include "lb/queue/simple_track_provider.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace lb::queue {

namespace {

constexpr std::int32_t k_rank_min = std::numeric_limits<std::int32_t>::min();
constexpr std::int32_t k_rank_max = std::numeric_limits<std::int32_t>::max();

} // namespace

// ---------- insertion ----------

void simple_track_provider::add(queued_track_ptr track)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    insert_fair_locked(std::move(track));
}

void simple_track_provider::add_all(const std::vector<queued_track_ptr>& tracks)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& track : tracks) {
        insert_fair_locked(track);
    }
}

void simple_track_provider::add_first(queued_track_ptr track)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    track->set_rank(k_rank_min);
    m_queue.push_front(std::move(track));
    m_shuffled_stale = true;
}

void simple_track_provider::add_all_first(const std::vector<queued_track_ptr>& tracks)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = tracks.rbegin(); it != tracks.rend(); ++it) {
        (*it)->set_rank(k_rank_min);
        m_queue.push_front(*it);
    }
    m_shuffled_stale = true;
}

void simple_track_provider::insert_fair_locked(queued_track_ptr track)
{
    const std::size_t index = find_insertion_point_locked(*track);
    m_queue.insert(m_queue.begin() + static_cast<std::ptrdiff_t>(index), std::move(track));
    m_shuffled_stale = true;
}

std::size_t simple_track_provider::find_insertion_point_locked(const queued_track& track) const
{
    std::unordered_map<dpp::snowflake, int> track_count;
    const dpp::snowflake owner = track.user_id();
    track_count[owner] = 1;

    // The track currently playing counts towards its requester.
    if (m_last_track) {
        ++track_count[m_last_track->user_id()];
    }

    // Tracks queued with priority stay in front of everything else.
    std::size_t first_allowed = 0;
    while (first_allowed < m_queue.size() && m_queue[first_allowed]->is_priority()) {
        ++first_allowed;
    }

    for (std::size_t index = 0; index < m_queue.size(); ++index) {
        const dpp::snowflake current = m_queue[index]->user_id();
        const int count = ++track_count[current];
        if (index >= first_allowed && current != owner && count > track_count[owner]) {
            return index;
        }
    }

    return m_queue.size();
}

// ---------- removal ----------

bool simple_track_provider::erase_locked(const queued_track_ptr& track)
{
    auto it = std::find(m_queue.begin(), m_queue.end(), track);
    if (it == m_queue.end()) {
        return false;
    }
    m_queue.erase(it);
    m_shuffled_stale = true;
    return true;
}

bool simple_track_provider::remove(const queued_track_ptr& track)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return erase_locked(track);
}

void simple_track_provider::remove_all(const std::vector<queued_track_ptr>& tracks)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& track : tracks) {
        erase_locked(track);
    }
}

void simple_track_provider::remove_all_by_id(const std::unordered_set<std::uint64_t>& track_ids)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto before = m_queue.size();
    m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(),
                                 [&](const queued_track_ptr& t) {
                                     return track_ids.count(t->track_id()) != 0;
                                 }),
                  m_queue.end());
    if (m_queue.size() != before) {
        m_shuffled_stale = true;
    }
}

void simple_track_provider::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_track.reset();
    m_queue.clear();
    m_shuffled_stale = true;
}

// ---------- presentation order ----------

/// Sorts by rank, then spreads the ranks evenly over (0, INT32_MAX) so that
/// a replayed track given INT32_MAX lands behind all of them.
const std::vector<queued_track_ptr>& simple_track_provider::shuffled_locked()
{
    if (!m_shuffled_stale) {
        return m_shuffled;
    }

    std::vector<queued_track_ptr> list(m_queue.begin(), m_queue.end());
    std::stable_sort(list.begin(), list.end(),
                     [](const queued_track_ptr& a, const queued_track_ptr& b) {
                         return a->rank() < b->rank();
                     });

    const double size = static_cast<double>(list.size());
    for (std::size_t i = 0; i < list.size(); ++i) {
        const auto rank = static_cast<std::int32_t>(
            (static_cast<double>(i) / (size + 1.0) + 1.0 / (size + 1.0)) * k_rank_max);
        list[i]->set_rank(list[i]->is_priority() ? k_rank_min : rank);
    }

    m_shuffled       = std::move(list);
    m_shuffled_stale = false;
    return m_shuffled;
}

queued_track_ptr simple_track_provider::at_locked(std::size_t index)
{
    if (index >= m_queue.size()) {
        return nullptr;
    }
    return m_shuffle ? shuffled_locked()[index] : m_queue[index];
}

queued_track_ptr simple_track_provider::get_track(std::size_t index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return at_locked(index);
}

std::vector<queued_track_ptr> simple_track_provider::get_tracks_in_range(std::size_t start_index,
                                                                         std::size_t end_index)
{
    if (start_index > end_index) {
        std::swap(start_index, end_index);
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<queued_track_ptr> result;
    const std::size_t end = std::min(end_index, m_queue.size());
    for (std::size_t i = start_index; i < end; ++i) {
        result.push_back(at_locked(i));
    }

    // Ranges are usually read right before the tracks get removed.
    if (!result.empty()) {
        m_shuffled_stale = true;
    }
    return result;
}

std::vector<queued_track_ptr> simple_track_provider::as_list() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_queue.begin(), m_queue.end()};
}

std::vector<queued_track_ptr> simple_track_provider::as_list_ordered()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_shuffle) {
        return {m_queue.begin(), m_queue.end()};
    }
    return shuffled_locked();
}

// ---------- playback ----------

queued_track_ptr simple_track_provider::peek()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return at_locked(0);
}

queued_track_ptr simple_track_provider::provide_next()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_repeat == repeat_mode::single && m_last_track) {
        return m_last_track->make_clone();
    }

    if (m_repeat == repeat_mode::all && m_last_track) {
        // Put a fresh copy of the last track at the back of the queue.
        auto clone = m_last_track->make_clone();
        if (m_shuffle) {
            clone->set_rank(k_rank_max);
        }
        m_queue.push_back(std::move(clone));
        m_shuffled_stale = true;
    }

    queued_track_ptr next = at_locked(0);
    if (next) {
        erase_locked(next);
    }
    m_last_track = next;
    return next;
}

void simple_track_provider::skipped()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_track.reset();
}

void simple_track_provider::reshuffle()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& track : m_queue) {
        track->randomize();
        track->set_priority(false);
    }
    m_shuffled_stale = true;
}

// ---------- stats ----------

std::size_t simple_track_provider::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool simple_track_provider::empty() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.empty();
}

std::int64_t simple_track_provider::duration_ms() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::int64_t duration = 0;
    for (const auto& track : m_queue) {
        if (!track->is_stream()) {
            duration += track->effective_duration_ms();
        }
    }
    return duration;
}

std::size_t simple_track_provider::streams_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(
        std::count_if(m_queue.begin(), m_queue.end(),
                      [](const queued_track_ptr& t) { return t->is_stream(); }));
}

bool simple_track_provider::is_user_track_owner(dpp::snowflake user_id,
                                                const std::unordered_set<std::uint64_t>& track_ids) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& track : m_queue) {
        if (track_ids.count(track->track_id()) != 0 && track->user_id() != user_id) {
            return false;
        }
    }
    return true;
}

// ---------- modes ----------

void simple_track_provider::set_shuffle(bool shuffle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shuffle = shuffle;
    if (shuffle) {
        // Stale priority flags from before the toggle would pin tracks to the
        // front of the shuffled order, and repeat-all could then replay a track
        // object that is still playing.
        for (const auto& track : m_queue) {
            track->set_priority(false);
        }
        m_shuffled_stale = true;
    }
}

bool simple_track_provider::is_shuffle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shuffle;
}

void simple_track_provider::set_repeat_mode(repeat_mode mode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_repeat = mode;
}

repeat_mode simple_track_provider::get_repeat_mode() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_repeat;
}

} // namespace lb::queue
