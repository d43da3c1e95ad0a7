#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "lb/queue/track_provider.hpp"

namespace lb::queue {

/// Fair queue: plain adds are interleaved by requester, shuffle order is
/// computed lazily from per-track ranks and cached until the next mutation.
/// Every operation runs under one mutex.
class simple_track_provider : public track_provider {
public:
    simple_track_provider() = default;

    void add(queued_track_ptr track) override;
    void add_all(const std::vector<queued_track_ptr>& tracks) override;
    void add_first(queued_track_ptr track) override;
    void add_all_first(const std::vector<queued_track_ptr>& tracks) override;

    bool remove(const queued_track_ptr& track) override;
    void remove_all(const std::vector<queued_track_ptr>& tracks) override;
    void remove_all_by_id(const std::unordered_set<std::uint64_t>& track_ids) override;
    void clear() override;

    queued_track_ptr get_track(std::size_t index) override;
    std::vector<queued_track_ptr> get_tracks_in_range(std::size_t start_index,
                                                      std::size_t end_index) override;
    std::vector<queued_track_ptr> as_list() const override;
    std::vector<queued_track_ptr> as_list_ordered() override;

    queued_track_ptr peek() override;
    queued_track_ptr provide_next() override;
    void skipped() override;
    void reshuffle() override;

    std::size_t size() const override;
    bool empty() const override;
    std::int64_t duration_ms() const override;
    std::size_t streams_count() const override;
    bool is_user_track_owner(dpp::snowflake user_id,
                             const std::unordered_set<std::uint64_t>& track_ids) const override;

    void set_shuffle(bool shuffle) override;
    bool is_shuffle() const override;
    void set_repeat_mode(repeat_mode mode) override;
    repeat_mode get_repeat_mode() const override;

private:
    mutable std::mutex m_mutex;

    std::deque<queued_track_ptr> m_queue;
    queued_track_ptr             m_last_track;

    std::vector<queued_track_ptr> m_shuffled;
    bool                          m_shuffled_stale = true;

    bool        m_shuffle = false;
    repeat_mode m_repeat  = repeat_mode::none;

    // All *_locked helpers expect m_mutex to be held.
    void insert_fair_locked(queued_track_ptr track);
    std::size_t find_insertion_point_locked(const queued_track& track) const;
    const std::vector<queued_track_ptr>& shuffled_locked();
    queued_track_ptr at_locked(std::size_t index);
    bool erase_locked(const queued_track_ptr& track);
};

} // namespace lb::queue
