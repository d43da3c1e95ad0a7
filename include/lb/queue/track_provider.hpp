#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <vector>

#include <dpp/snowflake.h>

#include "lb/queue/queued_track.hpp"

namespace lb::queue {

enum class repeat_mode {
    none,
    single,
    all
};

/// Ordering policy of a guild queue. One implementation per policy.
class track_provider {
public:
    virtual ~track_provider() = default;

    // Insertion
    virtual void add(queued_track_ptr track) = 0;
    virtual void add_all(const std::vector<queued_track_ptr>& tracks) = 0;
    virtual void add_first(queued_track_ptr track) = 0;
    virtual void add_all_first(const std::vector<queued_track_ptr>& tracks) = 0;

    // Removal
    virtual bool remove(const queued_track_ptr& track) = 0;
    virtual void remove_all(const std::vector<queued_track_ptr>& tracks) = 0;
    virtual void remove_all_by_id(const std::unordered_set<std::uint64_t>& track_ids) = 0;
    virtual void clear() = 0;

    // Lookup in presentation order
    virtual queued_track_ptr get_track(std::size_t index) = 0;
    virtual std::vector<queued_track_ptr> get_tracks_in_range(std::size_t start_index,
                                                              std::size_t end_index) = 0;
    virtual std::vector<queued_track_ptr> as_list() const = 0;
    virtual std::vector<queued_track_ptr> as_list_ordered() = 0;

    // Playback
    virtual queued_track_ptr peek() = 0;
    virtual queued_track_ptr provide_next() = 0;
    virtual void skipped() = 0;
    virtual void reshuffle() = 0;

    // Stats
    virtual std::size_t size() const = 0;
    virtual bool empty() const = 0;
    virtual std::int64_t duration_ms() const = 0;
    virtual std::size_t streams_count() const = 0;
    virtual bool is_user_track_owner(dpp::snowflake user_id,
                                     const std::unordered_set<std::uint64_t>& track_ids) const = 0;

    // Modes
    virtual void set_shuffle(bool shuffle) = 0;
    virtual bool is_shuffle() const = 0;
    virtual void set_repeat_mode(repeat_mode mode) = 0;
    virtual repeat_mode get_repeat_mode() const = 0;
};

} // namespace lb::queue
