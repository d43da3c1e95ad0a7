#pragma once

#include <cstddef>

namespace lb::loader {

class playback_controller {
public:
    virtual ~playback_controller() = default;

    virtual bool is_playing() const = 0;
    virtual bool is_paused() const = 0;
    virtual void play() = 0;
    /// Queued tracks plus the one playing.
    virtual std::size_t track_count() const = 0;
};

} // namespace lb::loader
