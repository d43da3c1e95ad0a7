#pragma once

#include <string>
#include <cstdint>

namespace lb::lavalink {

struct track {
    std::string  encoded;
    std::string  identifier;
    std::string  title;
    std::string  author;
    std::string  uri;
    std::int64_t length_ms = 0;
    bool         is_stream = false;
};

} // namespace lb::lavalink
