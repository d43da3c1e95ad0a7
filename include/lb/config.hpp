#pragma once

#include <stdexcept>
#include <string>

#include <dpp/dpp.h>

#include "lb/lavalink/client.hpp"
#include "lb/loader/audio_loader.hpp"
#include "lb/loader/ratelimiter.hpp"

namespace lb {

class config_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct bot_config {
    std::string                token;
    dpp::loglevel              log_level = dpp::ll_info;
    lavalink::node_config      lavalink;
    loader::loader_config      loader;
    loader::ratelimit_config   ratelimit;
};

/// Reads a configuration object. Missing keys keep their defaults.
/// @throws config_error on values of the wrong type
bot_config parse_config(const dpp::json& j);

/// Reads `path`, then lets the `token` environment variable override the
/// file. A missing file yields the defaults.
/// @throws config_error if the file is not valid JSON
bot_config load_config(const std::string& path);

} // namespace lb
