#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <dpp/snowflake.h>

namespace lb::loader {

/// Where notices about a load request go. Implementations may throw; the
/// loader never lets a failed notice stop the pipeline.
class reply_sink {
public:
    virtual ~reply_sink() = default;

    virtual void reply(const std::string& text) = 0;
    /// Same as reply(), prefixed with the requester's name.
    virtual void reply_with_name(const std::string& text) = 0;
};

struct load_request {
    std::string                 identifier;
    dpp::snowflake              user_id;
    std::string                 user_name;
    bool                        priority = false;
    bool                        quiet    = false;
    std::int64_t                position_ms = 0;
    std::shared_ptr<reply_sink> sink;
};

} // namespace lb::loader
