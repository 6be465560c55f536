#pragma once

#include "common/error_types.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>

namespace assessgrader::detail {

struct SplitUrl
{
    /// scheme://host[:port], what httplib::Client wants
    std::string origin;
    /// Path prefix without a trailing slash, possibly empty
    std::string path_prefix;
};

/// Split "https://host:port/some/prefix" into origin and prefix
Result<SplitUrl> split_url(std::string_view url);

/// json converts implicitly to and from enums, which would make ``Result<json>`` ambiguous
struct JsonBody
{
    nlohmann::json json;
};

/// Parse a response body, mapping anything unexpected to ``BadResponse``
Result<JsonBody> parse_json_body(const httplib::Result& res, std::string_view what);

/// Sleep for ``duration``, waking early if ``stop`` is requested. Returns false if it was interrupted
bool interruptible_sleep(std::chrono::milliseconds duration, const std::stop_token& stop);

} // namespace assessgrader::detail
