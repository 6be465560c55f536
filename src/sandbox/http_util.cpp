#include "sandbox/http_util.hpp"

#include "common/error_types.hpp"
#include "logging.hpp"

#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace assessgrader::detail {

Result<SplitUrl> split_url(std::string_view url) {
    const auto scheme_end = url.find("://");

    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        LOG_WARN("URL '{}' has no scheme", url);
        return ErrorKind::BadResponse;
    }

    const auto path_start = url.find('/', scheme_end + 3);

    SplitUrl split;
    split.origin = std::string{url.substr(0, path_start)};

    if (path_start != std::string_view::npos) {
        std::string_view prefix = url.substr(path_start);
        while (!prefix.empty() && prefix.back() == '/') {
            prefix.remove_suffix(1);
        }
        split.path_prefix = std::string{prefix};
    }

    return split;
}

Result<JsonBody> parse_json_body(const httplib::Result& res, std::string_view what) {
    if (!res) {
        LOG_WARN("{}: request failed: {}", what, httplib::to_string(res.error()));
        return ErrorKind::SandboxUnavailable;
    }

    if (res->status >= 500 || res->status == 429) {
        LOG_WARN("{}: backend answered HTTP {}", what, res->status);
        return ErrorKind::SandboxUnavailable;
    }

    if (res->status < 200 || res->status >= 300) {
        LOG_WARN("{}: unexpected HTTP {}: {}", what, res->status, res->body);
        return ErrorKind::BadResponse;
    }

    auto body = nlohmann::json::parse(res->body, nullptr, /*allow_exceptions=*/false);

    if (body.is_discarded()) {
        LOG_WARN("{}: response is not JSON: {}", what, res->body);
        return ErrorKind::BadResponse;
    }

    return JsonBody{std::move(body)};
}

bool interruptible_sleep(std::chrono::milliseconds duration, const std::stop_token& stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock{mutex};

    // Wakes only on timeout or stop
    cv.wait_for(lock, stop, duration, [] { return false; });

    return !stop.stop_requested();
}

} // namespace assessgrader::detail
