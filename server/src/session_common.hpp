#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "chunkdrive/protocol.hpp"

namespace chunkdrive::server::session_common
{

    namespace http = boost::beast::http;

    using StringResponse = http::response<http::string_body>;

    inline std::string_view view_of(boost::beast::string_view text) noexcept
    {
        return {text.data(), text.size()};
    }

    // Request target split into a percent-decoded path and query parameters.
    struct Target
    {
        std::string path;
        std::map<std::string, std::string, std::less<>> query;

        const std::string &require(std::string_view name) const;

        std::uint64_t require_unsigned(std::string_view name) const;
    };

    // Throws ServerError(InvalidPayload) on a malformed escape.
    Target parse_target(std::string_view target);

    std::string_view strip_query(std::string_view target);

    std::optional<std::uint64_t> parse_unsigned(std::string_view text);

    // ISO-8601 UTC, second precision: `YYYY-MM-DDTHH:MM:SSZ`.
    std::string format_utc(std::chrono::system_clock::time_point time);

    StringResponse make_json_response(http::status status, unsigned version, bool keep_alive,
                                      const nlohmann::json &body);

    StringResponse make_error_response(const chunkdrive::protocol::ErrorBody &error, unsigned version,
                                       bool keep_alive);

} // namespace chunkdrive::server::session_common
