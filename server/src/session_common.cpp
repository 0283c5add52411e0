#include "session_common.hpp"

#include <charconv>
#include <ctime>

#include "chunkdrive/encoding/percent.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/server/errors.hpp"

namespace chunkdrive::server::session_common
{

    namespace
    {

        std::string decode_or_throw(std::string_view text, std::string_view what)
        {
            auto decoded = chunkdrive::encoding::percent_decode(text);
            if (!decoded)
            {
                throw ServerError(chunkdrive::ErrorCode::InvalidPayload, "Malformed escape in " + std::string(what));
            }
            return std::move(*decoded);
        }

    } // namespace

    const std::string &Target::require(std::string_view name) const
    {
        const auto it = query.find(name);
        if (it == query.end() || it->second.empty())
        {
            throw ServerError(chunkdrive::ErrorCode::InvalidPayload, "Missing parameter: " + std::string(name));
        }
        return it->second;
    }

    std::uint64_t Target::require_unsigned(std::string_view name) const
    {
        const auto value = parse_unsigned(require(name));
        if (!value)
        {
            throw ServerError(chunkdrive::ErrorCode::InvalidPayload,
                              "Parameter " + std::string(name) + " must be a non-negative integer");
        }
        return *value;
    }

    Target parse_target(std::string_view target)
    {
        Target result;
        const auto question = target.find('?');
        result.path = decode_or_throw(target.substr(0, question), "path");
        if (question == std::string_view::npos)
        {
            return result;
        }

        auto query = target.substr(question + 1);
        while (!query.empty())
        {
            const auto amp = query.find('&');
            const auto item = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
            if (item.empty())
            {
                continue;
            }
            const auto eq = item.find('=');
            auto key = decode_or_throw(item.substr(0, eq), "query");
            auto value = eq == std::string_view::npos ? std::string{} : decode_or_throw(item.substr(eq + 1), "query");
            result.query.insert_or_assign(std::move(key), std::move(value));
        }
        return result;
    }

    std::string_view strip_query(std::string_view target)
    {
        return target.substr(0, target.find('?'));
    }

    std::optional<std::uint64_t> parse_unsigned(std::string_view text)
    {
        std::uint64_t value{};
        const auto *begin = text.data();
        const auto *end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (text.empty() || ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return value;
    }

    std::string format_utc(std::chrono::system_clock::time_point time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm tm{};
        gmtime_r(&seconds, &tm);
        char buffer[32];
        const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return std::string(buffer, written);
    }

    StringResponse make_json_response(http::status status, unsigned version, bool keep_alive,
                                      const nlohmann::json &body)
    {
        StringResponse response{status, version};
        response.set(http::field::content_type, "application/json");
        response.keep_alive(keep_alive);
        // Messages can echo decoded client bytes; never let a bad byte fail the reply.
        response.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        response.prepare_payload();
        return response;
    }

    StringResponse make_error_response(const chunkdrive::protocol::ErrorBody &error, unsigned version,
                                       bool keep_alive)
    {
        const auto status = static_cast<http::status>(chunkdrive::http_status_for(error.error));
        return make_json_response(status, version, keep_alive, nlohmann::json(error));
    }

} // namespace chunkdrive::server::session_common
