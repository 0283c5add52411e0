#include "chunkdrive/server/session.hpp"

#include <cstdint>
#include <optional>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>

#include <spdlog/spdlog.h>

#include "chunkdrive/server/errors.hpp"
#include "session_common.hpp"

namespace chunkdrive::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;

    namespace
    {

        constexpr std::chrono::seconds kIoTimeout{60};
        constexpr std::string_view kStatusPrefix = "/upload/status/";
        constexpr std::string_view kDownloadPrefix = "/download/";

        bool starts_with(std::string_view text, std::string_view prefix)
        {
            return text.substr(0, prefix.size()) == prefix;
        }

        chunkdrive::protocol::ErrorBody error_body(chunkdrive::ErrorCode code, std::string message)
        {
            return {.error = code, .message = std::move(message), .missing = {}, .surplus = {}};
        }

    } // namespace

    Session::Session(net::ip::tcp::socket socket, ServerServices services)
        : stream_(std::move(socket)), services_(services) {}

    void Session::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::read_request_header, shared_from_this()));
    }

    void Session::read_request_header()
    {
        parser_.emplace();
        // Checked against the route's own limit once the header is known.
        parser_->body_limit(boost::none);
        stream_.expires_after(kIoTimeout);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::on_request_header, shared_from_this()));
    }

    void Session::on_request_header(beast::error_code ec, std::size_t /*bytes_transferred*/)
    {
        if (ec)
        {
            if (ec != http::error::end_of_stream && ec != net::error::operation_aborted)
            {
                spdlog::debug("Read failed for {}: {}", remote_endpoint(), ec.message());
            }
            stop();
            return;
        }

        const auto &header = parser_->get();
        version_ = header.version();
        keep_alive_ = header.keep_alive();
        head_request_ = header.method() == http::verb::head;
        request_line_ = std::string(header.method_string()) + " " + std::string(header.target());

        const bool chunk_upload = header.method() == http::verb::post &&
                                  session_common::strip_query(session_common::view_of(header.target())) == "/upload/chunk";
        const std::uint64_t limit = chunk_upload ? services_.uploads.max_chunk_size() : kMaxRequestBody;
        if (const auto length = parser_->content_length(); length && *length > limit)
        {
            spdlog::warn("{} from {} rejected: body of {} bytes exceeds {}", request_line_, remote_endpoint(), *length,
                         limit);
            if (chunk_upload)
            {
                send_error(error_body(chunkdrive::ErrorCode::ChunkTooLarge,
                                      "Chunk size exceeds limit (" + std::to_string(limit) + " bytes)"),
                           true);
            }
            else
            {
                send_error(error_body(chunkdrive::ErrorCode::PayloadTooLarge, "Request body too large"), true);
            }
            return;
        }
        parser_->body_limit(limit);

        if (parser_->is_done())
        {
            process_request();
            return;
        }
        stream_.expires_after(kIoTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_request_body, shared_from_this()));
    }

    void Session::on_request_body(beast::error_code ec, std::size_t /*bytes_transferred*/)
    {
        if (ec == http::error::body_limit)
        {
            const bool chunk_upload = session_common::strip_query(session_common::view_of(parser_->get().target())) ==
                                      "/upload/chunk";
            send_error(error_body(chunk_upload ? chunkdrive::ErrorCode::ChunkTooLarge
                                               : chunkdrive::ErrorCode::PayloadTooLarge,
                                  "Request body too large"),
                       true);
            return;
        }
        if (ec)
        {
            spdlog::debug("Read body failed for {}: {}", remote_endpoint(), ec.message());
            stop();
            return;
        }
        process_request();
    }

    void Session::process_request()
    {
        const auto request = parser_->release();
        chunkdrive::protocol::ErrorBody error{};
        std::optional<std::uint64_t> artifact_length;
        try
        {
            const auto target = session_common::parse_target(session_common::view_of(request.target()));
            dispatch(request, target);
            return;
        }
        catch (const UploadError &ex)
        {
            spdlog::warn("{} from {} failed: {}", request_line_, remote_endpoint(), ex.what());
            error = {.error = ex.code(), .message = ex.what(), .missing = ex.missing(), .surplus = ex.surplus()};
        }
        catch (const RangeError &ex)
        {
            spdlog::warn("{} from {} failed: {}", request_line_, remote_endpoint(), ex.what());
            error = error_body(ex.code(), ex.what());
            artifact_length = ex.artifact_length();
        }
        catch (const ServerError &ex)
        {
            spdlog::warn("{} from {} failed: {}", request_line_, remote_endpoint(), ex.what());
            error = error_body(ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} from {} failed: {}", request_line_, remote_endpoint(), ex.what());
            error = error_body(chunkdrive::ErrorCode::InternalError, ex.what());
        }

        try
        {
            auto response = session_common::make_error_response(error, version_, keep_alive_);
            if (artifact_length && response.result() == http::status::range_not_satisfiable)
            {
                response.set(http::field::content_range, "bytes */" + std::to_string(*artifact_length));
            }
            send_response(std::move(response));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to report error to {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Session::dispatch(const Request &request, const session_common::Target &target)
    {
        const auto method = request.method();
        const auto &path = target.path;

        if (path == "/health")
        {
            if (method != http::verb::get)
            {
                throw ServerError(chunkdrive::ErrorCode::MethodNotAllowed, "Method not allowed");
            }
            handle_health(request);
            return;
        }

        const auto tenant = services_.tenants.resolve(session_common::view_of(request[http::field::authorization]));
        if (!tenant)
        {
            throw ServerError(chunkdrive::ErrorCode::AuthenticationRequired, "Authentication required");
        }
        tenant_ = *tenant;

        const auto require_method = [method](http::verb expected)
        {
            if (method != expected)
            {
                throw ServerError(chunkdrive::ErrorCode::MethodNotAllowed, "Method not allowed");
            }
        };

        if (path == "/upload/init")
        {
            require_method(http::verb::post);
            handle_upload_init(request);
        }
        else if (path == "/upload/chunk")
        {
            require_method(http::verb::post);
            handle_upload_chunk(request, target);
        }
        else if (path == "/upload/finish")
        {
            require_method(http::verb::post);
            handle_upload_finish(request, target);
        }
        else if (starts_with(path, kStatusPrefix) && path.size() > kStatusPrefix.size())
        {
            require_method(http::verb::get);
            handle_upload_status(request, path.substr(kStatusPrefix.size()));
        }
        else if (starts_with(path, kDownloadPrefix) && path.size() > kDownloadPrefix.size())
        {
            const auto artifact = path.substr(kDownloadPrefix.size());
            if (method == http::verb::get)
            {
                handle_download(request, artifact);
            }
            else if (method == http::verb::head)
            {
                handle_head(request, artifact);
            }
            else
            {
                throw ServerError(chunkdrive::ErrorCode::MethodNotAllowed, "Method not allowed");
            }
        }
        else
        {
            throw ServerError(chunkdrive::ErrorCode::InvalidCommand, "Unknown endpoint: " + path);
        }
    }

    void Session::handle_health(const Request & /*request*/)
    {
        send_response(session_common::make_json_response(http::status::ok, version_, keep_alive_,
                                                         nlohmann::json{{"status", "healthy"}}));
    }

    void Session::send_response(http::response<http::string_body> response)
    {
        spdlog::debug("{} from {} -> {}", request_line_, remote_endpoint(), response.result_int());
        if (head_request_)
        {
            // Content-Length stays as it would be for GET.
            response.body().clear();
        }
        auto message = std::make_shared<http::response<http::string_body>>(std::move(response));
        const bool close = message->need_eof();
        stream_.expires_after(kIoTimeout);
        http::async_write(stream_, *message,
                          [self = shared_from_this(), message, close](beast::error_code ec, std::size_t)
                          { self->on_write(close, ec); });
    }

    void Session::send_error(chunkdrive::protocol::ErrorBody error, bool close)
    {
        send_response(session_common::make_error_response(error, version_, keep_alive_ && !close));
    }

    void Session::on_write(bool close, beast::error_code ec)
    {
        if (ec)
        {
            spdlog::debug("Write failed for {}: {}", remote_endpoint(), ec.message());
            stop();
            return;
        }
        if (close)
        {
            stop();
            return;
        }
        read_request_header();
    }

    void Session::stop()
    {
        spdlog::debug("Closing connection for {}", remote_endpoint());
        beast::error_code ec;
        stream_.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    std::string Session::remote_endpoint() const
    {
        beast::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkdrive::server
