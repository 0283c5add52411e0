#include "chunkdrive/server/session.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace chunkdrive::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;

    namespace
    {

        bool wants_sha256(std::string_view want_digest)
        {
            std::string lowered(want_digest);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return lowered.find("sha-256") != std::string::npos;
        }

        template <typename Message>
        void apply_framing(Message &message, const ResponseFraming &framing)
        {
            message.result(static_cast<http::status>(framing.status));
            message.set(http::field::accept_ranges, "bytes");
            message.set(http::field::content_type, framing.content_type);
            message.set(http::field::content_disposition, framing.content_disposition);
            if (framing.content_range)
            {
                message.set(http::field::content_range, *framing.content_range);
            }
            if (framing.digest)
            {
                message.set(http::field::digest, *framing.digest);
            }
            message.content_length(framing.content_length);
        }

    } // namespace

    // Response and serializer stay put while the body is written piece by piece.
    struct Session::DownloadTransfer
    {
        DownloadTransfer(http::response<http::buffer_body> message, std::unique_ptr<ArtifactStream> stream)
            : response(std::move(message)), serializer(response), body(std::move(stream))
        {
        }

        http::response<http::buffer_body> response;
        http::response_serializer<http::buffer_body> serializer;
        std::unique_ptr<ArtifactStream> body;
    };

    void Session::handle_head(const Request &request, const std::string &artifact)
    {
        const auto paths = services_.filesystem.prepare_tenant_paths(tenant_);
        const auto path = services_.filesystem.resolve_artifact(paths, artifact);
        const auto metadata = services_.range_server.inspect(path);
        const bool want_digest = wants_sha256(session_common::view_of(request[http::field::want_digest]));
        const auto framing = services_.range_server.head(metadata, want_digest);

        http::response<http::string_body> response{http::status::ok, version_};
        response.keep_alive(keep_alive_);
        apply_framing(response, framing);
        send_response(std::move(response));
    }

    void Session::handle_download(const Request &request, const std::string &artifact)
    {
        const auto paths = services_.filesystem.prepare_tenant_paths(tenant_);
        const auto path = services_.filesystem.resolve_artifact(paths, artifact);
        const auto metadata = services_.range_server.inspect(path);

        std::optional<std::string_view> range_header;
        if (const auto it = request.find(http::field::range); it != request.end())
        {
            range_header = session_common::view_of(it->value());
        }
        const auto plan = plan_range(range_header, metadata.length);
        const bool want_digest = wants_sha256(session_common::view_of(request[http::field::want_digest]));
        auto download = services_.range_server.get(metadata, plan, want_digest);

        http::response<http::buffer_body> response{http::status::ok, version_};
        response.keep_alive(keep_alive_);
        apply_framing(response, download.framing);
        response.body().data = nullptr;
        response.body().more = true;

        spdlog::info("Serving {} to {}: status={} bytes={}", metadata.name, remote_endpoint(), download.framing.status,
                     download.framing.content_length);

        auto transfer = std::make_shared<DownloadTransfer>(std::move(response), std::move(download.body));
        stream_.expires_never();
        http::async_write_header(stream_, transfer->serializer,
                                 [self = shared_from_this(), transfer](beast::error_code ec, std::size_t)
                                 { self->on_piece_written(transfer, ec); });
    }

    void Session::write_next_piece(std::shared_ptr<DownloadTransfer> transfer)
    {
        auto &body = transfer->response.body();
        try
        {
            const auto piece = transfer->body->next();
            body.data = piece.empty() ? nullptr : const_cast<std::byte *>(piece.data());
            body.size = piece.size();
            body.more = !transfer->body->done();
        }
        catch (const std::exception &ex)
        {
            // Headers are already sent.
            spdlog::error("Download from {} aborted: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }

        http::async_write(stream_, transfer->serializer,
                          [self = shared_from_this(), transfer](beast::error_code ec, std::size_t)
                          { self->on_piece_written(transfer, ec); });
    }

    void Session::on_piece_written(std::shared_ptr<DownloadTransfer> transfer, beast::error_code ec)
    {
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (ec)
        {
            spdlog::debug("Download to {} interrupted: {}", remote_endpoint(), ec.message());
            stop();
            return;
        }
        if (!transfer->serializer.is_done())
        {
            write_next_piece(std::move(transfer));
            return;
        }
        if (transfer->response.need_eof())
        {
            stop();
            return;
        }
        read_request_header();
    }

} // namespace chunkdrive::server
