#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/filesystem.hpp"
#include "chunkdrive/server/range_server.hpp"
#include "chunkdrive/server/tenant_resolver.hpp"
#include "chunkdrive/server/upload_registry.hpp"

namespace chunkdrive::server
{

    namespace session_common
    {
        struct Target;
    } // namespace session_common

    struct ServerServices
    {
        Filesystem &filesystem;
        UploadRegistry &uploads;
        const RangeServer &range_server;
        const TenantResolver &tenants;
        std::chrono::seconds upload_timeout;
    };

    // One HTTP/1.1 connection. Requests are handled one at a time in arrival
    // order; all socket operations run on the connection's strand.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        // Bodies of requests other than chunk uploads are capped at this size.
        static constexpr std::size_t kMaxRequestBody = 64 * 1024;

        Session(boost::asio::ip::tcp::socket socket, ServerServices services);

        void start();

    private:
        using Request = boost::beast::http::request<boost::beast::http::string_body>;
        struct DownloadTransfer;

        void read_request_header();
        void on_request_header(boost::beast::error_code ec, std::size_t bytes_transferred);
        void on_request_body(boost::beast::error_code ec, std::size_t bytes_transferred);
        void process_request();
        void dispatch(const Request &request, const session_common::Target &target);

        void send_response(boost::beast::http::response<boost::beast::http::string_body> response);
        void send_error(chunkdrive::protocol::ErrorBody error, bool close = false);
        void on_write(bool close, boost::beast::error_code ec);
        void stop();

        void handle_health(const Request &request);
        void handle_upload_init(const Request &request);
        void handle_upload_chunk(const Request &request, const session_common::Target &target);
        void handle_upload_finish(const Request &request, const session_common::Target &target);
        void handle_upload_status(const Request &request, const std::string &session_id);
        void handle_download(const Request &request, const std::string &artifact);
        void handle_head(const Request &request, const std::string &artifact);

        void write_next_piece(std::shared_ptr<DownloadTransfer> transfer);
        void on_piece_written(std::shared_ptr<DownloadTransfer> transfer, boost::beast::error_code ec);

        std::string remote_endpoint() const;

        boost::beast::tcp_stream stream_;
        ServerServices services_;
        boost::beast::flat_buffer buffer_;
        std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
        std::string request_line_;
        unsigned version_{11};
        bool keep_alive_{false};
        bool head_request_{false};
        std::string tenant_;
    };

} // namespace chunkdrive::server
