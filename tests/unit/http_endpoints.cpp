#include <cassert>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "chunkdrive/server/server.hpp"

using namespace chunkdrive::server;

namespace
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using Response = http::response<http::string_body>;
    using Headers = std::vector<std::pair<http::field, std::string>>;

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    // Owns a server on an ephemeral loopback port for the lifetime of a test.
    class RunningServer
    {
    public:
        explicit RunningServer(ServerConfig config) : server_(std::move(config))
        {
            thread_ = std::thread([this]
                                  { server_.run(); });
        }

        ~RunningServer()
        {
            server_.stop();
            thread_.join();
        }

        std::uint16_t port() const { return server_.port(); }

    private:
        Server server_;
        std::thread thread_;
    };

    ServerConfig make_config(const std::filesystem::path &root)
    {
        ServerConfig config;
        config.address = "127.0.0.1";
        config.port = 0;
        config.root = root;
        config.worker_threads = 2;
        config.max_chunk_size = 16;
        config.stream_buffer_size = 4;
        return config;
    }

    // `declared_length` overrides Content-Length without sending that many bytes.
    Response send(std::uint16_t port, http::verb verb, const std::string &target, const std::string &body = {},
                  const Headers &headers = {}, std::optional<std::uint64_t> declared_length = std::nullopt)
    {
        net::io_context io_context;
        beast::tcp_stream stream(io_context);
        stream.connect(net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

        http::request<http::string_body> request{verb, target, 11};
        request.set(http::field::host, "127.0.0.1");
        for (const auto &[field, value] : headers)
        {
            request.set(field, value);
        }
        request.body() = body;
        request.prepare_payload();
        if (declared_length)
        {
            request.content_length(*declared_length);
        }
        http::write(stream, request);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(boost::none);
        if (verb == http::verb::head)
        {
            parser.skip(true);
        }
        http::read(stream, buffer, parser);

        beast::error_code ec;
        stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        return parser.release();
    }

    nlohmann::json json_of(const Response &response)
    {
        return nlohmann::json::parse(response.body());
    }

    std::string header(const Response &response, http::field field)
    {
        return std::string(response[field]);
    }

    std::string upload(std::uint16_t port, const std::vector<std::string> &chunks, const std::string &name,
                       const Headers &headers = {})
    {
        const auto init = send(port, http::verb::post, "/upload/init", {}, headers);
        assert(init.result() == http::status::ok);
        const auto session_id = json_of(init).at("sessionId").get<std::string>();
        for (std::size_t i = 0; i < chunks.size(); ++i)
        {
            const auto ack = send(port, http::verb::post,
                                  "/upload/chunk?sessionId=" + session_id + "&index=" + std::to_string(i), chunks[i],
                                  headers);
            assert(ack.result() == http::status::ok);
        }
        const auto finish = send(port, http::verb::post,
                                 "/upload/finish?sessionId=" + session_id + "&displayName=" + name +
                                     "&totalChunks=" + std::to_string(chunks.size()),
                                 {}, headers);
        assert(finish.result() == http::status::ok);
        return json_of(finish).at("finalName").get<std::string>();
    }

    void test_health()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_http_health";
        cleanup_path(root);
        {
            RunningServer server(make_config(root));
            const auto response = send(server.port(), http::verb::get, "/health");
            assert(response.result() == http::status::ok);
            assert(json_of(response).at("status") == "healthy");
            assert(send(server.port(), http::verb::post, "/health").result() == http::status::method_not_allowed);
        }
        cleanup_path(root);
    }

    void test_upload_and_range_download()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_http_e2e";
        cleanup_path(root);
        {
            RunningServer server(make_config(root));
            const auto port = server.port();

            const auto init = send(port, http::verb::post, "/upload/init");
            assert(init.result() == http::status::ok);
            const auto session_id = json_of(init).at("sessionId").get<std::string>();

            auto ack = send(port, http::verb::post, "/upload/chunk?sessionId=" + session_id + "&index=0", "abc");
            assert(ack.result() == http::status::ok);
            assert(json_of(ack).at("index") == 0);
            assert(json_of(ack).at("size") == 3);
            assert(json_of(ack).at("duplicate") == false);

            ack = send(port, http::verb::post, "/upload/chunk?sessionId=" + session_id + "&index=1", "def");
            assert(ack.result() == http::status::ok);
            ack = send(port, http::verb::post, "/upload/chunk?sessionId=" + session_id + "&index=1", "def");
            assert(json_of(ack).at("duplicate") == true);

            const auto status = send(port, http::verb::get, "/upload/status/" + session_id);
            assert(status.result() == http::status::ok);
            const auto status_json = json_of(status);
            assert(status_json.at("receivedIndices") == nlohmann::json::array({0, 1}));
            assert(status_json.at("totalChunks").is_null());
            const auto created_at = status_json.at("createdAt").get<std::string>();
            assert(created_at.size() == 20);
            assert(created_at[10] == 'T' && created_at.back() == 'Z');

            const auto finish = send(port, http::verb::post,
                                     "/upload/finish?sessionId=" + session_id + "&displayName=f.txt&totalChunks=2");
            assert(finish.result() == http::status::ok);
            const auto finish_json = json_of(finish);
            assert(finish_json.at("finalName") == "f.txt");
            assert(finish_json.at("artifactId") == "f.txt");
            assert(finish_json.at("originalName") == "f.txt");
            assert(finish_json.at("size") == 6);
            assert(finish_json.at("digestHex") == "bef57ec7f53a6d40beb640a780a639c83bc29ac8a9816f1fc6c5c6dcd93c4721");

            assert(send(port, http::verb::get, "/upload/status/" + session_id).result() == http::status::not_found);

            const auto partial = send(port, http::verb::get, "/download/f.txt", {}, {{http::field::range, "bytes=2-4"}});
            assert(partial.result() == http::status::partial_content);
            assert(partial.body() == "cde");
            assert(header(partial, http::field::content_range) == "bytes 2-4/6");
            assert(header(partial, http::field::content_length) == "3");

            const auto full = send(port, http::verb::get, "/download/f.txt");
            assert(full.result() == http::status::ok);
            assert(full.body() == "abcdef");
            assert(header(full, http::field::accept_ranges) == "bytes");
            assert(header(full, http::field::content_type) == "text/plain");
            assert(header(full, http::field::content_disposition) == "attachment; filename=\"f.txt\"");

            const auto head = send(port, http::verb::head, "/download/f.txt", {},
                                   {{http::field::want_digest, "sha-256"}});
            assert(head.result() == http::status::ok);
            assert(head.body().empty());
            assert(header(head, http::field::content_length) == "6");
            assert(header(head, http::field::accept_ranges) == "bytes");
            assert(header(head, http::field::digest) == "sha-256=vvV+x/U6bUC+tkCngKY5yDvCmsipgW8fxsXG3Nk8RyE=");

            const auto second = upload(port, {"xyz"}, "f.txt");
            assert(second != "f.txt");
            assert(send(port, http::verb::get, "/download/" + second).body() == "xyz");
            assert(send(port, http::verb::get, "/download/f.txt").body() == "abcdef");

            const auto spaced = upload(port, {"hello ", "world"}, "my%20file.txt");
            assert(spaced == "my file.txt");
            const auto spaced_download = send(port, http::verb::get, "/download/my%20file.txt");
            assert(spaced_download.body() == "hello world");
            assert(std::filesystem::exists(root / "storage" / "default" / "my file.txt"));
        }
        cleanup_path(root);
    }

    void test_error_responses()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_http_errors";
        cleanup_path(root);
        {
            RunningServer server(make_config(root));
            const auto port = server.port();
            upload(port, {"abcdef"}, "f.txt");

            const auto expect_error = [](const Response &response, http::status status, const char *label)
            {
                return response.result() == status && json_of(response).at("error") == label;
            };

            assert(expect_error(send(port, http::verb::post, "/upload/chunk?sessionId=nope&index=0", "x"),
                                http::status::not_found, "session_not_found"));
            assert(expect_error(send(port, http::verb::post, "/upload/chunk?index=0", "x"), http::status::bad_request,
                                "invalid_payload"));

            const auto session_id =
                json_of(send(port, http::verb::post, "/upload/init")).at("sessionId").get<std::string>();
            assert(expect_error(send(port, http::verb::post, "/upload/chunk?sessionId=" + session_id + "&index=abc", "x"),
                                http::status::bad_request, "invalid_payload"));
            assert(expect_error(send(port, http::verb::post, "/upload/chunk?sessionId=" + session_id + "&index=0", {},
                                     {}, 17),
                                http::status::bad_request, "chunk_too_large"));
            assert(json_of(send(port, http::verb::get, "/upload/status/" + session_id)).at("receivedIndices").empty());

            send(port, http::verb::post, "/upload/chunk?sessionId=" + session_id + "&index=1", "b");
            const auto incomplete = send(port, http::verb::post,
                                         "/upload/finish?sessionId=" + session_id + "&displayName=g.txt&totalChunks=3");
            assert(expect_error(incomplete, http::status::bad_request, "incomplete_upload"));
            assert(json_of(incomplete).at("missing") == nlohmann::json::array({0, 2}));

            const auto range = [port](const char *value)
            { return send(port, http::verb::get, "/download/f.txt", {}, {{http::field::range, value}}); };
            assert(expect_error(range("bytes=abc"), http::status::bad_request, "range_bad_syntax"));
            const auto unsatisfiable = range("bytes=10-");
            assert(expect_error(unsatisfiable, http::status::range_not_satisfiable, "range_not_satisfiable"));
            assert(header(unsatisfiable, http::field::content_range) == "bytes */6");
            assert(expect_error(range("bytes=0-1,3-4"), http::status::range_not_satisfiable, "range_unsupported"));

            assert(expect_error(send(port, http::verb::get, "/download/missing.bin"), http::status::not_found,
                                "not_found"));
            const auto head_missing = send(port, http::verb::head, "/download/missing.bin");
            assert(head_missing.result() == http::status::not_found);
            assert(head_missing.body().empty());
            assert(expect_error(send(port, http::verb::get, "/nowhere"), http::status::not_found, "invalid_command"));
            assert(expect_error(send(port, http::verb::get, "/upload/init"), http::status::method_not_allowed,
                                "method_not_allowed"));
            assert(expect_error(send(port, http::verb::post, "/upload/init", {}, {}, 70 * 1024),
                                http::status::payload_too_large, "payload_too_large"));
        }
        cleanup_path(root);
    }

    void test_hostile_bytes_in_requests()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_http_hostile";
        cleanup_path(root);
        {
            RunningServer server(make_config(root));
            const auto port = server.port();
            upload(port, {"abcdef"}, "f.txt");

            // Decoded bytes that are not UTF-8 end up in error messages.
            const auto status = send(port, http::verb::get, "/upload/status/%FF");
            assert(status.result() == http::status::not_found);
            assert(json_of(status).at("error") == "session_not_found");
            const auto unknown = send(port, http::verb::get, "/%FF");
            assert(unknown.result() == http::status::not_found);
            assert(json_of(unknown).at("error") == "invalid_command");
            assert(send(port, http::verb::post, "/upload/chunk?sessionId=%FE%FF&index=0", "x").result() ==
                   http::status::not_found);
            assert(send(port, http::verb::get, "/health").result() == http::status::ok);

            // A Latin-1 display name is refused up front; the session can still finish.
            const auto session_id =
                json_of(send(port, http::verb::post, "/upload/init")).at("sessionId").get<std::string>();
            send(port, http::verb::post, "/upload/chunk?sessionId=" + session_id + "&index=0", "caf");
            const auto latin1 = send(port, http::verb::post,
                                     "/upload/finish?sessionId=" + session_id + "&displayName=caf%E9.txt&totalChunks=1");
            assert(latin1.result() == http::status::bad_request);
            assert(json_of(latin1).at("error") == "invalid_payload");
            const auto retried = send(port, http::verb::post,
                                      "/upload/finish?sessionId=" + session_id +
                                          "&displayName=caf%C3%A9.txt&totalChunks=1");
            assert(retried.result() == http::status::ok);
            assert(json_of(retried).at("finalName") == "caf\xC3\xA9.txt");
            assert(send(port, http::verb::get, "/download/caf%C3%A9.txt").body() == "caf");

            // An embedded NUL must not reach the OS and truncate to f.txt.
            const auto nul = send(port, http::verb::get, "/download/f.txt%00junk");
            assert(nul.result() == http::status::bad_request);
            assert(json_of(nul).at("error") == "invalid_payload");

            assert(send(port, http::verb::get, "/health").result() == http::status::ok);
        }
        cleanup_path(root);
    }

    void test_token_tenants()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkdrive_http_tenants";
        cleanup_path(root);
        std::filesystem::create_directories(root);
        {
            std::ofstream out(root / "tokens.json");
            out << R"({"tokens": {"alice-token": "alice", "bob-token": "bob"}})";
        }
        {
            auto config = make_config(root / "data");
            config.tokens_file = root / "tokens.json";
            RunningServer server(std::move(config));
            const auto port = server.port();
            const Headers alice{{http::field::authorization, "Bearer alice-token"}};
            const Headers bob{{http::field::authorization, "Bearer bob-token"}};

            assert(send(port, http::verb::get, "/health").result() == http::status::ok);
            assert(send(port, http::verb::post, "/upload/init").result() == http::status::unauthorized);
            assert(send(port, http::verb::post, "/upload/init", {}, {{http::field::authorization, "Bearer nope"}})
                       .result() == http::status::unauthorized);

            const auto init = send(port, http::verb::post, "/upload/init", {}, alice);
            const auto session_id = json_of(init).at("sessionId").get<std::string>();
            assert(send(port, http::verb::get, "/upload/status/" + session_id, {}, bob).result() ==
                   http::status::not_found);
            assert(send(port, http::verb::get, "/upload/status/" + session_id, {}, alice).result() == http::status::ok);

            const auto name = upload(port, {"secret"}, "notes.txt", alice);
            assert(std::filesystem::exists(root / "data" / "storage" / "alice" / name));
            assert(send(port, http::verb::get, "/download/" + name, {}, alice).body() == "secret");
            assert(send(port, http::verb::get, "/download/" + name, {}, bob).result() == http::status::not_found);
        }
        cleanup_path(root);
    }

} // namespace

void run_http_endpoint_tests()
{
    test_health();
    test_upload_and_range_download();
    test_error_responses();
    test_hostile_bytes_in_requests();
    test_token_tenants();
}
