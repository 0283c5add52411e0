#include "chunkdrive/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkdrive/server/session.hpp"

namespace chunkdrive::server
{

    namespace net = boost::asio;

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          sweep_timer_(io_context_),
          filesystem_(config_.root),
          uploads_(filesystem_.uploads_root(), config_.max_chunk_size),
          range_server_(config_.stream_buffer_size),
          tenants_(make_tenant_resolver(config_))
    {
        const auto address = net::ip::make_address(config_.address);
        const net::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        bound_port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_sweep();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void Server::stop()
    {
        net::post(io_context_, [this]
                  {
                      boost::system::error_code ec;
                      acceptor_.close(ec);
                      sweep_timer_.cancel();
                      signals_.cancel(ec);
                      io_context_.stop(); });
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(net::make_strand(io_context_),
                               [this](const boost::system::error_code &ec, net::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(boost::system::error_code ec, net::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{filesystem_, uploads_, range_server_, *tenants_, config_.upload_timeout};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
        }
        if (!ec || ec == net::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_sweep()
    {
        sweep_timer_.expires_after(config_.sweep_interval);
        sweep_timer_.async_wait([this](const boost::system::error_code &ec)
                                {
                                    if (ec)
                                    {
                                        return;
                                    }
                                    try
                                    {
                                        const auto reaped = uploads_.reap_idle(config_.upload_timeout);
                                        if (reaped > 0)
                                        {
                                            spdlog::info("Expired {} idle upload session(s)", reaped);
                                        }
                                    }
                                    catch (const std::exception &ex)
                                    {
                                        spdlog::error("Upload sweep failed: {}", ex.what());
                                    }
                                    schedule_sweep(); });
    }

    void Server::handle_signal()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkdrive::server
