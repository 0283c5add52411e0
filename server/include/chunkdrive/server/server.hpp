#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/filesystem.hpp"
#include "chunkdrive/server/range_server.hpp"
#include "chunkdrive/server/tenant_resolver.hpp"
#include "chunkdrive/server/upload_registry.hpp"

namespace chunkdrive::server
{

    class Session;

    class Server
    {
    public:
        // Binds immediately; port 0 picks an ephemeral port.
        explicit Server(ServerConfig config);

        // Runs the event loop on the worker pool until stopped.
        void run();

        // Safe to call from any thread.
        void stop();

        std::uint16_t port() const noexcept { return bound_port_; }

    private:
        void accept_next();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
        void schedule_sweep();
        void handle_signal();

        ServerConfig config_;
        std::uint16_t bound_port_{0};
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;
        boost::asio::steady_timer sweep_timer_;

        Filesystem filesystem_;
        UploadRegistry uploads_;
        RangeServer range_server_;
        std::unique_ptr<TenantResolver> tenants_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkdrive::server
