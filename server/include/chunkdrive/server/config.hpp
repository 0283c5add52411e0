#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chunkdrive::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::size_t max_chunk_size{4 * 1024 * 1024};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{60}};
        std::size_t stream_buffer_size{64 * 1024};
        std::optional<std::filesystem::path> tokens_file;
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        bool show_help{false};
    };

    // Throws std::runtime_error describing the first offending argument.
    ServerConfig parse_arguments(int argc, const char *const argv[]);

    std::string usage(std::string_view program_name);

} // namespace chunkdrive::server
