#include "chunkdrive/server/config.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>

namespace chunkdrive::server
{

    namespace
    {

        constexpr std::string_view kLogLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

        std::string require_value(int &index, int argc, const char *const argv[], std::string_view flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + std::string(flag));
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t parse_number(const std::string &value, std::string_view flag, std::uint64_t min_value,
                                   std::uint64_t max_value)
        {
            std::uint64_t result{};
            const auto *begin = value.data();
            const auto *end = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(begin, end, result);
            if (value.empty() || ec != std::errc{} || ptr != end)
            {
                throw std::runtime_error("Invalid numeric value for " + std::string(flag) + ": " + value);
            }
            if (result < min_value || result > max_value)
            {
                throw std::runtime_error("Value out of range for " + std::string(flag) + ": " + value);
            }
            return result;
        }

        bool is_known_log_level(std::string_view level)
        {
            for (const auto known : kLogLevels)
            {
                if (known == level)
                {
                    return true;
                }
            }
            return false;
        }

    } // namespace

    ServerConfig parse_arguments(int argc, const char *const argv[])
    {
        ServerConfig config;
        bool port_given = false;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(parse_number(require_value(i, argc, argv, arg), arg, 1, 65535));
                port_given = true;
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_number(require_value(i, argc, argv, arg), arg, 1, 1024));
            }
            else if (arg == "--max-chunk-size")
            {
                config.max_chunk_size = static_cast<std::size_t>(
                    parse_number(require_value(i, argc, argv, arg), arg, 1, std::numeric_limits<std::uint32_t>::max()));
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = std::chrono::seconds(
                    parse_number(require_value(i, argc, argv, arg), arg, 1, std::numeric_limits<std::uint32_t>::max()));
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = std::chrono::seconds(
                    parse_number(require_value(i, argc, argv, arg), arg, 1, std::numeric_limits<std::uint32_t>::max()));
            }
            else if (arg == "--stream-buffer")
            {
                config.stream_buffer_size = static_cast<std::size_t>(
                    parse_number(require_value(i, argc, argv, arg), arg, 512, 16 * 1024 * 1024));
            }
            else if (arg == "--tokens")
            {
                config.tokens_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                config.log_level = require_value(i, argc, argv, arg);
                if (!is_known_log_level(config.log_level))
                {
                    throw std::runtime_error("Unknown log level: " + config.log_level);
                }
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (!port_given)
        {
            throw std::runtime_error("--port is required");
        }
        if (config.root.empty())
        {
            throw std::runtime_error("--root is required");
        }
        return config;
    }

    std::string usage(std::string_view program_name)
    {
        return "Usage: " + std::string(program_name) +
               " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>]\n"
               "       [--max-chunk-size <bytes>] [--upload-timeout <seconds>] [--sweep-interval <seconds>]\n"
               "       [--stream-buffer <bytes>] [--tokens <FILE>] [--log <FILE>] [--log-level <LEVEL>]\n";
    }

} // namespace chunkdrive::server
