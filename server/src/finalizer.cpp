#include "chunkdrive/server/finalizer.hpp"

#include <ctime>
#include <fstream>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/errors.hpp"
#include "chunkdrive/server/filesystem.hpp"

namespace chunkdrive::server
{

    namespace
    {

        constexpr std::size_t kCopyBufferSize = 64 * 1024;
        constexpr std::uint64_t kMaxNameAttempts = 10000;

        std::string format_stamp(std::chrono::system_clock::time_point when)
        {
            const auto seconds = std::chrono::system_clock::to_time_t(when);
            std::tm local{};
            localtime_r(&seconds, &local);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
            return buffer;
        }

        [[noreturn]] void merge_failed(const std::string &message)
        {
            throw UploadError(chunkdrive::ErrorCode::MergeFailed, message);
        }

        bool link_unsupported(const std::error_code &ec)
        {
            return ec == std::errc::operation_not_permitted || ec == std::errc::operation_not_supported ||
                   ec == std::errc::cross_device_link || ec == std::errc::function_not_supported;
        }

    } // namespace

    Finalizer::Finalizer(std::filesystem::path storage_root, Clock clock)
        : storage_root_(std::move(storage_root)), clock_(std::move(clock)) {}

    FinalizedArtifact Finalizer::merge(const ChunkStore &chunks, std::uint64_t total_chunks,
                                       const std::string &display_name) const
    {
        if (!is_plain_file_name(display_name))
        {
            throw UploadError(chunkdrive::ErrorCode::InvalidPayload, "Invalid display name: " + display_name);
        }

        const auto merged = chunks.merge_path();
        FinalizedArtifact artifact{};
        try
        {
            artifact.size_bytes = write_merged(chunks, total_chunks, merged, artifact.digest_hex);
            artifact.final_path = publish(merged, display_name, artifact.final_name);
        }
        catch (...)
        {
            std::error_code ec;
            std::filesystem::remove(merged, ec);
            throw;
        }

        std::error_code ec;
        std::filesystem::remove(merged, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove merge output {}: {}", merged.string(), ec.message());
        }
        return artifact;
    }

    std::string Finalizer::disambiguated_name(const std::string &display_name,
                                              std::chrono::system_clock::time_point when, std::uint64_t counter)
    {
        const auto suffix = "_" + format_stamp(when) + "_" + std::to_string(counter);
        const auto dot = display_name.rfind('.');
        if (dot == std::string::npos)
        {
            return display_name + suffix;
        }
        return display_name.substr(0, dot) + suffix + display_name.substr(dot);
    }

    std::uint64_t Finalizer::write_merged(const ChunkStore &chunks, std::uint64_t total_chunks,
                                          const std::filesystem::path &output, std::string &digest_hex) const
    {
        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            merge_failed("Failed to open merge output: " + output.string());
        }

        crypto::Sha256Stream hasher;
        std::vector<char> buffer(kCopyBufferSize);
        std::uint64_t total_bytes = 0;

        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            const auto chunk_path = chunks.chunk_path(index);
            std::ifstream in(chunk_path, std::ios::binary);
            if (!in.is_open())
            {
                merge_failed("Failed to open chunk " + std::to_string(index));
            }
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = static_cast<std::size_t>(in.gcount());
                if (count == 0)
                {
                    break;
                }
                hasher.update(std::as_bytes(std::span<const char>(buffer.data(), count)));
                out.write(buffer.data(), static_cast<std::streamsize>(count));
                if (!out)
                {
                    merge_failed("Failed to write merge output: " + output.string());
                }
                total_bytes += count;
            }
            if (in.bad())
            {
                merge_failed("Failed to read chunk " + std::to_string(index));
            }
            spdlog::debug("Merged chunk {}/{} into {}", index + 1, total_chunks, output.string());
        }

        out.flush();
        out.close();
        if (!out)
        {
            merge_failed("Failed to flush merge output: " + output.string());
        }

        const auto digest = hasher.finish();
        digest_hex = crypto::to_hex(digest);
        return total_bytes;
    }

    std::filesystem::path Finalizer::publish(const std::filesystem::path &merged, const std::string &display_name,
                                             std::string &final_name) const
    {
        std::error_code ec;
        std::filesystem::create_directories(storage_root_, ec);
        if (ec)
        {
            merge_failed("Failed to create storage root: " + ec.message());
        }

        std::string candidate = display_name;
        std::optional<std::chrono::system_clock::time_point> stamp;
        for (std::uint64_t counter = 1; counter <= kMaxNameAttempts; ++counter)
        {
            const auto target = storage_root_ / candidate;
            std::filesystem::create_hard_link(merged, target, ec);
            if (!ec)
            {
                final_name = candidate;
                return target;
            }
            if (link_unsupported(ec))
            {
                // Fallback for filesystems without hard links; not race free.
                if (!std::filesystem::exists(target))
                {
                    std::filesystem::rename(merged, target, ec);
                    if (ec)
                    {
                        merge_failed("Failed to publish artifact: " + ec.message());
                    }
                    final_name = candidate;
                    return target;
                }
            }
            else if (ec != std::errc::file_exists)
            {
                merge_failed("Failed to publish artifact: " + ec.message());
            }

            if (!stamp)
            {
                stamp = clock_();
            }
            candidate = disambiguated_name(display_name, *stamp, counter);
        }
        merge_failed("No free name for " + display_name);
    }

} // namespace chunkdrive::server
