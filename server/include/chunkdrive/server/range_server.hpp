#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chunkdrive/server/range_planner.hpp"

namespace chunkdrive::server
{

    struct ArtifactMetadata
    {
        std::filesystem::path path;
        std::string name;
        std::uint64_t length{};
        std::string content_type;
    };

    // Status line and headers of a download response, independent of the
    // HTTP library that writes them.
    struct ResponseFraming
    {
        unsigned status{200};
        std::uint64_t content_length{};
        std::uint64_t total_length{};
        std::optional<std::string> content_range;
        std::string content_type;
        std::string content_disposition;
        std::optional<std::string> digest;
    };

    // Reads a fixed window of a file in pieces of at most `buffer_size` bytes.
    class ArtifactStream
    {
    public:
        ArtifactStream(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t count,
                       std::size_t buffer_size);

        // Next piece of the window; empty once the window is exhausted.
        std::span<const std::byte> next();

        bool done() const noexcept { return remaining_ == 0; }

        std::uint64_t remaining() const noexcept { return remaining_; }

    private:
        std::ifstream file_;
        std::uint64_t remaining_{};
        std::vector<std::byte> buffer_;
    };

    struct DownloadResponse
    {
        ResponseFraming framing;
        std::unique_ptr<ArtifactStream> body;
    };

    class RangeServer
    {
    public:
        explicit RangeServer(std::size_t buffer_size);

        // Throws FilesystemError(NotFound) when the artifact vanished.
        ArtifactMetadata inspect(const std::filesystem::path &path) const;

        ResponseFraming head(const ArtifactMetadata &artifact, bool want_digest) const;

        // Throws RangeError for a rejected plan.
        DownloadResponse get(const ArtifactMetadata &artifact, const RangePlan &plan, bool want_digest) const;

        static std::string content_disposition(const std::string &name);

        static std::string guess_content_type(const std::filesystem::path &path);


    private:
        ResponseFraming base_framing(const ArtifactMetadata &artifact, bool want_digest) const;

        std::size_t buffer_size_;
    };

} // namespace chunkdrive::server
