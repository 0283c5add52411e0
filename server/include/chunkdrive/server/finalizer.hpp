#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "chunkdrive/server/chunk_store.hpp"

namespace chunkdrive::server
{

    struct FinalizedArtifact
    {
        std::filesystem::path final_path;
        std::string final_name;
        std::uint64_t size_bytes{};
        std::string digest_hex;
    };

    // Merges a complete chunk set into the tenant's storage root, hashing the
    // bytes in the same pass. The output never appears under its final name
    // until it is complete, and an existing artifact is never overwritten.
    class Finalizer
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        explicit Finalizer(std::filesystem::path storage_root, Clock clock = &std::chrono::system_clock::now);

        // Throws UploadError with MergeFailed on any read or write failure.
        FinalizedArtifact merge(const ChunkStore &chunks, std::uint64_t total_chunks,
                                const std::string &display_name) const;

        // `<base>_<YYYYmmdd_HHMMSS>_<counter>.<ext>`, or without `.<ext>` when
        // the name carries no extension.
        static std::string disambiguated_name(const std::string &display_name,
                                              std::chrono::system_clock::time_point when, std::uint64_t counter);


    private:
        std::uint64_t write_merged(const ChunkStore &chunks, std::uint64_t total_chunks,
                                   const std::filesystem::path &output, std::string &digest_hex) const;
        std::filesystem::path publish(const std::filesystem::path &merged, const std::string &display_name,
                                      std::string &final_name) const;

        std::filesystem::path storage_root_;
        Clock clock_;
    };

} // namespace chunkdrive::server
