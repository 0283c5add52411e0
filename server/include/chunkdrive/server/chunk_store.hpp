#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace chunkdrive::server
{

    // Scratch directory holding the chunks of one upload session. Chunk files
    // are named by zero-padded index so a lexical sort is also the merge order.
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path directory);

        const std::filesystem::path &directory() const noexcept { return directory_; }

        static std::string chunk_file_name(std::uint64_t index);

        std::filesystem::path chunk_path(std::uint64_t index) const;

        // Written under a temporary name and renamed into place, so a chunk
        // file is either absent or complete.
        void write_chunk(std::uint64_t index, std::span<const std::byte> data) const;

        // Location the finalizer merges into before publishing.
        std::filesystem::path merge_path() const;

        // Removes the directory and everything in it. Returns false on failure.
        bool destroy() const noexcept;

    private:
        std::filesystem::path directory_;
    };

} // namespace chunkdrive::server
