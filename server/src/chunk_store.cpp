#include "chunkdrive/server/chunk_store.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kChunkPrefix = "chunk_";
        constexpr auto kMergeFile = "merged.partial";
        constexpr int kIndexWidth = 8;
    } // namespace

    ChunkStore::ChunkStore(std::filesystem::path directory) : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
    }

    std::string ChunkStore::chunk_file_name(std::uint64_t index)
    {
        char digits[32];
        std::snprintf(digits, sizeof(digits), "%0*llu", kIndexWidth, static_cast<unsigned long long>(index));
        return std::string(kChunkPrefix) + digits;
    }

    std::filesystem::path ChunkStore::chunk_path(std::uint64_t index) const
    {
        return directory_ / chunk_file_name(index);
    }

    void ChunkStore::write_chunk(std::uint64_t index, std::span<const std::byte> data) const
    {
        const auto final_path = chunk_path(index);
        auto temp_path = final_path;
        temp_path += "." + crypto::random_hex(4) + ".tmp";

        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
            {
                throw std::runtime_error("Failed to open chunk file: " + temp_path.string());
            }
            file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file)
            {
                file.close();
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                throw std::runtime_error("Failed to write chunk file: " + temp_path.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw std::runtime_error("Failed to store chunk " + std::to_string(index) + ": " + ec.message());
        }
    }

    std::filesystem::path ChunkStore::merge_path() const
    {
        return directory_ / kMergeFile;
    }

    bool ChunkStore::destroy() const noexcept
    {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
        return !ec;
    }

} // namespace chunkdrive::server
