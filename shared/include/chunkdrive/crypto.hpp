/**
 * ChunkDrive - Content digests and random identifiers built on libsodium.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

#include <sodium.h>

namespace chunkdrive::crypto
{

    using Sha256Digest = std::array<std::byte, crypto_hash_sha256_BYTES>;

    // Incremental SHA-256 over a byte stream that arrives in pieces.
    class Sha256Stream
    {
    public:
        Sha256Stream();

        void update(std::span<const std::byte> data);

        // Completes the digest; the stream must not be updated afterwards.
        Sha256Digest finish();

    private:
        crypto_hash_sha256_state state_{};
        bool finished_{false};
    };

    std::string to_hex(std::span<const std::byte> data);

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    Sha256Digest digest_file(const std::filesystem::path &path);

    // Hex encoding of `byte_count` bytes from the libsodium CSPRNG.
    std::string random_hex(std::size_t byte_count);

} // namespace chunkdrive::crypto
