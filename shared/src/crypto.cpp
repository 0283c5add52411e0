#include "chunkdrive/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace chunkdrive::crypto
{

    namespace
    {

        constexpr std::size_t kReadBufferSize = 64 * 1024;

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        Sha256Digest digest_stream(std::istream &input)
        {
            Sha256Stream hasher;
            std::vector<std::byte> buffer(kReadBufferSize);
            while (input)
            {
                input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                const auto read_count = static_cast<std::size_t>(input.gcount());
                if (read_count > 0)
                {
                    hasher.update(std::span<const std::byte>(buffer.data(), read_count));
                }
            }
            if (input.bad())
            {
                throw std::runtime_error("Read error while hashing stream");
            }
            return hasher.finish();
        }

    } // namespace

    Sha256Stream::Sha256Stream()
    {
        ensure_initialized_once();
        if (crypto_hash_sha256_init(&state_) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_init failed");
        }
    }

    void Sha256Stream::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("Sha256Stream updated after finish");
        }
        if (crypto_hash_sha256_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_update failed");
        }
    }

    Sha256Digest Sha256Stream::finish()
    {
        if (finished_)
        {
            throw std::logic_error("Sha256Stream finished twice");
        }
        Sha256Digest digest{};
        if (crypto_hash_sha256_final(&state_, reinterpret_cast<unsigned char *>(digest.data())) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256_final failed");
        }
        finished_ = true;
        return digest;
    }

    std::string to_hex(std::span<const std::byte> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = static_cast<unsigned char>(data[i]);
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        Sha256Stream hasher;
        hasher.update(data);
        const auto digest = hasher.finish();
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        const auto digest = digest_stream(input);
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        const auto digest = digest_file(path);
        return to_hex(digest);
    }

    Sha256Digest digest_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return digest_stream(file);
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_initialized_once();
        std::vector<std::byte> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

} // namespace chunkdrive::crypto
