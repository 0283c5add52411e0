#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::server
{

    // Base for every failure a request handler reports back to the client.
    class ServerError : public std::runtime_error
    {
    public:
        ServerError(chunkdrive::ErrorCode code, std::string message);

        chunkdrive::ErrorCode code() const noexcept { return code_; }

    private:
        chunkdrive::ErrorCode code_;
    };

    class FilesystemError : public ServerError
    {
    public:
        using ServerError::ServerError;
    };

    class UploadError : public ServerError
    {
    public:
        using ServerError::ServerError;

        static UploadError incomplete(std::vector<std::uint64_t> missing, std::vector<std::uint64_t> surplus);

        const std::vector<std::uint64_t> &missing() const noexcept { return missing_; }
        const std::vector<std::uint64_t> &surplus() const noexcept { return surplus_; }

    private:
        std::vector<std::uint64_t> missing_;
        std::vector<std::uint64_t> surplus_;
    };

    class RangeError : public ServerError
    {
    public:
        RangeError(chunkdrive::ErrorCode code, std::string message, std::uint64_t artifact_length);

        std::uint64_t artifact_length() const noexcept { return artifact_length_; }

    private:
        std::uint64_t artifact_length_{};
    };

} // namespace chunkdrive::server
