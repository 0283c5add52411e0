/**
 * ChunkDrive - JSON bodies exchanged on the upload and download endpoints.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::protocol
{

    struct InitUploadResponse
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const InitUploadResponse &response);
    void from_json(const nlohmann::json &json, InitUploadResponse &response);

    struct ChunkAck
    {
        std::string session_id;
        std::uint64_t index{};
        std::uint64_t size{};
        bool duplicate{};
    };

    void to_json(nlohmann::json &json, const ChunkAck &ack);
    void from_json(const nlohmann::json &json, ChunkAck &ack);

    struct FinishUploadResponse
    {
        std::string artifact_id;
        std::string final_name;
        std::string original_name;
        std::uint64_t size{};
        std::string digest_hex;
    };

    void to_json(nlohmann::json &json, const FinishUploadResponse &response);
    void from_json(const nlohmann::json &json, FinishUploadResponse &response);

    struct UploadStatusResponse
    {
        std::string session_id;
        std::vector<std::uint64_t> received_indices;
        std::string created_at;
        std::optional<std::uint64_t> total_chunks{};
        bool finalizing{};
    };

    void to_json(nlohmann::json &json, const UploadStatusResponse &response);
    void from_json(const nlohmann::json &json, UploadStatusResponse &response);

    struct ErrorBody
    {
        ErrorCode error{ErrorCode::InternalError};
        std::string message;
        std::vector<std::uint64_t> missing;
        std::vector<std::uint64_t> surplus;
    };

    void to_json(nlohmann::json &json, const ErrorBody &body);
    void from_json(const nlohmann::json &json, ErrorBody &body);

} // namespace chunkdrive::protocol
