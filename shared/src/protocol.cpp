#include "chunkdrive/protocol.hpp"

#include <stdexcept>

namespace chunkdrive::protocol
{

    void to_json(nlohmann::json &json, const InitUploadResponse &response)
    {
        json = {{"sessionId", response.session_id}};
    }

    void from_json(const nlohmann::json &json, InitUploadResponse &response)
    {
        response.session_id = json.at("sessionId").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ChunkAck &ack)
    {
        json = {
            {"sessionId", ack.session_id},
            {"index", ack.index},
            {"size", ack.size},
            {"duplicate", ack.duplicate},
        };
    }

    void from_json(const nlohmann::json &json, ChunkAck &ack)
    {
        ack.session_id = json.at("sessionId").get<std::string>();
        ack.index = json.at("index").get<std::uint64_t>();
        ack.size = json.value("size", 0ULL);
        ack.duplicate = json.value("duplicate", false);
    }

    void to_json(nlohmann::json &json, const FinishUploadResponse &response)
    {
        json = {
            {"artifactId", response.artifact_id},
            {"finalName", response.final_name},
            {"originalName", response.original_name},
            {"size", response.size},
            {"digestHex", response.digest_hex},
        };
    }

    void from_json(const nlohmann::json &json, FinishUploadResponse &response)
    {
        response.artifact_id = json.at("artifactId").get<std::string>();
        response.final_name = json.at("finalName").get<std::string>();
        response.original_name = json.value("originalName", std::string{});
        response.size = json.value("size", 0ULL);
        response.digest_hex = json.at("digestHex").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadStatusResponse &response)
    {
        json = {
            {"sessionId", response.session_id},
            {"receivedIndices", response.received_indices},
            {"createdAt", response.created_at},
            {"finalizing", response.finalizing},
        };
        if (response.total_chunks)
        {
            json["totalChunks"] = *response.total_chunks;
        }
        else
        {
            json["totalChunks"] = nullptr;
        }
    }

    void from_json(const nlohmann::json &json, UploadStatusResponse &response)
    {
        response.session_id = json.at("sessionId").get<std::string>();
        response.received_indices = json.value("receivedIndices", std::vector<std::uint64_t>{});
        response.created_at = json.value("createdAt", std::string{});
        response.finalizing = json.value("finalizing", false);
        if (auto it = json.find("totalChunks"); it != json.end() && !it->is_null())
        {
            response.total_chunks = it->get<std::uint64_t>();
        }
        else
        {
            response.total_chunks.reset();
        }
    }

    void to_json(nlohmann::json &json, const ErrorBody &body)
    {
        json = {
            {"error", std::string(to_string(body.error))},
            {"message", body.message},
        };
        if (body.error == ErrorCode::IncompleteUpload)
        {
            json["missing"] = body.missing;
            json["surplus"] = body.surplus;
        }
    }

    void from_json(const nlohmann::json &json, ErrorBody &body)
    {
        const auto label = json.at("error").get<std::string>();
        auto code = error_code_from_string(label);
        if (!code)
        {
            throw std::runtime_error("Unknown error code: " + label);
        }
        body.error = *code;
        body.message = json.value("message", std::string{});
        body.missing = json.value("missing", std::vector<std::uint64_t>{});
        body.surplus = json.value("surplus", std::vector<std::uint64_t>{});
    }

} // namespace chunkdrive::protocol
