#include "chunkdrive/server/session.hpp"

#include <span>

#include <spdlog/spdlog.h>

#include "chunkdrive/server/finalizer.hpp"
#include "session_common.hpp"

namespace chunkdrive::server
{

    namespace http = boost::beast::http;

    void Session::handle_upload_init(const Request & /*request*/)
    {
        const auto reaped = services_.uploads.reap_idle(services_.upload_timeout);
        if (reaped > 0)
        {
            spdlog::info("Expired {} idle upload session(s)", reaped);
        }

        const chunkdrive::protocol::InitUploadResponse response{
            .session_id = services_.uploads.init_upload(tenant_),
        };
        send_response(session_common::make_json_response(http::status::ok, version_, keep_alive_,
                                                         nlohmann::json(response)));
    }

    void Session::handle_upload_chunk(const Request &request, const session_common::Target &target)
    {
        const auto &session_id = target.require("sessionId");
        const auto index = target.require_unsigned("index");
        const auto &body = request.body();
        const std::span<const std::byte> data(reinterpret_cast<const std::byte *>(body.data()), body.size());

        const auto receipt = services_.uploads.put_chunk(tenant_, session_id, index, data);
        const chunkdrive::protocol::ChunkAck ack{
            .session_id = session_id,
            .index = receipt.index,
            .size = receipt.size,
            .duplicate = receipt.duplicate,
        };
        send_response(session_common::make_json_response(http::status::ok, version_, keep_alive_,
                                                         nlohmann::json(ack)));
    }

    void Session::handle_upload_finish(const Request & /*request*/, const session_common::Target &target)
    {
        const auto &session_id = target.require("sessionId");
        const auto &display_name = target.require("displayName");
        const auto total_chunks = target.require_unsigned("totalChunks");

        const auto paths = services_.filesystem.prepare_tenant_paths(tenant_);
        const Finalizer finalizer(paths.root);
        const auto artifact =
            services_.uploads.finish_upload(tenant_, session_id, display_name, total_chunks, finalizer);

        const chunkdrive::protocol::FinishUploadResponse response{
            .artifact_id = artifact.final_name,
            .final_name = artifact.final_name,
            .original_name = display_name,
            .size = artifact.size_bytes,
            .digest_hex = artifact.digest_hex,
        };
        send_response(session_common::make_json_response(http::status::ok, version_, keep_alive_,
                                                         nlohmann::json(response)));
    }

    void Session::handle_upload_status(const Request & /*request*/, const std::string &session_id)
    {
        const auto status = services_.uploads.query_status(tenant_, session_id);
        const chunkdrive::protocol::UploadStatusResponse response{
            .session_id = status.session_id,
            .received_indices = status.received,
            .created_at = session_common::format_utc(status.created_at),
            .total_chunks = status.declared_total,
            .finalizing = status.finalizing,
        };
        send_response(session_common::make_json_response(http::status::ok, version_, keep_alive_,
                                                         nlohmann::json(response)));
    }

} // namespace chunkdrive::server
