#include "chunkdrive/server/upload_registry.hpp"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/errors.hpp"
#include "chunkdrive/server/filesystem.hpp"

namespace chunkdrive::server
{

    namespace
    {

        constexpr std::size_t kSessionIdBytes = 16;

        [[noreturn]] void session_not_found(const std::string &session_id)
        {
            throw UploadError(chunkdrive::ErrorCode::SessionNotFound, "Upload session not found: " + session_id);
        }

    } // namespace

    UploadRegistry::UploadRegistry(std::filesystem::path scratch_root, std::size_t max_chunk_size,
                                   std::unique_ptr<SessionStore> store)
        : scratch_root_(std::move(scratch_root)), max_chunk_size_(max_chunk_size), store_(std::move(store))
    {
        std::filesystem::create_directories(scratch_root_);
    }

    std::string UploadRegistry::init_upload(const std::string &tenant)
    {
        const auto now = std::chrono::system_clock::now();
        for (;;)
        {
            const auto id = generate_session_id();
            const auto directory = scratch_root_ / id;
            if (std::filesystem::exists(directory))
            {
                continue;
            }

            UploadSession session{};
            session.id = id;
            session.tenant = tenant;
            session.created_at = now;
            session.last_activity = now;

            auto entry = std::make_shared<SessionEntry>(std::move(session), ChunkStore(directory));
            if (!store_->insert(entry))
            {
                continue;
            }
            spdlog::info("Upload initialized: session={} tenant={}", id, tenant);
            return id;
        }
    }

    ChunkReceipt UploadRegistry::put_chunk(const std::string &tenant, const std::string &session_id,
                                           std::uint64_t index, std::span<const std::byte> data)
    {
        auto entry = lookup(tenant, session_id);
        if (data.size() > max_chunk_size_)
        {
            throw UploadError(chunkdrive::ErrorCode::ChunkTooLarge,
                              "Chunk size exceeds limit (" + std::to_string(max_chunk_size_) + " bytes)");
        }
        if (index >= kMaxChunkCount)
        {
            throw UploadError(chunkdrive::ErrorCode::InvalidPayload, "Chunk index out of range");
        }

        {
            std::unique_lock lock(entry->mutex);
            entry->chunk_settled.wait(lock, [&]
                                      { return entry->in_flight.count(index) == 0; });
            auto &session = entry->session;
            if (session.state == SessionState::Closed)
            {
                session_not_found(session_id);
            }
            if (session.received.count(index) != 0)
            {
                session.last_activity = std::chrono::system_clock::now();
                spdlog::info("Chunk already uploaded, skipped: session={} chunk={}", session_id, index);
                return {.index = index, .size = data.size(), .duplicate = true};
            }
            if (session.state == SessionState::Finalizing)
            {
                throw UploadError(chunkdrive::ErrorCode::Busy, "Upload is being finalized");
            }
            entry->in_flight.insert(index);
        }

        try
        {
            entry->chunks.write_chunk(index, data);
        }
        catch (const std::exception &ex)
        {
            {
                std::lock_guard lock(entry->mutex);
                entry->in_flight.erase(index);
            }
            entry->chunk_settled.notify_all();
            spdlog::error("Chunk write failed: session={} chunk={} error={}", session_id, index, ex.what());
            throw UploadError(chunkdrive::ErrorCode::InternalError, std::string("Failed to upload chunk: ") + ex.what());
        }

        {
            std::lock_guard lock(entry->mutex);
            entry->in_flight.erase(index);
            entry->session.received.insert(index);
            entry->session.last_activity = std::chrono::system_clock::now();
        }
        entry->chunk_settled.notify_all();
        spdlog::info("Chunk uploaded: session={} chunk={} bytes={}", session_id, index, data.size());
        return {.index = index, .size = data.size(), .duplicate = false};
    }

    UploadStatus UploadRegistry::query_status(const std::string &tenant, const std::string &session_id) const
    {
        auto entry = lookup(tenant, session_id);
        std::lock_guard lock(entry->mutex);
        const auto &session = entry->session;
        if (session.state == SessionState::Closed)
        {
            session_not_found(session_id);
        }
        return {
            .session_id = session.id,
            .received = std::vector<std::uint64_t>(session.received.begin(), session.received.end()),
            .created_at = session.created_at,
            .declared_total = session.declared_total,
            .finalizing = session.state == SessionState::Finalizing,
        };
    }

    FinalizedArtifact UploadRegistry::finish_upload(const std::string &tenant, const std::string &session_id,
                                                    const std::string &display_name, std::uint64_t declared_total,
                                                    const Finalizer &finalizer)
    {
        auto entry = lookup(tenant, session_id);
        if (!is_plain_file_name(display_name))
        {
            throw UploadError(chunkdrive::ErrorCode::InvalidPayload, "Invalid display name");
        }
        if (declared_total > kMaxChunkCount)
        {
            throw UploadError(chunkdrive::ErrorCode::InvalidPayload, "Total chunk count out of range");
        }

        {
            std::lock_guard lock(entry->mutex);
            auto &session = entry->session;
            if (session.state == SessionState::Closed)
            {
                session_not_found(session_id);
            }
            if (session.state == SessionState::Finalizing)
            {
                throw UploadError(chunkdrive::ErrorCode::Busy, "Upload is already being finalized");
            }
            if (!entry->in_flight.empty())
            {
                throw UploadError(chunkdrive::ErrorCode::Busy, "Chunks are still being written");
            }

            session.declared_total = declared_total;
            session.last_activity = std::chrono::system_clock::now();

            std::vector<std::uint64_t> missing;
            for (std::uint64_t index = 0; index < declared_total; ++index)
            {
                if (session.received.count(index) == 0)
                {
                    missing.push_back(index);
                }
            }
            std::vector<std::uint64_t> surplus(session.received.lower_bound(declared_total), session.received.end());
            if (!missing.empty() || !surplus.empty())
            {
                spdlog::warn("Upload incomplete: session={} missing={} surplus={}", session_id, missing.size(),
                             surplus.size());
                throw UploadError::incomplete(std::move(missing), std::move(surplus));
            }
            session.state = SessionState::Finalizing;
        }

        FinalizedArtifact artifact;
        try
        {
            artifact = finalizer.merge(entry->chunks, declared_total, display_name);
        }
        catch (const UploadError &ex)
        {
            reopen(*entry);
            spdlog::error("Merge failed: session={} error={}", session_id, ex.what());
            throw;
        }
        catch (const std::exception &ex)
        {
            reopen(*entry);
            spdlog::error("Merge failed: session={} error={}", session_id, ex.what());
            throw UploadError(chunkdrive::ErrorCode::MergeFailed, std::string("Failed to merge chunks: ") + ex.what());
        }

        {
            std::lock_guard lock(entry->mutex);
            entry->session.state = SessionState::Closed;
        }
        entry->chunk_settled.notify_all();
        store_->erase(session_id);
        if (!entry->chunks.destroy())
        {
            spdlog::warn("Failed to remove scratch directory {}", entry->chunks.directory().string());
        }

        spdlog::info("Upload finished: session={} name={} size={} sha256={}", session_id, artifact.final_name,
                     artifact.size_bytes, artifact.digest_hex);
        return artifact;
    }

    std::size_t UploadRegistry::reap_idle(std::chrono::seconds max_idle)
    {
        const auto now = std::chrono::system_clock::now();
        std::size_t reaped = 0;
        for (const auto &entry : store_->snapshot())
        {
            {
                std::lock_guard lock(entry->mutex);
                auto &session = entry->session;
                if (session.state != SessionState::Open || !entry->in_flight.empty() ||
                    now - session.last_activity <= max_idle)
                {
                    continue;
                }
                session.state = SessionState::Closed;
            }
            entry->chunk_settled.notify_all();
            store_->erase(entry->session.id);
            if (!entry->chunks.destroy())
            {
                spdlog::warn("Failed to remove scratch directory {}", entry->chunks.directory().string());
            }
            spdlog::info("Upload session expired: session={}", entry->session.id);
            ++reaped;
        }
        return reaped;
    }

    std::size_t UploadRegistry::session_count() const
    {
        return store_->size();
    }

    std::shared_ptr<SessionEntry> UploadRegistry::lookup(const std::string &tenant, const std::string &session_id) const
    {
        auto entry = store_->find(session_id);
        if (!entry || entry->session.tenant != tenant)
        {
            session_not_found(session_id);
        }
        return entry;
    }

    void UploadRegistry::reopen(SessionEntry &entry) const
    {
        {
            std::lock_guard lock(entry.mutex);
            entry.session.state = SessionState::Open;
            entry.session.last_activity = std::chrono::system_clock::now();
        }
        entry.chunk_settled.notify_all();
    }

    std::string UploadRegistry::generate_session_id() const
    {
        return crypto::random_hex(kSessionIdBytes);
    }

} // namespace chunkdrive::server
