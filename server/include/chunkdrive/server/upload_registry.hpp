#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chunkdrive/server/finalizer.hpp"
#include "chunkdrive/server/session_store.hpp"

namespace chunkdrive::server
{

    struct UploadStatus
    {
        std::string session_id;
        std::vector<std::uint64_t> received;
        std::chrono::system_clock::time_point created_at{};
        std::optional<std::uint64_t> declared_total;
        bool finalizing{};
    };

    struct ChunkReceipt
    {
        std::uint64_t index{};
        std::uint64_t size{};
        bool duplicate{};
    };

    // Upper bound on chunk indices and declared totals.
    inline constexpr std::uint64_t kMaxChunkCount = 1ULL << 20;

    // Tracks in-progress chunked uploads. All operations are safe to call
    // concurrently; calls for different sessions never wait on each other.
    // Every failure is reported as UploadError.
    class UploadRegistry
    {
    public:
        UploadRegistry(std::filesystem::path scratch_root, std::size_t max_chunk_size,
                       std::unique_ptr<SessionStore> store = std::make_unique<MemorySessionStore>());

        std::string init_upload(const std::string &tenant);

        // Replaying an index that was already accepted is a no-op that reports
        // `duplicate`; the stored chunk is left untouched.
        ChunkReceipt put_chunk(const std::string &tenant, const std::string &session_id, std::uint64_t index,
                               std::span<const std::byte> data);

        UploadStatus query_status(const std::string &tenant, const std::string &session_id) const;

        // Succeeds only when exactly {0 .. declared_total-1} was received. The
        // session is removed after the artifact is published and kept intact
        // for a retry when the merge fails.
        FinalizedArtifact finish_upload(const std::string &tenant, const std::string &session_id,
                                        const std::string &display_name, std::uint64_t declared_total,
                                        const Finalizer &finalizer);

        // Abandons open sessions without activity for longer than `max_idle`.
        std::size_t reap_idle(std::chrono::seconds max_idle);

        std::size_t session_count() const;

        std::size_t max_chunk_size() const noexcept { return max_chunk_size_; }

    private:
        std::shared_ptr<SessionEntry> lookup(const std::string &tenant, const std::string &session_id) const;
        void reopen(SessionEntry &entry) const;
        std::string generate_session_id() const;

        std::filesystem::path scratch_root_;
        std::size_t max_chunk_size_;
        std::unique_ptr<SessionStore> store_;
    };

} // namespace chunkdrive::server
