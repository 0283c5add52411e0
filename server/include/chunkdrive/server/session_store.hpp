#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkdrive/server/chunk_store.hpp"

namespace chunkdrive::server
{

    enum class SessionState : std::uint8_t
    {
        Open,
        Finalizing,
        Closed
    };

    struct UploadSession
    {
        std::string id;
        std::string tenant;
        std::set<std::uint64_t> received;
        std::optional<std::uint64_t> declared_total;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_activity{};
        SessionState state{SessionState::Open};
    };

    // One registry slot. `mutex` guards `session` and `in_flight`; the chunk
    // store itself is only touched for indices reserved in `in_flight` or
    // while the session is finalizing.
    struct SessionEntry
    {
        SessionEntry(UploadSession initial, ChunkStore store)
            : session(std::move(initial)), chunks(std::move(store)) {}

        std::mutex mutex;
        std::condition_variable chunk_settled;
        UploadSession session;
        std::set<std::uint64_t> in_flight;
        ChunkStore chunks;
    };

    // Keyed storage for live sessions. Implementations must allow concurrent
    // lookups; mutation of a session goes through its entry's own mutex.
    class SessionStore
    {
    public:
        virtual ~SessionStore() = default;

        // Returns false when the id is already taken.
        virtual bool insert(std::shared_ptr<SessionEntry> entry) = 0;

        virtual std::shared_ptr<SessionEntry> find(const std::string &id) const = 0;

        virtual void erase(const std::string &id) = 0;

        virtual std::vector<std::shared_ptr<SessionEntry>> snapshot() const = 0;

        virtual std::size_t size() const = 0;
    };

    class MemorySessionStore final : public SessionStore
    {
    public:
        bool insert(std::shared_ptr<SessionEntry> entry) override;
        std::shared_ptr<SessionEntry> find(const std::string &id) const override;
        void erase(const std::string &id) override;
        std::vector<std::shared_ptr<SessionEntry>> snapshot() const override;
        std::size_t size() const override;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions_;
    };

} // namespace chunkdrive::server
