#include "chunkdrive/server/session_store.hpp"

namespace chunkdrive::server
{

    bool MemorySessionStore::insert(std::shared_ptr<SessionEntry> entry)
    {
        std::unique_lock lock(mutex_);
        const auto id = entry->session.id;
        return sessions_.emplace(id, std::move(entry)).second;
    }

    std::shared_ptr<SessionEntry> MemorySessionStore::find(const std::string &id) const
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    void MemorySessionStore::erase(const std::string &id)
    {
        std::unique_lock lock(mutex_);
        sessions_.erase(id);
    }

    std::vector<std::shared_ptr<SessionEntry>> MemorySessionStore::snapshot() const
    {
        std::shared_lock lock(mutex_);
        std::vector<std::shared_ptr<SessionEntry>> entries;
        entries.reserve(sessions_.size());
        for (const auto &[id, entry] : sessions_)
        {
            entries.push_back(entry);
        }
        return entries;
    }

    std::size_t MemorySessionStore::size() const
    {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

} // namespace chunkdrive::server
