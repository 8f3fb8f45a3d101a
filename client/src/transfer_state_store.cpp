#include "artistore/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

namespace artistore::client
{

    TransferStateStore::TransferStateStore()
        : TransferStateStore(default_state_path())
    {
    }

    TransferStateStore::TransferStateStore(std::filesystem::path state_path)
        : state_path_(std::move(state_path))
    {
        load();
    }

    std::vector<TransferStateStore::Entry> TransferStateStore::pending_for_identity(const std::string &identity) const
    {
        std::vector<Entry> result;
        for (const auto &entry : entries_)
        {
            if (entry.identity == identity)
            {
                result.push_back(entry);
            }
        }
        return result;
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find_upload(const std::string &identity,
                                                                            const std::string &artifact_id,
                                                                            const std::filesystem::path &local_path,
                                                                            std::uint64_t total_size,
                                                                            const std::string &sha256) const
    {
        const auto normalized = normalize_path(local_path);
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.identity == identity && entry.artifact_id == artifact_id &&
                                              entry.local_path == normalized && entry.total_size == total_size &&
                                              entry.sha256 == sha256; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void TransferStateStore::upsert_upload(const Entry &entry)
    {
        Entry normalized = entry;
        normalized.local_path = normalize_path(entry.local_path);
        // One session per local file and artifact.
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry &existing)
                                      { return existing.session_id == normalized.session_id ||
                                               (existing.identity == normalized.identity &&
                                                existing.artifact_id == normalized.artifact_id &&
                                                existing.local_path == normalized.local_path); }),
                       entries_.end());
        entries_.push_back(std::move(normalized));
        save();
    }

    void TransferStateStore::mark_chunk_acked(const std::string &session_id, std::uint64_t chunk_number)
    {
        auto it = find_session(session_id);
        if (it != entries_.end() && it->acked_chunks.insert(chunk_number).second)
        {
            save();
        }
    }

    void TransferStateStore::remove_session(const std::string &session_id)
    {
        auto it = find_session(session_id);
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    void TransferStateStore::discard_identity(const std::string &identity)
    {
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                      { return entry.identity == identity; }),
                       entries_.end());
        save();
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".artistore" / "transfers.json";
        }
        return std::filesystem::path(".artistore") / "transfers.json";
    }

    void TransferStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.identity = item.value("identity", std::string{});
            entry.artifact_id = item.value("artifact", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.total_size = item.value("total", 0ULL);
            entry.sha256 = item.value("sha256", std::string{});
            entry.session_id = item.value("session", std::string{});
            entry.chunk_size = item.value("chunk_size", 0ULL);
            entry.acked_chunks = item.value("acked", std::set<std::uint64_t>{});
            if (!entry.identity.empty() && !entry.session_id.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void TransferStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"identity", entry.identity},
                            {"artifact", entry.artifact_id},
                            {"local", entry.local_path.generic_string()},
                            {"total", entry.total_size},
                            {"sha256", entry.sha256},
                            {"session", entry.session_id},
                            {"chunk_size", entry.chunk_size},
                            {"acked", entry.acked_chunks}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (out.is_open())
        {
            out << json.dump(2);
        }
    }

    std::vector<TransferStateStore::Entry>::iterator TransferStateStore::find_session(const std::string &session_id)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.session_id == session_id; });
    }

    std::filesystem::path TransferStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace artistore::client
