#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace artistore::client
{

    // Remembers open upload sessions across client restarts so an interrupted
    // upload resumes by sending only the chunks the server has not acknowledged.
    class TransferStateStore
    {
    public:
        struct Entry
        {
            std::string identity;
            std::string artifact_id;
            std::filesystem::path local_path;
            std::uint64_t total_size{};
            std::string sha256;
            std::string session_id;
            std::uint64_t chunk_size{};
            std::set<std::uint64_t> acked_chunks;
        };

        TransferStateStore();
        explicit TransferStateStore(std::filesystem::path state_path);

        std::vector<Entry> pending_for_identity(const std::string &identity) const;

        // Matches only when the local file still has the recorded size and digest.
        std::optional<Entry> find_upload(const std::string &identity, const std::string &artifact_id,
                                         const std::filesystem::path &local_path, std::uint64_t total_size,
                                         const std::string &sha256) const;

        void upsert_upload(const Entry &entry);

        void mark_chunk_acked(const std::string &session_id, std::uint64_t chunk_number);

        void remove_session(const std::string &session_id);

        void discard_identity(const std::string &identity);

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;
        std::vector<Entry>::iterator find_session(const std::string &session_id);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace artistore::client
