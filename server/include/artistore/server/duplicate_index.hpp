#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "artistore/server/upload_session.hpp"

namespace artistore::server
{

    // Content-addressed index of finalized files keyed by strong digest.
    // Persisted to <root>/.artistore/files.json after every insert.
    class DuplicateIndex
    {
    public:
        explicit DuplicateIndex(std::filesystem::path root);

        std::optional<FinalizedFile> find(const std::string &strong_digest) const;

        // Ignores an indexed file that belongs to artifact_id.
        std::optional<FinalizedFile> find_excluding(const std::string &strong_digest,
                                                    const std::string &artifact_id) const;

        // Insert-if-absent. On insert the file gets the next version of its
        // artifact. Returns the indexed entry and whether this call created it.
        std::pair<FinalizedFile, bool> insert(FinalizedFile file);

        std::size_t size() const;

    private:
        void load_locked();
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, FinalizedFile> by_digest_;
        std::unordered_map<std::string, std::uint64_t> versions_;
    };

} // namespace artistore::server
