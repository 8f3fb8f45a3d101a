#include "artistore/server/duplicate_index.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace artistore::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".artistore";
        constexpr auto kIndexFile = "files.json";
    } // namespace

    DuplicateIndex::DuplicateIndex(std::filesystem::path root)
        : database_path_(std::move(root) / kMetadataDir / kIndexFile)
    {
        std::filesystem::create_directories(database_path_.parent_path());
        std::lock_guard lock(mutex_);
        load_locked();
    }

    std::optional<FinalizedFile> DuplicateIndex::find(const std::string &strong_digest) const
    {
        std::lock_guard lock(mutex_);
        auto it = by_digest_.find(strong_digest);
        if (it == by_digest_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<FinalizedFile> DuplicateIndex::find_excluding(const std::string &strong_digest,
                                                                const std::string &artifact_id) const
    {
        auto found = find(strong_digest);
        if (found && found->artifact_id == artifact_id)
        {
            return std::nullopt;
        }
        return found;
    }

    std::pair<FinalizedFile, bool> DuplicateIndex::insert(FinalizedFile file)
    {
        std::lock_guard lock(mutex_);
        if (auto it = by_digest_.find(file.strong_digest); it != by_digest_.end())
        {
            return {it->second, false};
        }
        file.version = ++versions_[file.artifact_id];
        auto [it, inserted] = by_digest_.emplace(file.strong_digest, std::move(file));
        persist_locked();
        spdlog::debug("Indexed file {} ({}) as version {} of artifact {}", it->second.file_id,
                      it->second.strong_digest, it->second.version, it->second.artifact_id);
        return {it->second, inserted};
    }

    std::size_t DuplicateIndex::size() const
    {
        std::lock_guard lock(mutex_);
        return by_digest_.size();
    }

    void DuplicateIndex::load_locked()
    {
        by_digest_.clear();
        versions_.clear();
        if (!std::filesystem::exists(database_path_))
        {
            return;
        }
        std::ifstream in(database_path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open duplicate index: " + database_path_.string());
        }
        nlohmann::json json;
        in >> json;
        for (const auto &item : json.value("files", nlohmann::json::array()))
        {
            auto file = finalized_file_from_json(item);
            by_digest_.emplace(file.strong_digest, std::move(file));
        }
        const auto versions = json.value("versions", nlohmann::json::object());
        for (const auto &[artifact, version] : versions.items())
        {
            versions_[artifact] = version.get<std::uint64_t>();
        }
        spdlog::info("Loaded {} indexed files", by_digest_.size());
    }

    void DuplicateIndex::persist_locked() const
    {
        nlohmann::json files = nlohmann::json::array();
        for (const auto &[digest, file] : by_digest_)
        {
            files.push_back(to_json(file));
        }
        nlohmann::json versions = nlohmann::json::object();
        for (const auto &[artifact, version] : versions_)
        {
            versions[artifact] = version;
        }
        const nlohmann::json json = {{"files", std::move(files)}, {"versions", std::move(versions)}};

        auto temp_path = database_path_;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                spdlog::error("Failed to write duplicate index {}", temp_path.string());
                throw std::runtime_error("Failed to write duplicate index: " + temp_path.string());
            }
            out << json.dump(2);
        }
        std::filesystem::rename(temp_path, database_path_);
    }

} // namespace artistore::server
