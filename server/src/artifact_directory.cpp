#include "artistore/server/artifact_directory.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace artistore::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".artistore";
        constexpr auto kArtifactsFile = "artifacts.json";
        constexpr std::size_t kMaxArtifactIdLength = 128;
    } // namespace

    bool is_valid_artifact_id(std::string_view artifact_id) noexcept
    {
        if (artifact_id.empty() || artifact_id.size() > kMaxArtifactIdLength || artifact_id == "." ||
            artifact_id == "..")
        {
            return false;
        }
        return std::all_of(artifact_id.begin(), artifact_id.end(), [](unsigned char ch)
                           { return std::isalnum(ch) != 0 || ch == '.' || ch == '_' || ch == '-'; });
    }

    FileArtifactDirectory::FileArtifactDirectory(std::filesystem::path root)
        : registry_path_(std::move(root) / kMetadataDir / kArtifactsFile)
    {
    }

    bool FileArtifactDirectory::exists(const std::string &artifact_id) const
    {
        if (!is_valid_artifact_id(artifact_id))
        {
            return false;
        }
        std::lock_guard lock(mutex_);
        refresh_locked();
        if (!loaded_at_)
        {
            return true;
        }
        return artifacts_.contains(artifact_id);
    }

    bool FileArtifactDirectory::open_mode() const
    {
        std::lock_guard lock(mutex_);
        refresh_locked();
        return !loaded_at_.has_value();
    }

    void FileArtifactDirectory::refresh_locked() const
    {
        std::error_code ec;
        const auto modified = std::filesystem::last_write_time(registry_path_, ec);
        if (ec)
        {
            loaded_at_.reset();
            artifacts_.clear();
            return;
        }
        if (loaded_at_ && *loaded_at_ == modified)
        {
            return;
        }

        std::ifstream in(registry_path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open artifact registry: " + registry_path_.string());
        }
        nlohmann::json json;
        in >> json;
        if (!json.is_array())
        {
            throw std::runtime_error("Artifact registry must be a JSON array: " + registry_path_.string());
        }
        artifacts_.clear();
        for (const auto &item : json)
        {
            artifacts_.insert(item.get<std::string>());
        }
        loaded_at_ = modified;
        spdlog::info("Loaded {} known artifacts", artifacts_.size());
    }

} // namespace artistore::server
