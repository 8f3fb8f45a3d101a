#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace artistore::server
{

    // 1-128 characters of [A-Za-z0-9._-], excluding "." and "..".
    bool is_valid_artifact_id(std::string_view artifact_id) noexcept;

    class ArtifactDirectory
    {
    public:
        virtual ~ArtifactDirectory() = default;

        virtual bool exists(const std::string &artifact_id) const = 0;
    };

    // Known artifacts come from <root>/.artistore/artifacts.json (a JSON array
    // of ids). Without that file every well-formed id is accepted.
    class FileArtifactDirectory : public ArtifactDirectory
    {
    public:
        explicit FileArtifactDirectory(std::filesystem::path root);

        bool exists(const std::string &artifact_id) const override;

        bool open_mode() const;

    private:
        void refresh_locked() const;

        std::filesystem::path registry_path_;

        mutable std::mutex mutex_;
        mutable std::optional<std::filesystem::file_time_type> loaded_at_;
        mutable std::unordered_set<std::string> artifacts_;
    };

} // namespace artistore::server
