#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>

namespace artistore::server
{

    struct StoredObject
    {
        std::string file_id;
        std::string artifact_id;
        std::string filename;
        std::uint64_t size_bytes{};
        std::string strong_digest;
    };

    // Final resting place for assembled bytes. store() returns the durable
    // location recorded as the file's download location.
    class StorageSink
    {
    public:
        virtual ~StorageSink() = default;

        virtual std::string store(std::istream &input, const StoredObject &object) = 0;

        virtual void discard(const std::string &location) = 0;
    };

    // Writes objects under <root>/objects/<artifact>/<file id><extension>.
    class LocalStorageSink : public StorageSink
    {
    public:
        explicit LocalStorageSink(std::filesystem::path root);

        std::string store(std::istream &input, const StoredObject &object) override;

        void discard(const std::string &location) override;

    private:
        std::filesystem::path objects_root_;
    };

} // namespace artistore::server
