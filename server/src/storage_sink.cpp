#include "artistore/server/storage_sink.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace artistore::server
{

    namespace
    {
        constexpr auto kObjectsDir = "objects";
        constexpr std::size_t kMaxExtensionLength = 16;
        constexpr std::size_t kCopyBufferSize = 1 << 20;

        std::string safe_extension(const std::string &filename)
        {
            auto extension = std::filesystem::path(filename).extension().string();
            if (extension.size() < 2 || extension.size() > kMaxExtensionLength)
            {
                return {};
            }
            const bool clean = std::all_of(extension.begin() + 1, extension.end(), [](unsigned char ch)
                                           { return std::isalnum(ch) != 0; });
            if (!clean)
            {
                return {};
            }
            std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return extension;
        }
    } // namespace

    LocalStorageSink::LocalStorageSink(std::filesystem::path root)
        : objects_root_(std::move(root) / kObjectsDir)
    {
        std::filesystem::create_directories(objects_root_);
    }

    std::string LocalStorageSink::store(std::istream &input, const StoredObject &object)
    {
        const auto directory = objects_root_ / object.artifact_id;
        std::filesystem::create_directories(directory);
        const auto final_path = directory / (object.file_id + safe_extension(object.filename));
        auto temp_path = final_path;
        temp_path += ".tmp";

        std::uint64_t written = 0;
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open object file: " + temp_path.string());
            }
            std::vector<char> buffer(kCopyBufferSize);
            while (input)
            {
                input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = input.gcount();
                if (count > 0)
                {
                    out.write(buffer.data(), count);
                    written += static_cast<std::uint64_t>(count);
                }
            }
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Failed to write object file: " + temp_path.string());
            }
        }
        if (written != object.size_bytes)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw std::runtime_error("Stored " + std::to_string(written) + " bytes for " + object.file_id +
                                     ", expected " + std::to_string(object.size_bytes));
        }
        std::filesystem::rename(temp_path, final_path);
        spdlog::debug("Stored object {} ({} bytes) at {}", object.file_id, written, final_path.string());
        return final_path.generic_string();
    }

    void LocalStorageSink::discard(const std::string &location)
    {
        std::error_code ec;
        std::filesystem::remove(std::filesystem::path(location), ec);
        if (ec)
        {
            spdlog::error("Failed to discard object {}: {}", location, ec.message());
        }
    }

} // namespace artistore::server
