#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

#include "artistore/result.hpp"

namespace artistore::server
{

    // Username -> libsodium password hash, kept in <root>/.artistore/users.json.
    class CredentialStore
    {
    public:
        explicit CredentialStore(std::filesystem::path root_directory);

        bool authenticate(const std::string &username, const std::string &password) const;

        Status register_user(const std::string &username, const std::string &password);

    private:
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, std::string> users_;
    };

} // namespace artistore::server
