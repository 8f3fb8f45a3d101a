#include "artistore/server/credential_store.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "artistore/crypto.hpp"

namespace artistore::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".artistore";
        constexpr auto kUsersFile = "users.json";
        constexpr std::size_t kMinPasswordLength = 8;
    } // namespace

    CredentialStore::CredentialStore(std::filesystem::path root_directory)
        : database_path_(std::move(root_directory) / kMetadataDir / kUsersFile)
    {
        std::filesystem::create_directories(database_path_.parent_path());
    }

    bool CredentialStore::authenticate(const std::string &username, const std::string &password) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = users_.find(username);
        if (it == users_.end())
        {
            return false;
        }
        return crypto::verify_password(password, it->second);
    }

    Status CredentialStore::register_user(const std::string &username, const std::string &password)
    {
        if (username.empty())
        {
            return make_error(ErrorCode::InvalidParameters, "Username is required");
        }
        if (password.size() < kMinPasswordLength)
        {
            return make_error(ErrorCode::InvalidParameters,
                              "Password must be at least " + std::to_string(kMinPasswordLength) + " characters");
        }
        std::lock_guard lock(mutex_);
        load_locked();
        if (users_.contains(username))
        {
            return make_error(ErrorCode::InvalidState, "User already exists");
        }
        users_.emplace(username, crypto::hash_password(password));
        persist_locked();
        spdlog::info("Registered user {}", username);
        return {};
    }

    void CredentialStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        users_.clear();
        if (std::filesystem::exists(database_path_))
        {
            std::ifstream in(database_path_);
            if (!in.is_open())
            {
                throw std::runtime_error("Failed to open credential store: " + database_path_.string());
            }
            nlohmann::json json;
            in >> json;
            if (json.is_object())
            {
                for (const auto &[key, value] : json.items())
                {
                    users_[key] = value.get<std::string>();
                }
            }
        }
        loaded_ = true;
    }

    void CredentialStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[user, hash] : users_)
        {
            json[user] = hash;
        }
        std::ofstream out(database_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Failed to write credential store: " + database_path_.string());
        }
        out << json.dump(2);
    }

} // namespace artistore::server
