#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "artistore/server/clock.hpp"

namespace artistore::testing
{

    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name)
            : path_(std::filesystem::temp_directory_path() / ("artistore_" + name))
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    // Settable wall clock shared by every copy handed to the code under test.
    class ManualClock
    {
    public:
        ManualClock() : state_(std::make_shared<State>()) {}

        server::TimePoint now() const
        {
            std::lock_guard lock(state_->mutex);
            return state_->now;
        }

        void advance(std::chrono::seconds by)
        {
            std::lock_guard lock(state_->mutex);
            state_->now += by;
        }

        server::Clock clock() const
        {
            auto state = state_;
            return [state]
            {
                std::lock_guard lock(state->mutex);
                return state->now;
            };
        }

    private:
        struct State
        {
            std::mutex mutex;
            server::TimePoint now{std::chrono::sys_days{std::chrono::year{2024} / 1 / 1}};
        };

        std::shared_ptr<State> state_;
    };

    // Deterministic bytes with no recognizable header and no text patterns.
    inline std::vector<std::byte> make_bytes(std::size_t size, std::uint8_t seed = 7)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::byte>((seed + i * 31) % 251);
        }
        return data;
    }

    inline std::span<const std::byte> slice(const std::vector<std::byte> &data, std::size_t offset, std::size_t length)
    {
        return std::span<const std::byte>(data).subspan(offset, length);
    }

    inline std::vector<std::byte> to_bytes(std::string_view text)
    {
        std::vector<std::byte> data(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            data[i] = static_cast<std::byte>(text[i]);
        }
        return data;
    }

} // namespace artistore::testing
