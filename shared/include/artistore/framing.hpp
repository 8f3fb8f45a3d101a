/**
 * artistore - Length-prefixed JSON framing helpers.
 *
 * A frame is a 4-byte big-endian payload length followed by the UTF-8 JSON
 * text. Chunk bytes ride inside the JSON as base64, so frames can reach the
 * chunk size limit plus encoding overhead.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace artistore::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    class FrameTooLarge : public std::length_error
    {
    public:
        FrameTooLarge(std::size_t size, std::size_t limit);

        std::size_t size() const noexcept { return size_; }

    private:
        std::size_t size_;
    };

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header);

    // Returns std::nullopt until the buffer holds a complete frame. Throws
    // FrameTooLarge as soon as the header announces more than max_payload bytes.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload);

} // namespace artistore::protocol
