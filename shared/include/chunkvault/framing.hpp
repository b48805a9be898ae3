/**
 * ChunkVault - Length-prefixed JSON frames (4-byte big-endian size + UTF-8 JSON).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkvault::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Upper bound on a single frame; a 2 MiB chunk grows by a third once base64 encoded.
    inline constexpr std::uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::uint32_t read_frame_size(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // nullopt while the buffer holds less than one complete frame.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace chunkvault::protocol
