#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>

namespace memkv::network {

// ── Response framing ──────────────────────────────────────────────────────────
//
// Every response is sent as
//   [payload_length: u32 LE][payload: payload_length bytes]
// with no delimiter or trailing newline.

namespace frame {

// Size of the length prefix.
inline constexpr std::size_t kHeaderSize = 4;

// Largest payload the length prefix can describe.
inline constexpr std::size_t kMaxPayloadSize = std::numeric_limits<std::uint32_t>::max();

} // namespace frame

// Build a wire-ready frame (header + payload).
// Throws std::length_error if the payload is longer than
// frame::kMaxPayloadSize; the protocol rejects values that could produce one.
[[nodiscard]] std::string encode_frame(std::string_view payload);

// Encode just the length prefix.
[[nodiscard]] std::array<std::uint8_t, frame::kHeaderSize>
encode_frame_header(std::uint32_t payload_length) noexcept;

// Decode the payload length from a frame header.
// Returns false if `data` is smaller than frame::kHeaderSize.
[[nodiscard]] bool decode_frame_header(std::span<const std::uint8_t> data,
                                       std::uint32_t& payload_length_out) noexcept;

} // namespace memkv::network
