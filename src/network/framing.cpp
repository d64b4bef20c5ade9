#include "network/framing.hpp"

#include <format>
#include <stdexcept>

namespace memkv::network {

std::array<std::uint8_t, frame::kHeaderSize>
encode_frame_header(std::uint32_t payload_length) noexcept {
    return {
        static_cast<std::uint8_t>(payload_length & 0xFF),
        static_cast<std::uint8_t>((payload_length >> 8) & 0xFF),
        static_cast<std::uint8_t>((payload_length >> 16) & 0xFF),
        static_cast<std::uint8_t>((payload_length >> 24) & 0xFF),
    };
}

std::string encode_frame(std::string_view payload) {
    if (payload.size() > frame::kMaxPayloadSize) {
        throw std::length_error(std::format(
            "frame payload of {} bytes exceeds the {} byte limit",
            payload.size(), frame::kMaxPayloadSize));
    }
    const auto header = encode_frame_header(static_cast<std::uint32_t>(payload.size()));

    std::string wire;
    wire.reserve(frame::kHeaderSize + payload.size());
    wire.append(reinterpret_cast<const char*>(header.data()), header.size());
    wire.append(payload);
    return wire;
}

bool decode_frame_header(std::span<const std::uint8_t> data,
                         std::uint32_t& payload_length_out) noexcept {
    if (data.size() < frame::kHeaderSize) {
        return false;
    }
    payload_length_out =
         static_cast<std::uint32_t>(data[0]) |
        (static_cast<std::uint32_t>(data[1]) << 8) |
        (static_cast<std::uint32_t>(data[2]) << 16) |
        (static_cast<std::uint32_t>(data[3]) << 24);
    return true;
}

} // namespace memkv::network
