#pragma once
#include "pairlink/identity/device_identity.hpp"

#include "pairing/rendezvous.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pairlink::codec::detail {

void ToProto(const identity::DeviceDescriptor& descriptor, proto::pairing::DeviceDescriptor* out);

[[nodiscard]] identity::DeviceDescriptor FromProto(const proto::pairing::DeviceDescriptor& descriptor);

[[nodiscard]] inline std::span<const uint8_t> AsBytes(const std::string& bytes) noexcept {
    return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
}

[[nodiscard]] inline std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

[[nodiscard]] inline std::vector<uint8_t> ToVector(const std::string& bytes) {
    return {bytes.begin(), bytes.end()};
}

template<typename Message>
[[nodiscard]] bool SerializeMessage(const Message& message, std::vector<uint8_t>& out) {
    out.resize(message.ByteSizeLong());
    return message.SerializeToArray(out.data(), static_cast<int>(out.size()));
}

}
