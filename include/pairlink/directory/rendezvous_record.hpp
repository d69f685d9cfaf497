#pragma once
#include "pairlink/core/constants.hpp"
#include "pairlink/identity/device_identity.hpp"
#include "pairlink/interfaces/i_clock.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pairlink::directory {

using DirectoryKey = std::array<uint8_t, kSha256Bytes>;

/// "I am reachable, here is how": what an issuer publishes for its code.
struct RendezvousRecord {
    std::vector<uint8_t> session_token_hash;
    std::string publisher_identifier;
    std::vector<uint8_t> publisher_public_key;
    std::string publisher_display_name;
    std::vector<std::string> reachable_addresses;
    std::vector<uint8_t> session_public_key;
    identity::DeviceDescriptor device;
    interfaces::TimePoint created_at;
    std::chrono::seconds ttl{0};

    [[nodiscard]] interfaces::TimePoint ExpiresAt() const noexcept {
        return created_at + ttl;
    }

    [[nodiscard]] bool IsLive(const interfaces::TimePoint now) const noexcept {
        return now <= ExpiresAt();
    }
};

}
